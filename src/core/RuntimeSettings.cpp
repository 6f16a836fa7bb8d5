/* @file RuntimeSettings.cpp
 * @brief schema checks for the JSON settings
 *
 * © 2025 CubeCycle contributors — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// third-party headers
#include <nlohmann/json.hpp>

// CubeCycle headers
#include "core/RuntimeSettings.hpp"

using namespace cubecycle::core;
using nlohmann::json;

namespace {

  [[noreturn]] void badKey(const std::string& key, const std::string& why) {
    throw std::invalid_argument("[RuntimeSettings] '" + key + "' " + why);
  }

  void readString(const json& j, const char* key, std::string& out, bool allowEmpty) {
    auto it = j.find(key);
    if (it == j.end())
      return;
    if (!it->is_string())
      badKey(key, "must be a string");
    auto value = it->get<std::string>();
    if (!allowEmpty && value.empty())
      badKey(key, "must not be empty");
    out = std::move(value);
  }

  void readInt(const json& j, const char* key, int& out, int minimum) {
    auto it = j.find(key);
    if (it == j.end())
      return;
    if (!it->is_number_integer())
      badKey(key, "must be an integer");
    auto value = it->get<long long>();
    if (value < minimum)
      badKey(key, "must be >= " + std::to_string(minimum));
    if (value > 1000000000LL)
      badKey(key, "is out of range");
    out = static_cast<int>(value);
  }

  void readSeconds(const json& j, const char* key, std::chrono::seconds& out) {
    int value = static_cast<int>(out.count());
    readInt(j, key, value, 0);
    out = std::chrono::seconds{ value };
  }

} // namespace

RuntimeSettings RuntimeSettings::fromJson(const json& j) {
  if (!j.is_object())
    throw std::invalid_argument("[RuntimeSettings] settings must be a JSON object");

  RuntimeSettings s;
  readString(j, "configFile", s.configFile, false);
  readString(j, "device", s.device, false);
  readString(j, "journal", s.journal, true);

  readInt(j, "baud", s.baud, 1);
  s.baudConstant(); // throws on unsupported rates

  int timeoutMs = static_cast<int>(s.responseTimeout.count());
  readInt(j, "responseTimeoutMs", timeoutMs, 1);
  s.responseTimeout = std::chrono::milliseconds{ timeoutMs };

  std::string tracked = s.trackedItem.name;
  readString(j, "trackedItem", tracked, false);
  try {
    s.trackedItem = TrackedItemProfile::byName(tracked);
  } catch (const std::invalid_argument&) {
    badKey("trackedItem", "must be \"energy_cube\" or \"battery_upgrade\"");
  }

  readInt(j, "referenceSlot", s.referenceSlot, 1);
  readSeconds(j, "settleSeconds", s.limits.settleInterval);
  readSeconds(j, "pollSeconds", s.limits.pollInterval);
  readSeconds(j, "cooldownSeconds", s.limits.cooldownInterval);
  readInt(j, "remediationThreshold", s.limits.remediationThreshold, 1);
  readInt(j, "cooldownThreshold", s.limits.cooldownThreshold, 1);
  return s;
}

speed_t RuntimeSettings::baudConstant() const {
  switch (baud) {
  case 9600:
    return B9600;
  case 19200:
    return B19200;
  case 38400:
    return B38400;
  case 57600:
    return B57600;
  case 115200:
    return B115200;
  default:
    badKey("baud", "must be one of 9600, 19200, 38400, 57600, 115200");
  }
}
