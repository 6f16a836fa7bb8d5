/* @file ConfigStore.cpp
 * @brief key=value persistence of the side assignment
 *
 * © 2025 CubeCycle contributors — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstdio> // std::rename, std::remove
#include <cstring> // for strerror
#include <fstream>
#include <iostream>

// CubeCycle headers
#include "core/ConfigStore.hpp"

using namespace cubecycle::core;
using cubecycle::io::ConnectionPoint;

namespace {

  // "key=value" -> value, only if the key matches exactly
  std::optional<std::string> valueFor(const std::string& line, const char* key) {
    auto pos = line.find('=');
    if (pos == std::string::npos || line.compare(0, pos, key) != 0)
      return std::nullopt;
    std::string value = line.substr(pos + 1);
    if (!value.empty() && value.back() == '\r')
      value.pop_back();
    if (value.empty())
      return std::nullopt;
    return value;
  }

  std::optional<ConnectionPoint> parsePoint(const std::string& text) {
    try {
      std::size_t used = 0;
      int key = std::stoi(text, &used);
      if (used != text.size())
        return std::nullopt;
      return cubecycle::io::fromKey(key);
    } catch (const std::exception&) { // invalid_argument / out_of_range
      return std::nullopt;
    }
  }

} // namespace

ConfigStore::ConfigStore(std::string path) : path_(std::move(path)) {}

std::pair<Configuration, bool> ConfigStore::load() const {
  Configuration cfg;

  std::ifstream in(path_);
  if (!in)
    return { cfg, false };

  std::string sourceLine, sinkLine, completeLine;
  if (!std::getline(in, sourceLine) || !std::getline(in, sinkLine) ||
      !std::getline(in, completeLine)) {
    std::cerr << "[ConfigStore] " << path_ << " truncated, ignoring\n";
    return { cfg, false };
  }

  auto sourceText = valueFor(sourceLine, kSourceKey);
  auto sinkText = valueFor(sinkLine, kSinkKey);
  auto completeText = valueFor(completeLine, kCompleteKey);
  if (!sourceText || !sinkText || !completeText) {
    std::cerr << "[ConfigStore] " << path_ << " malformed, ignoring\n";
    return { cfg, false };
  }

  auto source = parsePoint(*sourceText);
  auto sink = parsePoint(*sinkText);
  if (!source || !sink) {
    std::cerr << "[ConfigStore] " << path_ << " holds an invalid side key, ignoring\n";
    return { cfg, false };
  }

  cfg.source = source;
  cfg.sink = sink;
  cfg.setupComplete = (*completeText == "true");

  if (cfg.setupComplete && !cfg.isValid()) {
    std::cerr << "[ConfigStore] " << path_ << " assigns charger and cube to the same side\n";
    return { Configuration{}, false };
  }
  return { cfg, true };
}

bool ConfigStore::save(const Configuration& cfg) const {
  if (!cfg.isValid()) {
    std::cerr << "[ConfigStore] refusing to save incomplete configuration\n";
    return false;
  }

  const std::string tmpPath = path_ + ".tmp";
  {
    std::ofstream out(tmpPath, std::ios::trunc);
    if (!out) {
      std::cerr << "[ConfigStore] cannot open " << tmpPath << " for writing: " << strerror(errno)
                << "\n";
      return false;
    }
    out << kSourceKey << '=' << io::toKey(*cfg.source) << '\n';
    out << kSinkKey << '=' << io::toKey(*cfg.sink) << '\n';
    out << kCompleteKey << '=' << (cfg.setupComplete ? "true" : "false") << '\n';
    out.flush();
    if (!out) {
      std::cerr << "[ConfigStore] write to " << tmpPath << " failed\n";
      out.close();
      std::remove(tmpPath.c_str());
      return false;
    }
  }

  if (std::rename(tmpPath.c_str(), path_.c_str()) != 0) {
    std::cerr << "[ConfigStore] rename to " << path_ << " failed: " << strerror(errno) << "\n";
    std::remove(tmpPath.c_str());
    return false;
  }
  return true;
}
