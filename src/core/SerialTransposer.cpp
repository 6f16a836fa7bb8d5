/* @file SerialTransposer.cpp
 * @brief request/response link to the transposer bridge over serial
 *
 * © 2025 CubeCycle contributors — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <stdexcept>
#include <string>

// third-party headers
#include <nlohmann/json.hpp>

// CubeCycle headers
#include "core/SerialTransposer.hpp"
#include "protocols/Command.hpp"
#include "protocols/Response.hpp"

using namespace cubecycle::core;
using cubecycle::io::ConnectionPoint;
using cubecycle::io::ItemDescriptor;
using nlohmann::json;

SerialTransposer::SerialTransposer(std::unique_ptr<io::SerialChannel> channel,
                                   std::shared_ptr<ErrorMonitor> errorMonitor,
                                   std::chrono::milliseconds responseTimeout)
    : channel_(std::move(channel)), errorMonitor_(std::move(errorMonitor)),
      timeout_(responseTimeout) {
  if (!channel_)
    throw std::invalid_argument("[SerialTransposer] serial channel is nullptr");
  if (!errorMonitor_)
    throw std::invalid_argument("[SerialTransposer] error monitor is nullptr");
  if (timeout_.count() <= 0)
    throw std::invalid_argument("[SerialTransposer] response timeout must be positive");
}

void SerialTransposer::connect(const std::string& device, speed_t baud) {
  if (connected_)
    return;

  if (!channel_->open(device, baud))
    fail("[SerialTransposer] serial device: " + device + " open failed");

  std::cerr << "[SerialTransposer] connected to " << device << "\n";
  device_ = device;
  baud_ = baud;
  connected_ = true;
}

void SerialTransposer::reopenIfClosed() {
  if (channel_->isOpen())
    return;

  std::cerr << "[SerialTransposer] link to " << device_ << " lost, reopening\n";
  if (!channel_->open(device_, baud_))
    fail("[SerialTransposer] serial device: " + device_ + " reopen failed");
}

std::optional<int> SerialTransposer::inventorySize(ConnectionPoint point) {
  json result = call("inventorySize", json::array({ io::toKey(point) }));
  if (result.is_null())
    return std::nullopt;
  if (!result.is_number_integer())
    fail("[SerialTransposer] inventorySize: expected integer result, got " + result.dump());
  return result.get<int>();
}

std::optional<std::string> SerialTransposer::inventoryName(ConnectionPoint point) {
  json result = call("inventoryName", json::array({ io::toKey(point) }));
  if (result.is_null())
    return std::nullopt;
  if (!result.is_string())
    fail("[SerialTransposer] inventoryName: expected string result, got " + result.dump());
  return result.get<std::string>();
}

std::optional<ItemDescriptor> SerialTransposer::itemInSlot(ConnectionPoint point, int slot) {
  json result = call("stackInSlot", json::array({ io::toKey(point), slot }));
  if (result.is_null())
    return std::nullopt;

  auto name = result.find("name"); // end() for non-objects
  if (!result.is_object() || name == result.end() || !name->is_string())
    fail("[SerialTransposer] stackInSlot: malformed stack " + result.dump());

  ItemDescriptor item;
  item.internalId = name->get<std::string>();
  if (auto label = result.find("label"); label != result.end() && label->is_string())
    item.displayLabel = label->get<std::string>();
  return item;
}

int SerialTransposer::transferUnits(ConnectionPoint from, ConnectionPoint to, int count) {
  json result = call("transferItem", json::array({ io::toKey(from), io::toKey(to), count }));
  if (!result.is_number_integer() || result.get<int>() < 0)
    fail("[SerialTransposer] transferItem: expected unit count, got " + result.dump());
  return result.get<int>();
}

// -------------------------------------------------------------------
// SerialTransposer::call
// Write one command, then read lines until the matching reply arrives or
// the response timeout runs out.
// -------------------------------------------------------------------
json SerialTransposer::call(const std::string& op, json args) {
  if (!connected_)
    throw std::runtime_error("[SerialTransposer] not connected");
  reopenIfClosed();

  protocols::Command cmd{ nextId_++, op, std::move(args) };
  if (!channel_->writeLine(cmd.toWire()))
    fail("[SerialTransposer] failed to write " + op + " to serial device");

  const auto deadline = std::chrono::steady_clock::now() + timeout_;
  for (;;) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0)
      fail("[SerialTransposer] timeout waiting for " + op + " reply");

    auto line = channel_->readLine(left);
    if (!line)
      fail("[SerialTransposer] no reply to " + op);

    auto response = protocols::Response::fromWire(*line);
    if (!response)
      fail("[SerialTransposer] malformed reply to " + op + ": " + *line);

    if (response->id != cmd.id) {
      std::cerr << "[SerialTransposer] dropping stale reply id " << response->id << " (waiting for "
                << cmd.id << ")\n";
      continue;
    }

    if (!response->ok)
      fail("[SerialTransposer] " + op + " rejected: " + response->error);

    return response->result;
  }
}

void SerialTransposer::fail(const std::string& message) {
  errorMonitor_->notifyFailure(message);
  throw std::runtime_error(message);
}
