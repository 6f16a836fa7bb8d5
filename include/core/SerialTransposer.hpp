#pragma once
/** @file  SerialTransposer.hpp
 *  @brief TransferAdapter that talks JSON request/response lines to the bridge.
 *
 *  © 2025 CubeCycle contributors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

// third-party headers
#include <nlohmann/json_fwd.hpp>

// CubeCycle headers
#include "core/ErrorMonitor.hpp"  // SerialTransposer is a client to the error monitor
#include "io/SerialChannel.hpp"   // owns the channel, needs full type knowledge
#include "io/TransferAdapter.hpp" // implemented interface

namespace cubecycle {
  namespace core {

    /**
 * @class SerialTransposer
 * @brief Synchronous RPC over one SerialChannel.
 *
 *  * One request in flight; replies carrying another id are dropped as stale.
 *  * A channel closed by a hang-up is reopened with the `connect()` device
 *    and baud before the next request.
 *  * Every failure (write, timeout, malformed or rejected reply) is reported
 *    to the ErrorMonitor and thrown as `std::runtime_error`.
 */
    class SerialTransposer : public io::TransferAdapter {
    public:
      SerialTransposer(std::unique_ptr<io::SerialChannel> channel,
                       std::shared_ptr<ErrorMonitor> errMonitor,
                       std::chrono::milliseconds responseTimeout = std::chrono::milliseconds{ 2000 });
      ~SerialTransposer() override = default;

      //---public APIs------------------------------------------------------
      void connect(const std::string& device, speed_t baud); ///<- opens the channel or throws
      bool connected() const { return connected_; }

      std::optional<int> inventorySize(io::ConnectionPoint point) override;
      std::optional<std::string> inventoryName(io::ConnectionPoint point) override;
      std::optional<io::ItemDescriptor> itemInSlot(io::ConnectionPoint point, int slot) override;
      int transferUnits(io::ConnectionPoint from, io::ConnectionPoint to, int count) override;

    private:
      nlohmann::json call(const std::string& op, nlohmann::json args);
      void reopenIfClosed();
      [[noreturn]] void fail(const std::string& message);

      std::unique_ptr<io::SerialChannel> channel_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::chrono::milliseconds timeout_;
      std::string device_;
      speed_t baud_{ B115200 };
      std::uint32_t nextId_{ 1 };
      bool connected_{ false };
    };

  } // namespace core
} // namespace cubecycle
