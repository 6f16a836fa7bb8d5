#pragma once

/** @file  SystemCoordinator.hpp
 *  @brief Public API for cubecycle::core::SystemCoordinator.
 *
 *  © 2025 CubeCycle contributors — MIT-licensed.
 */

#include <istream>
#include <memory>
#include <ostream>
#include <string>

#include "core/ConfigStore.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/RuntimeSettings.hpp"
#include "core/TransferLoop.hpp"
#include "io/FileLogger.hpp"
#include "io/TransferAdapter.hpp"

namespace cubecycle {
  namespace core {

    /**
 * @class SystemCoordinator
 * @brief Top-level run FSM: BOOT → INIT → (SETUP →) IDLE → RUNNING.
 *
 *  * `initialize()` loads the saved sides or runs the setup wizard.
 *  * `run()` hands control to the TransferLoop and never returns.
 *  * ERROR is entered when setup ends without a result.
 */
    class SystemCoordinator {

    public:
      enum class State { BOOT, INIT, SETUP, IDLE, RUNNING, ERROR };

      SystemCoordinator(RuntimeSettings settings, io::TransferAdapter& adapter,
                        std::istream& input, std::ostream& console, Sleeper sleeper,
                        std::shared_ptr<ErrorMonitor> errorMonitor = nullptr,
                        io::FileLogger* journal = nullptr);
      ~SystemCoordinator() = default;

      /// @param forceSetup  ignore the saved configuration and run the wizard.
      /// @returns false if no usable configuration could be obtained.
      bool initialize(bool forceSetup = false);

      [[noreturn]] void run(); ///< Transfer loop; throws std::logic_error if not IDLE

      void handleError(const std::string& reason);

      State state() const { return currentState_; }
      const Configuration& configuration() const { return config_; }

    private:
      void transitionTo(State next);

      RuntimeSettings settings_;
      io::TransferAdapter& adapter_;
      std::istream& input_;
      std::ostream& console_;
      Sleeper sleeper_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      io::FileLogger* journal_;

      ConfigStore store_;
      Configuration config_{};
      State currentState_{ State::BOOT };
    };

    const char* toString(SystemCoordinator::State s);

  } // namespace core
} // namespace cubecycle
