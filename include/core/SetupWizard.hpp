#pragma once
/** @file  SetupWizard.hpp
 *  @brief Interactive first-time detection of charger and stationary cube.
 *
 *  © 2025 CubeCycle contributors — MIT-licensed.
 */

// STL headers
#include <istream>
#include <optional>
#include <ostream>

// CubeCycle headers
#include "core/ConfigStore.hpp"
#include "core/DeviceClassifier.hpp"
#include "core/DeviceScanner.hpp"

namespace cubecycle {
  namespace core {

    /**
 * @class SetupWizard
 * @brief Two-state FSM: AwaitingConfirmation → Resolved.
 *
 *  * Blocks on one line of \p input per attempt (no timeout, no attempt limit).
 *  * End of input is the only way out without a result.
 *  * On success the configuration is persisted through the ConfigStore.
 */
    class SetupWizard {
    public:
      enum class State { AwaitingConfirmation, Resolved };

      SetupWizard(DeviceScanner& scanner, DeviceClassifier classifier, const ConfigStore& store,
                  std::istream& input, std::ostream& console);

      /// @returns the resolved configuration, or nullopt if input closed first.
      std::optional<Configuration> run();

      State state() const { return state_; }
      int attempts() const { return attempts_; }

      /// Operator steps for configuring the cube; shared with the loop's reminders.
      static void printInstructions(std::ostream& out);

    private:
      bool waitForConfirmation();
      void reportIncomplete(const ScanResult& scan, const RoleAssignment& roles);

      DeviceScanner& scanner_;
      DeviceClassifier classifier_;
      const ConfigStore& store_;
      std::istream& input_;
      std::ostream& console_;

      State state_{ State::AwaitingConfirmation };
      int attempts_{ 0 };
    };

  } // namespace core
} // namespace cubecycle
