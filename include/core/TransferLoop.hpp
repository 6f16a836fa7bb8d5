#pragma once
/** @file  TransferLoop.hpp
 *  @brief Charger → cube → charger discharge cycle, forever.
 *
 *  © 2025 CubeCycle contributors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>

// CubeCycle headers
#include "core/ConfigStore.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/FailurePolicy.hpp"
#include "core/ItemClassifier.hpp"
#include "io/FileLogger.hpp"
#include "io/TransferAdapter.hpp"

namespace cubecycle {
  namespace core {

    /// Blocking sleep primitive; injected so tests do not wait on real time.
    using Sleeper = std::function<void(std::chrono::seconds)>;

    /// Sleeper backed by std::this_thread::sleep_for.
    Sleeper realTimeSleeper();

    /// Everything one cycle observed and decided.
    struct CycleReport {
      std::uint64_t cycle{ 0 };
      TransferOutcome outcome{ TransferOutcome::EmptyOrEligible };
      bool moved{ false };  ///< the item reached the sink this cycle
      bool benign{ false }; ///< zero-unit move excused by an earlier success
      bool remediated{ false };
      bool cooledDown{ false };
      FailureState state{}; ///< state after the cycle
      std::chrono::seconds wait{ 0 };
    };

    /**
 * @class TransferLoop
 * @brief Polls the charger's reference slot and runs one discharge round trip
 *        per cycle.
 *
 *  * `runCycle()` never throws for adapter faults; they become
 *    TransferFailed / RetrieveFailed and are reported to the ErrorMonitor.
 *  * `run()` has no exit; the process is stopped externally.
 *  * Operator text goes to the console stream, one CSV line per cycle to the
 *    optional journal.
 */
    class TransferLoop {
    public:
      TransferLoop(io::TransferAdapter& adapter, const Configuration& config,
                   ItemClassifier classifier, FailurePolicy policy, std::ostream& console,
                   Sleeper sleeper, std::shared_ptr<ErrorMonitor> errorMonitor = nullptr,
                   io::FileLogger* journal = nullptr, int referenceSlot = 1);

      /// Banner with the configured sides.
      void printHeader();

      /// One cycle including the settle pause, excluding the end-of-cycle wait.
      CycleReport runCycle();

      /// Cycle + wait, forever.
      [[noreturn]] void run();

      const FailureState& failureState() const { return state_; }

    private:
      TransferOutcome attemptDischarge(CycleReport& report);
      void report(const std::string& message);
      void emitEscalation(const PolicyDecision& decision);
      void journal(const CycleReport& report);

      io::TransferAdapter& adapter_;
      io::ConnectionPoint source_;
      io::ConnectionPoint sink_;
      ItemClassifier classifier_;
      FailurePolicy policy_;
      std::ostream& console_;
      Sleeper sleeper_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      io::FileLogger* journal_;
      int referenceSlot_;

      FailureState state_{};
      std::uint64_t cycle_{ 0 };
    };

  } // namespace core
} // namespace cubecycle
