#pragma once
/** @file  FailurePolicy.hpp
 *  @brief Outcome classification and the remediation / cooldown escalation.
 *
 *  © 2025 CubeCycle contributors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>

namespace cubecycle {
  namespace core {

    enum class TransferOutcome : std::uint8_t {
      Moved,           ///< item left the source (intermediate)
      Retrieved,       ///< item back in the source after discharge
      EmptyOrEligible, ///< nothing to do this cycle
      TransferFailed,  ///< source → sink moved zero units
      RetrieveFailed,  ///< sink → source moved zero units
      ForeignItem,     ///< something else occupies the reference slot
    };

    inline const char* toString(TransferOutcome o) {
      switch (o) {
      case TransferOutcome::Moved:
        return "Moved";
      case TransferOutcome::Retrieved:
        return "Retrieved";
      case TransferOutcome::EmptyOrEligible:
        return "EmptyOrEligible";
      case TransferOutcome::TransferFailed:
        return "TransferFailed";
      case TransferOutcome::RetrieveFailed:
        return "RetrieveFailed";
      case TransferOutcome::ForeignItem:
        return "ForeignItem";
      default:
        return "Unknown";
      }
    }

    inline bool isFailure(TransferOutcome o) {
      return o == TransferOutcome::TransferFailed || o == TransferOutcome::RetrieveFailed;
    }

    /// Per-run failure bookkeeping, owned by the transfer loop.
    struct FailureState {
      int consecutiveFailures{ 0 }; ///< drives the cooldown
      int remediationCount{ 0 };    ///< drives the setup reminder, reset on each reminder
      bool hasSucceededOnce{ false };

      bool operator==(const FailureState&) const = default;
    };

    /// Thresholds and waits; defaults match the shipped behaviour.
    struct PolicyLimits {
      int remediationThreshold{ 3 };
      int cooldownThreshold{ 5 };
      std::chrono::seconds settleInterval{ 1 };
      std::chrono::seconds pollInterval{ 5 };
      std::chrono::seconds cooldownInterval{ 30 };
    };

    /// What the loop has to do after a cycle.
    struct PolicyDecision {
      FailureState next{};
      bool remediate{ false }; ///< print the setup reminder
      bool cooldown{ false };  ///< print the "too many failures" block
      std::chrono::seconds wait{ 0 };
    };

    /**
 * @class FailurePolicy
 * @brief Pure (FailureState, outcome) → decision mapping.
 *
 *  * Success and "nothing to do" outcomes clear both counters.
 *  * Failures bump both counters; remediation is checked before cooldown.
 *  * Cooldown clears both counters and selects the long wait.
 */
    class FailurePolicy {
    public:
      explicit FailurePolicy(PolicyLimits limits = {});

      PolicyDecision evaluate(const FailureState& current, TransferOutcome outcome) const;

      const PolicyLimits& limits() const { return limits_; }

    private:
      PolicyLimits limits_;
    };

  } // namespace core
} // namespace cubecycle
