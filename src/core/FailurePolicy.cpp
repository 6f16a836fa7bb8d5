/* @file FailurePolicy.cpp
 * @brief escalation state machine for consecutive transfer failures
 *
 * © 2025 CubeCycle contributors — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// CubeCycle headers
#include "core/FailurePolicy.hpp"

using namespace cubecycle::core;

FailurePolicy::FailurePolicy(PolicyLimits limits) : limits_(limits) {
  if (limits_.remediationThreshold < 1 || limits_.cooldownThreshold < 1)
    throw std::invalid_argument("[FailurePolicy] thresholds must be >= 1");
  if (limits_.settleInterval.count() < 0 || limits_.pollInterval.count() < 0 ||
      limits_.cooldownInterval.count() < 0)
    throw std::invalid_argument("[FailurePolicy] intervals must be >= 0");
}

PolicyDecision FailurePolicy::evaluate(const FailureState& current,
                                       TransferOutcome outcome) const {
  PolicyDecision d;
  d.next = current;
  d.wait = limits_.pollInterval;

  switch (outcome) {
  case TransferOutcome::Retrieved:
    d.next.hasSucceededOnce = true;
    d.next.consecutiveFailures = 0;
    d.next.remediationCount = 0;
    break;
  case TransferOutcome::EmptyOrEligible:
  case TransferOutcome::ForeignItem:
    d.next.consecutiveFailures = 0;
    d.next.remediationCount = 0;
    break;
  case TransferOutcome::TransferFailed:
  case TransferOutcome::RetrieveFailed:
    ++d.next.consecutiveFailures;
    ++d.next.remediationCount;
    break;
  case TransferOutcome::Moved:
    break; // not a cycle result on its own
  }

  if (d.next.remediationCount >= limits_.remediationThreshold) {
    d.remediate = true;
    d.next.remediationCount = 0;
  }

  if (d.next.consecutiveFailures >= limits_.cooldownThreshold) {
    d.cooldown = true;
    d.next.consecutiveFailures = 0;
    d.next.remediationCount = 0;
    d.wait = limits_.cooldownInterval;
  }
  return d;
}
