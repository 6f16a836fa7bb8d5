/* @file TransferLoop.cpp
 * @brief discharge round trip and escalation output
 *
 * © 2025 CubeCycle contributors — MIT-licensed.
 */

// STL headers
#include <exception>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

// CubeCycle headers
#include "core/SetupWizard.hpp" // printInstructions for the reminder
#include "core/TransferLoop.hpp"

using namespace cubecycle::core;

Sleeper cubecycle::core::realTimeSleeper() {
  return [](std::chrono::seconds d) { std::this_thread::sleep_for(d); };
}

TransferLoop::TransferLoop(io::TransferAdapter& adapter, const Configuration& config,
                           ItemClassifier classifier, FailurePolicy policy,
                           std::ostream& console, Sleeper sleeper,
                           std::shared_ptr<ErrorMonitor> errorMonitor, io::FileLogger* journal,
                           int referenceSlot)
    : adapter_(adapter), source_(io::ConnectionPoint::Down), sink_(io::ConnectionPoint::Down),
      classifier_(std::move(classifier)), policy_(policy), console_(console),
      sleeper_(std::move(sleeper)), errorMonitor_(std::move(errorMonitor)), journal_(journal),
      referenceSlot_(referenceSlot) {
  if (!config.isValid())
    throw std::invalid_argument("[TransferLoop] configuration needs distinct charger and cube sides");
  if (!sleeper_)
    throw std::invalid_argument("[TransferLoop] sleeper is empty");
  if (referenceSlot_ < 1)
    throw std::invalid_argument("[TransferLoop] reference slot is 1-based");
  source_ = *config.source;
  sink_ = *config.sink;
}

void TransferLoop::printHeader() {
  console_ << "=== ENERGY CUBE AUTOMATION ===\n"
           << "Charger: " << io::toString(source_) << "\n"
           << "Stationary Cube: " << io::toString(sink_) << "\n"
           << "Tracked item: " << classifier_.profile().name << "\n"
           << "Press Ctrl+C to stop\n\n";
}

CycleReport TransferLoop::runCycle() {
  CycleReport r;
  r.cycle = ++cycle_;
  r.outcome = attemptDischarge(r);

  PolicyDecision decision = policy_.evaluate(state_, r.outcome);
  state_ = decision.next;

  r.remediated = decision.remediate;
  r.cooledDown = decision.cooldown;
  r.state = state_;
  r.wait = decision.wait;

  emitEscalation(decision);
  journal(r);
  return r;
}

void TransferLoop::run() {
  for (;;) {
    CycleReport r = runCycle();
    sleeper_(r.wait);
  }
}

// -------------------------------------------------------------------
// TransferLoop::attemptDischarge
// Inspect the reference slot, then charger → cube, settle, cube → charger.
// Adapter exceptions map onto the failure outcome of the step that threw.
// -------------------------------------------------------------------
TransferOutcome TransferLoop::attemptDischarge(CycleReport& r) {
  std::optional<io::ItemDescriptor> item;
  try {
    item = adapter_.itemInSlot(source_, referenceSlot_);
  } catch (const std::exception& e) {
    report(std::string("[TransferLoop] reading charger slot failed: ") + e.what());
    console_ << "Cannot read charger slot!\n";
    return TransferOutcome::TransferFailed;
  }

  if (!item) {
    console_ << "No tracked item in charger\n";
    return TransferOutcome::EmptyOrEligible;
  }

  const std::string desc = item->displayLabel.value_or(item->internalId);
  if (!classifier_.matchesTrackedType(item)) {
    console_ << "Non-tracked item: " << desc << "\n";
    return TransferOutcome::ForeignItem;
  }

  console_ << "Found: " << desc << "\n"
           << "Moving to stationary cube...\n";

  int moved = 0;
  try {
    moved = adapter_.transferUnits(source_, sink_, 1);
  } catch (const std::exception& e) {
    report(std::string("[TransferLoop] transfer to cube failed: ") + e.what());
    console_ << "Transfer failed!\n";
    return TransferOutcome::TransferFailed;
  }

  if (moved <= 0) {
    // zero units is ambiguous: empty item or misconfigured cube side
    if (state_.hasSucceededOnce) {
      r.benign = true;
      console_ << desc << " has nothing to discharge, skipping...\n";
      return TransferOutcome::EmptyOrEligible;
    }
    console_ << "Transfer failed!\n"
             << "Likely setup issue - cube side may not be set to 'Discharge'\n";
    return TransferOutcome::TransferFailed;
  }

  r.moved = true;
  console_ << "Discharging...\n";
  const auto settle = policy_.limits().settleInterval;
  if (settle.count() > 0)
    sleeper_(settle);

  int returned = 0;
  try {
    returned = adapter_.transferUnits(sink_, source_, 1);
  } catch (const std::exception& e) {
    report(std::string("[TransferLoop] retrieve from cube failed: ") + e.what());
  }

  if (returned <= 0) {
    console_ << "Failed to retrieve " << desc << "!\n";
    return TransferOutcome::RetrieveFailed;
  }

  console_ << "Discharge complete!\n";
  if (errorMonitor_)
    errorMonitor_->reset();
  return TransferOutcome::Retrieved;
}

void TransferLoop::report(const std::string& message) {
  std::cerr << message << "\n";
  if (errorMonitor_)
    errorMonitor_->notifyFailure(message);
}

void TransferLoop::emitEscalation(const PolicyDecision& decision) {
  if (decision.remediate) {
    console_ << "\n"
             << "REMINDER: Energy Cube side touching Transposer\n"
             << "must be set to 'Discharge' (Dark Red) in Side Config!\n"
             << "\n";
    SetupWizard::printInstructions(console_);
  }

  if (decision.cooldown) {
    console_ << "\n"
             << "Too many failures!\n"
             << "Check setup and hardware.\n"
             << "Waiting " << decision.wait.count() << " seconds...\n"
             << "\n";
  } else {
    console_ << "Waiting " << decision.wait.count() << " seconds...\n\n";
  }
  console_.flush();
}

void TransferLoop::journal(const CycleReport& r) {
  if (!journal_ || !journal_->isOpen())
    return;

  const auto now = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch());
  std::ostringstream line;
  line << now.count() << ',' << r.cycle << ',' << toString(r.outcome) << ','
       << r.state.consecutiveFailures << ',' << r.wait.count() << '\n';
  journal_->write(line.str());
  if (!journal_->flush())
    std::cerr << "[TransferLoop] journal flush failed\n";
}
