/* @file SystemCoordinator.cpp
 * @brief boot sequence: saved config or setup wizard, then the transfer loop
 *
 * © 2025 CubeCycle contributors — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <stdexcept>

// CubeCycle headers
#include "core/DeviceClassifier.hpp"
#include "core/DeviceScanner.hpp"
#include "core/SetupWizard.hpp"
#include "core/SystemCoordinator.hpp"

using namespace cubecycle::core;

const char* cubecycle::core::toString(SystemCoordinator::State s) {
  switch (s) {
  case SystemCoordinator::State::BOOT:
    return "BOOT";
  case SystemCoordinator::State::INIT:
    return "INIT";
  case SystemCoordinator::State::SETUP:
    return "SETUP";
  case SystemCoordinator::State::IDLE:
    return "IDLE";
  case SystemCoordinator::State::RUNNING:
    return "RUNNING";
  case SystemCoordinator::State::ERROR:
    return "ERROR";
  default:
    return "Unknown";
  }
}

SystemCoordinator::SystemCoordinator(RuntimeSettings settings, io::TransferAdapter& adapter,
                                     std::istream& input, std::ostream& console,
                                     Sleeper sleeper, std::shared_ptr<ErrorMonitor> errorMonitor,
                                     io::FileLogger* journal)
    : settings_(std::move(settings)), adapter_(adapter), input_(input), console_(console),
      sleeper_(std::move(sleeper)), errorMonitor_(std::move(errorMonitor)), journal_(journal),
      store_(settings_.configFile) {}

bool SystemCoordinator::initialize(bool forceSetup) {
  if (currentState_ != State::BOOT)
    throw std::logic_error("[SystemCoordinator] initialize() called twice");

  transitionTo(State::INIT);
  console_ << "ENERGY CUBE DISCHARGE SYSTEM\n";

  if (!forceSetup) {
    auto [cfg, found] = store_.load();
    if (found && cfg.setupComplete) {
      console_ << "Config loaded\n"
               << "Using saved config\n";
      config_ = cfg;
      transitionTo(State::IDLE);
      return true;
    }
    if (found)
      console_ << "Saved config is not marked complete, running setup\n";
  }

  transitionTo(State::SETUP);
  DeviceScanner scanner(adapter_, console_);
  SetupWizard wizard(scanner, DeviceClassifier::byDisplayName(), store_, input_, console_);
  auto cfg = wizard.run();
  if (!cfg) {
    handleError("setup ended before charger and cube were detected");
    return false;
  }

  config_ = *cfg;
  transitionTo(State::IDLE);
  return true;
}

void SystemCoordinator::run() {
  if (currentState_ != State::IDLE)
    throw std::logic_error(std::string("[SystemCoordinator] cannot run from state ") +
                           toString(currentState_));

  TransferLoop loop(adapter_, config_, ItemClassifier(settings_.trackedItem),
                    FailurePolicy(settings_.limits), console_, sleeper_, errorMonitor_, journal_,
                    settings_.referenceSlot);
  transitionTo(State::RUNNING);
  loop.printHeader();
  loop.run();
}

void SystemCoordinator::handleError(const std::string& reason) {
  std::cerr << "[SystemCoordinator] " << reason << "\n";
  if (errorMonitor_)
    errorMonitor_->notifyFailure("[SystemCoordinator] " + reason);
  transitionTo(State::ERROR);
}

void SystemCoordinator::transitionTo(State next) {
  std::cerr << "[SystemCoordinator] " << toString(currentState_) << " -> " << toString(next)
            << "\n";
  currentState_ = next;
}
