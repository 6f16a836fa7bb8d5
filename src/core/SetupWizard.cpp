/* @file SetupWizard.cpp
 * @brief first-time setup loop
 *
 * © 2025 CubeCycle contributors — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <string>

// CubeCycle headers
#include "core/SetupWizard.hpp"

using namespace cubecycle::core;

SetupWizard::SetupWizard(DeviceScanner& scanner, DeviceClassifier classifier,
                         const ConfigStore& store, std::istream& input, std::ostream& console)
    : scanner_(scanner), classifier_(std::move(classifier)), store_(store), input_(input),
      console_(console) {}

void SetupWizard::printInstructions(std::ostream& out) {
  out << "SETUP REQUIRED:\n"
      << "1. Place the stationary Energy Cube next to the Transposer\n"
      << "2. Open the Energy Cube GUI\n"
      << "3. Go to 'Side Config' tab\n"
      << "4. Click 'Items' tab\n"
      << "5. Set the side touching the Transposer to\n"
      << "   'Discharge' (Dark Red)\n"
      << "6. Place Charger next to the Transposer\n"
      << "\n";
}

std::optional<Configuration> SetupWizard::run() {
  state_ = State::AwaitingConfirmation;
  console_ << "=== FIRST TIME SETUP ===\n\n";
  printInstructions(console_);

  while (state_ == State::AwaitingConfirmation) {
    if (!waitForConfirmation()) {
      console_ << "\nSetup aborted: input closed\n";
      return std::nullopt;
    }
    ++attempts_;

    ScanResult scan = scanner_.scan();
    RoleAssignment roles = classifier_.classify(scan);

    if (!roles.resolved()) {
      reportIncomplete(scan, roles);
      printInstructions(console_);
      continue;
    }

    Configuration cfg;
    cfg.source = roles.source;
    cfg.sink = roles.sink;
    cfg.setupComplete = true;
    state_ = State::Resolved;

    console_ << "SUCCESS! Detected:\n"
             << "  Charger: " << io::toString(*cfg.source) << "\n"
             << "  Stationary Cube: " << io::toString(*cfg.sink) << "\n\n";

    if (store_.save(cfg))
      console_ << "Config saved\n";
    else
      console_ << "Config not saved (" << store_.path() << "), setup will run again next start\n";

    console_ << "Setup complete!\n";
    return cfg;
  }
  return std::nullopt;
}

bool SetupWizard::waitForConfirmation() {
  console_ << "Press ENTER when setup is complete...\n";
  console_.flush();
  std::string line;
  bool ok = static_cast<bool>(std::getline(input_, line));
  console_ << "\n";
  return ok;
}

void SetupWizard::reportIncomplete(const ScanResult& scan, const RoleAssignment& roles) {
  console_ << "SETUP INCOMPLETE!\n\n"
           << "Currently detected:\n";
  if (scan.empty()) {
    console_ << "  No inventories detected\n";
  } else {
    for (const auto& [point, desc] : scan)
      console_ << "  " << io::toString(point) << ": " << desc.displayName << "\n";
  }
  console_ << "\n";

  if (!roles.source)
    console_ << "MISSING: Charger (no inventory with 'charger' in name)\n";
  if (!roles.sink) {
    console_ << "MISSING: Energy Cube (no inventory with 'cube' or 'energy' in name)\n"
             << "  Make sure the cube side touching the Transposer is set to 'Discharge'!\n";
  }
  if (roles.source && roles.sink && *roles.source == *roles.sink) {
    console_ << "MISSING: distinct devices (side " << io::toString(*roles.source)
             << " matched both Charger and Energy Cube)\n";
  }
  console_ << "\n";
}
