/* @file main.cpp
 * @brief cubecycle entry point: settings, serial link, coordinator
 *
 * © 2025 CubeCycle contributors — MIT-licensed.
 */

// STL headers
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

// third-party headers
#include <nlohmann/json.hpp>

// CubeCycle headers
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/RuntimeSettings.hpp"
#include "core/SerialTransposer.hpp"
#include "core/SystemCoordinator.hpp"
#include "io/FileLogger.hpp"
#include "io/SerialChannel.hpp"

using namespace cubecycle;

namespace {

  void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--settings <file.json>] [--setup]\n";
  }

} // namespace

int main(int argc, char** argv) {
  std::optional<std::string> settingsPath;
  bool forceSetup = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--settings" && i + 1 < argc) {
      settingsPath = argv[++i];
    } else if (arg == "--setup") {
      forceSetup = true;
    } else if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      return 0;
    } else {
      printUsage(argv[0]);
      return 2;
    }
  }

  try {
    core::RuntimeSettings settings;
    if (settingsPath)
      settings = core::RuntimeSettings::fromJson(core::ConfigLoader(*settingsPath).load());

    auto errorMonitor = std::make_shared<core::ErrorMonitor>();
    errorMonitor->registerEscalation([](const std::string& fault) {
      std::cerr << "[ErrorMonitor] new fault: " << fault << "\n";
    });

    core::SerialTransposer transposer(std::make_unique<io::SerialChannel>(), errorMonitor,
                                      settings.responseTimeout);
    transposer.connect(settings.device, settings.baudConstant());

    io::FileLogger journal;
    if (!settings.journal.empty() && !journal.open(settings.journal))
      std::cerr << "[main] journal disabled\n";

    core::SystemCoordinator coordinator(settings, transposer, std::cin, std::cout,
                                        core::realTimeSleeper(), errorMonitor, &journal);
    if (!coordinator.initialize(forceSetup))
      return 1;
    coordinator.run();
  } catch (const std::exception& e) {
    std::cerr << "[main] fatal: " << e.what() << "\n";
    return 1;
  }
}
