/* @file DeviceScanner.cpp
 * @brief side-by-side inventory probe
 *
 * © 2025 CubeCycle contributors — MIT-licensed.
 */

// STL headers
#include <exception>
#include <iostream>
#include <optional>
#include <string>

// CubeCycle headers
#include "core/DeviceScanner.hpp"

using namespace cubecycle::core;

ScanResult DeviceScanner::scan() {
  console_ << "Detecting inventories...\n";
  ScanResult found;

  for (auto point : io::kAllConnectionPoints) {
    std::optional<int> size;
    try {
      size = adapter_.inventorySize(point);
    } catch (const std::exception& e) {
      std::cerr << "[DeviceScanner] probe of side " << io::toString(point)
                << " failed: " << e.what() << "\n";
      continue;
    }
    if (!size || *size <= 0)
      continue;

    std::optional<std::string> name;
    try {
      name = adapter_.inventoryName(point);
    } catch (const std::exception& e) {
      std::cerr << "[DeviceScanner] name of side " << io::toString(point)
                << " unavailable: " << e.what() << "\n";
    }

    InventoryDescriptor desc{ point, *size, name.value_or(kUnknownName) };
    console_ << "  " << io::toString(point) << ": " << desc.displayName << "\n";
    found.emplace(point, std::move(desc));
  }
  return found;
}
