/* @file DeviceClassifier.cpp
 * @brief name heuristics for charger / cube detection
 *
 * © 2025 CubeCycle contributors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <stdexcept>

// CubeCycle headers
#include "core/DeviceClassifier.hpp"

using namespace cubecycle::core;

namespace {
  std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
  }
} // namespace

bool cubecycle::core::containsIgnoreCase(const std::string& haystack, const std::string& needle) {
  return lower(haystack).find(lower(needle)) != std::string::npos;
}

DeviceClassifier::DeviceClassifier(RolePredicate isSource, RolePredicate isSink)
    : isSource_(std::move(isSource)), isSink_(std::move(isSink)) {
  if (!isSource_ || !isSink_)
    throw std::invalid_argument("[DeviceClassifier] role predicate is empty");
}

DeviceClassifier DeviceClassifier::byDisplayName() {
  return DeviceClassifier(
      [](const InventoryDescriptor& d) { return containsIgnoreCase(d.displayName, "charger"); },
      [](const InventoryDescriptor& d) {
        return containsIgnoreCase(d.displayName, "cube") ||
               containsIgnoreCase(d.displayName, "energy");
      });
}

RoleAssignment DeviceClassifier::classify(const ScanResult& descriptors) const {
  RoleAssignment roles;
  for (const auto& [point, desc] : descriptors) {
    if (isSource_(desc))
      roles.source = point;
    if (isSink_(desc))
      roles.sink = point;
  }
  return roles;
}
