/* @file ItemClassifier.cpp
 * @brief tracked item recognition
 *
 * © 2025 CubeCycle contributors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>

// CubeCycle headers
#include "core/DeviceClassifier.hpp" // containsIgnoreCase
#include "core/ItemClassifier.hpp"

using namespace cubecycle::core;

TrackedItemProfile TrackedItemProfile::energyCube() {
  return { "energy_cube", "mekanism:energycube", { "energy", "cube" } };
}

TrackedItemProfile TrackedItemProfile::batteryUpgrade() {
  // battery upgrades share a generic id with other upgrades, label only
  return { "battery_upgrade", "", { "battery", "upgrade" } };
}

TrackedItemProfile TrackedItemProfile::byName(const std::string& name) {
  if (name == "energy_cube")
    return energyCube();
  if (name == "battery_upgrade")
    return batteryUpgrade();
  throw std::invalid_argument("[ItemClassifier] unknown tracked item: " + name);
}

bool ItemClassifier::matchesTrackedType(const std::optional<io::ItemDescriptor>& item) const {
  if (!item)
    return false;

  if (!profile_.internalId.empty() && item->internalId == profile_.internalId)
    return true;

  if (!item->displayLabel || profile_.labelTokens.empty())
    return false;

  const std::string& label = *item->displayLabel;
  return std::all_of(profile_.labelTokens.begin(), profile_.labelTokens.end(),
                     [&label](const std::string& token) { return containsIgnoreCase(label, token); });
}
