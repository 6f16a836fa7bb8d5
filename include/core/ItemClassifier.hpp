#pragma once
/** @file  ItemClassifier.hpp
 *  @brief Recognises the tracked item type sitting in the charger.
 *
 *  © 2025 CubeCycle contributors — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>
#include <vector>

// CubeCycle headers
#include "io/TransferAdapter.hpp"

namespace cubecycle {
  namespace core {

    /**
 * @struct TrackedItemProfile
 * @brief What the loop moves: an exact id and/or a set of label tokens.
 *
 *  An empty internalId disables the id check; an empty token list disables
 *  the label check.
 */
    struct TrackedItemProfile {
      std::string name;                     ///< settings key, e.g. "energy_cube"
      std::string internalId;               ///< exact match, e.g. "mekanism:energycube"
      std::vector<std::string> labelTokens; ///< all must appear (case-insensitive)

      static TrackedItemProfile energyCube();
      static TrackedItemProfile batteryUpgrade();

      /// Lookup by settings key; throws `std::invalid_argument` if unknown.
      static TrackedItemProfile byName(const std::string& name);
    };

    class ItemClassifier {
    public:
      explicit ItemClassifier(TrackedItemProfile profile) : profile_(std::move(profile)) {}

      /// Id match first, label tokens as fallback; false for an empty slot.
      bool matchesTrackedType(const std::optional<io::ItemDescriptor>& item) const;

      const TrackedItemProfile& profile() const { return profile_; }

    private:
      TrackedItemProfile profile_;
    };

  } // namespace core
} // namespace cubecycle
