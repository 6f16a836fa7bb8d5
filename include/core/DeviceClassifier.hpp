#pragma once
/** @file  DeviceClassifier.hpp
 *  @brief Decides which scanned inventory is the charger and which the cube.
 *
 *  © 2025 CubeCycle contributors — MIT-licensed.
 */

// STL headers
#include <functional>
#include <optional>
#include <string>

// CubeCycle headers
#include "core/DeviceScanner.hpp"

namespace cubecycle {
  namespace core {

    /// Role assignment produced by a classification pass.
    struct RoleAssignment {
      std::optional<io::ConnectionPoint> source{}; ///< charger
      std::optional<io::ConnectionPoint> sink{};   ///< stationary energy store

      bool resolved() const { return source && sink && *source != *sink; }
    };

    /// Case-insensitive substring test.
    bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

    /**
 * @class DeviceClassifier
 * @brief Applies a pair of role predicates to every descriptor of a scan.
 *
 *  * Iterates in scan order; the last matching side wins a role.
 *  * Pure: classifying the same scan twice gives the same answer.
 */
    class DeviceClassifier {
    public:
      using RolePredicate = std::function<bool(const InventoryDescriptor&)>;

      DeviceClassifier(RolePredicate isSource, RolePredicate isSink);

      /// Default strategy: "charger" → source, "cube" or "energy" → sink.
      static DeviceClassifier byDisplayName();

      RoleAssignment classify(const ScanResult& descriptors) const;

    private:
      RolePredicate isSource_;
      RolePredicate isSink_;
    };

  } // namespace core
} // namespace cubecycle
