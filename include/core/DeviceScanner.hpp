#pragma once
/** @file  DeviceScanner.hpp
 *  @brief Enumerates inventories attached to the transposer.
 *
 *  © 2025 CubeCycle contributors — MIT-licensed.
 */

// STL headers
#include <map>
#include <ostream>
#include <string>

// CubeCycle headers
#include "io/TransferAdapter.hpp"

namespace cubecycle {
  namespace core {

    /// One attached inventory found by a scan (transient).
    struct InventoryDescriptor {
      io::ConnectionPoint point{ io::ConnectionPoint::Down };
      int slotCount{ 0 };
      std::string displayName;
    };

    /// Ordered by connection-point key, i.e. scan order.
    using ScanResult = std::map<io::ConnectionPoint, InventoryDescriptor>;

    /**
 * @class DeviceScanner
 * @brief Probes all six sides and reports the ones with an inventory.
 *
 *  * A side is reported iff the adapter returns a size > 0.
 *  * Writes one "  <side>: <name>" line per hit to the console stream.
 */
    class DeviceScanner {
    public:
      static constexpr const char* kUnknownName = "Unknown";

      DeviceScanner(io::TransferAdapter& adapter, std::ostream& console)
          : adapter_(adapter), console_(console) {}

      ScanResult scan();

    private:
      io::TransferAdapter& adapter_;
      std::ostream& console_;
    };

  } // namespace core
} // namespace cubecycle
