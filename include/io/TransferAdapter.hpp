#pragma once
/** @file  TransferAdapter.hpp
 *  @brief Abstract transfer-capable hardware adapter (the "transposer").
 *
 *  © 2025 CubeCycle contributors — MIT-licensed.
 */

// STL headers
#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace cubecycle {
  namespace io {

    /**
 * @enum ConnectionPoint
 * @brief The six directional attachment slots of the adapter.
 *
 *  Integer values are the adapter's own side numbering and are what the
 *  configuration file stores.
 */
    enum class ConnectionPoint : std::uint8_t { Down = 0, Up, North, South, West, East, Count };
    static_assert(static_cast<std::uint8_t>(ConnectionPoint::Count) == 6,
                  "ConnectionPoint count changed please update code that depends on it");

    /// Scan order (ascending key).
    inline constexpr std::array<ConnectionPoint, 6> kAllConnectionPoints{
      ConnectionPoint::Down,  ConnectionPoint::Up,   ConnectionPoint::North,
      ConnectionPoint::South, ConnectionPoint::West, ConnectionPoint::East
    };

    inline const char* toString(ConnectionPoint p) {
      switch (p) {
      case ConnectionPoint::Down:
        return "down";
      case ConnectionPoint::Up:
        return "up";
      case ConnectionPoint::North:
        return "north";
      case ConnectionPoint::South:
        return "south";
      case ConnectionPoint::West:
        return "west";
      case ConnectionPoint::East:
        return "east";
      default:
        return "unknown";
      }
    }

    inline int toKey(ConnectionPoint p) { return static_cast<int>(p); }

    /// @returns std::nullopt for keys outside 0..5.
    inline std::optional<ConnectionPoint> fromKey(int key) {
      if (key < 0 || key >= static_cast<int>(ConnectionPoint::Count))
        return std::nullopt;
      return static_cast<ConnectionPoint>(key);
    }

    /// Item stack as reported by the adapter.
    struct ItemDescriptor {
      std::string internalId;                  ///< e.g. "mekanism:energycube"
      std::optional<std::string> displayLabel; ///< human label, may be missing
    };

    /**
 * @class TransferAdapter
 * @brief Narrow capability interface to the hardware.
 *
 *  * Calls are synchronous and may be slow.
 *  * Implementations report faults by throwing (std::runtime_error or derived).
 */
    class TransferAdapter {
    public:
      virtual ~TransferAdapter() = default;

      /// Slot count of the inventory on \p point, nullopt if nothing attached.
      virtual std::optional<int> inventorySize(ConnectionPoint point) = 0;

      /// Display name of the inventory on \p point, if the adapter knows it.
      virtual std::optional<std::string> inventoryName(ConnectionPoint point) = 0;

      /// Item in 1-based \p slot of \p point, nullopt if the slot is empty.
      virtual std::optional<ItemDescriptor> itemInSlot(ConnectionPoint point, int slot) = 0;

      /// Move up to \p count units; returns the number actually moved.
      virtual int transferUnits(ConnectionPoint from, ConnectionPoint to, int count) = 0;
    };

  } // namespace io
} // namespace cubecycle
