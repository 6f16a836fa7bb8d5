#pragma once
/** @file  ConfigStore.hpp
 *  @brief Persisted charger/cube side assignment (key=value text file).
 *
 *  © 2025 CubeCycle contributors — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>
#include <utility>

// CubeCycle headers
#include "io/TransferAdapter.hpp"

namespace cubecycle {
  namespace core {

    /**
 * @struct Configuration
 * @brief Which connection point holds the source (charger) and the sink (cube).
 *
 *  Invariant: setupComplete implies both points set and distinct.
 */
    struct Configuration {
      std::optional<io::ConnectionPoint> source{};
      std::optional<io::ConnectionPoint> sink{};
      bool setupComplete{ false };

      bool isValid() const { return source && sink && *source != *sink; }

      bool operator==(const Configuration&) const = default;
    };

    /**
 * @class ConfigStore
 * @brief Reads and writes the three-line configuration record.
 *
 *  * `load()` never throws; anything unreadable or malformed is "not found".
 *  * `save()` writes through a temp file so a failed write keeps the old record.
 */
    class ConfigStore {
    public:
      static constexpr const char* kSourceKey = "charger_side";
      static constexpr const char* kSinkKey = "cube_side";
      static constexpr const char* kCompleteKey = "setup_complete";

      explicit ConfigStore(std::string path);

      /// @returns {config, found}; found == false on absent/truncated/malformed file.
      std::pair<Configuration, bool> load() const;

      /// @returns false if \p cfg is incomplete or the file cannot be written.
      bool save(const Configuration& cfg) const;

      const std::string& path() const { return path_; }

    private:
      std::string path_;
    };

  } // namespace core
} // namespace cubecycle
