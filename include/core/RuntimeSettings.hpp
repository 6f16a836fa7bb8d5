#pragma once
/** @file  RuntimeSettings.hpp
 *  @brief Validated, typed view of the JSON settings file.
 *
 *  © 2025 CubeCycle contributors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <string>

// Linux header
#include <termios.h> // speed_t

// third-party headers
#include <nlohmann/json_fwd.hpp>

// CubeCycle headers
#include "core/FailurePolicy.hpp"
#include "core/ItemClassifier.hpp"

namespace cubecycle {
  namespace core {

    /**
 * @struct RuntimeSettings
 * @brief Every tunable of a run; defaults reproduce the stock deployment.
 *
 *  Missing keys keep their default. Wrong types or out-of-range values make
 *  `fromJson()` throw `std::invalid_argument` naming the key.
 */
    struct RuntimeSettings {
      std::string configFile{ "cubecycle.conf" };
      std::string device{ "/dev/transposer0" };
      int baud{ 115200 };
      std::chrono::milliseconds responseTimeout{ 2000 };
      TrackedItemProfile trackedItem{ TrackedItemProfile::energyCube() };
      int referenceSlot{ 1 };
      PolicyLimits limits{};
      std::string journal{}; ///< empty = no journal

      static RuntimeSettings fromJson(const nlohmann::json& j);

      /// termios constant for `baud`.
      speed_t baudConstant() const;
    };

  } // namespace core
} // namespace cubecycle
