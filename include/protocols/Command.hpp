#pragma once
/** @file  Command.hpp
 *  @brief One JSON request line for the transposer bridge.
 *
 *  © 2025 CubeCycle contributors — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <string>

// third-party headers
#include <nlohmann/json.hpp>

namespace cubecycle {
  namespace protocols {

    /// `{"id":N,"op":"...","args":[...]}` + CRLF
    struct Command {
      std::uint32_t id{ 0 };
      std::string op;
      nlohmann::json args = nlohmann::json::array();

      std::string toWire() const {
        nlohmann::json j{ { "id", id }, { "op", op }, { "args", args } };
        return j.dump() + "\r\n";
      }
    };

  } // namespace protocols
} // namespace cubecycle
