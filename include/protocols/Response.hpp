#pragma once
/** @file  Response.hpp
 *  @brief Parsed reply line from the transposer bridge.
 *
 *  © 2025 CubeCycle contributors — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <string>

// third-party headers
#include <nlohmann/json.hpp>

namespace cubecycle {
  namespace protocols {

    /// `{"id":N,"ok":true,"result":...}` or `{"id":N,"ok":false,"error":"..."}`
    struct Response {
      std::uint32_t id{ 0 };
      bool ok{ false };
      nlohmann::json result{}; ///< null when absent
      std::string error;

      /// @returns std::nullopt if the line is not a well-formed reply.
      static std::optional<Response> fromWire(const std::string& line) {
        auto j = nlohmann::json::parse(line, nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded() || !j.is_object())
          return std::nullopt;

        auto id = j.find("id");
        auto ok = j.find("ok");
        if (id == j.end() || !id->is_number_unsigned() || ok == j.end() || !ok->is_boolean())
          return std::nullopt;

        Response response;
        response.id = id->get<std::uint32_t>();
        response.ok = ok->get<bool>();
        if (auto result = j.find("result"); result != j.end())
          response.result = *result;
        if (auto error = j.find("error"); error != j.end() && error->is_string())
          response.error = error->get<std::string>();
        return response;
      }
    };

  } // namespace protocols
} // namespace cubecycle
