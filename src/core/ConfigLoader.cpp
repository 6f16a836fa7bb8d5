/* @file ConfigLoader.cpp
 * @brief JSON settings file reader
 *
 * © 2025 CubeCycle contributors — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <stdexcept>

// third-party headers
#include <nlohmann/json.hpp>

// CubeCycle headers
#include "core/ConfigLoader.hpp"

using namespace cubecycle::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);

  try {
    nlohmann::json j = nlohmann::json::parse(in);
    if (!j.is_object())
      throw std::runtime_error("[ConfigLoader] " + path_ + " must hold a JSON object");
    return j;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
  }
}
