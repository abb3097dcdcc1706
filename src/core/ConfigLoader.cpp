/* @file ConfigLoader.cpp
 * @brief reads and parses the engine JSON configuration
 *
 * © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <stdexcept>
#include <utility>

// Third-party headers
#include <nlohmann/json.hpp>

// Labrun headers
#include "core/ConfigLoader.hpp"

using namespace labrun::core;

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

nlohmann::json ConfigLoader::load() const {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open config file: " + path_);

  try {
    return nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
  }
}
