/* @file Engine.cpp
 * @brief session singletons and configuration schema checks
 *
 * © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <utility>

// Labrun headers
#include "core/Engine.hpp"

using namespace labrun::core;

namespace {

  // Fetch an optional positive integer member, or keep \p fallback.
  long long positiveOr(const nlohmann::json& obj, const char* key, const std::string& where,
                       long long fallback) {
    if (!obj.contains(key))
      return fallback;
    const auto& v = obj.at(key);
    if (!v.is_number_integer() || v.get<long long>() <= 0)
      throw std::runtime_error("[Engine] " + where + "." + key + " must be a positive integer");
    return v.get<long long>();
  }

  const nlohmann::json& section(const nlohmann::json& root, const char* key) {
    static const nlohmann::json kEmpty = nlohmann::json::object();
    if (!root.contains(key))
      return kEmpty;
    const auto& s = root.at(key);
    if (!s.is_object())
      throw std::runtime_error(std::string("[Engine] '") + key + "' must be an object");
    return s;
  }

} // namespace

Engine::Config Engine::Config::fromJson(const nlohmann::json& j) {
  if (!j.is_object())
    throw std::runtime_error("[Engine] configuration root must be an object");

  Config cfg;

  const auto& log = section(j, "log");
  if (log.contains("level")) {
    const auto& lv = log.at("level");
    auto parsed = lv.is_string() ? parseLogLevel(lv.get<std::string>()) : std::nullopt;
    if (!parsed)
      throw std::runtime_error("[Engine] log.level must be one of debug/info/warn/error");
    cfg.logLevel = *parsed;
  }
  if (log.contains("path")) {
    if (!log.at("path").is_string())
      throw std::runtime_error("[Engine] log.path must be a string");
    cfg.logPath = log.at("path").get<std::string>();
  }

  cfg.dispatcherCapacity = static_cast<std::size_t>(
      positiveOr(section(j, "dispatcher"), "capacity", "dispatcher",
                 static_cast<long long>(cfg.dispatcherCapacity)));

  cfg.finalizeWarnAfter = std::chrono::milliseconds(positiveOr(
      section(j, "runtime"), "finalize_warn_ms", "runtime", cfg.finalizeWarnAfter.count()));

  const auto& measurement = section(j, "measurement");
  cfg.steps = static_cast<std::size_t>(
      positiveOr(measurement, "steps", "measurement", static_cast<long long>(cfg.steps)));
  cfg.stepDuration = std::chrono::milliseconds(
      positiveOr(measurement, "step_ms", "measurement", cfg.stepDuration.count()));

  if (j.contains("devices")) {
    const auto& list = j.at("devices");
    if (!list.is_array())
      throw std::runtime_error("[Engine] 'devices' must be an array");

    for (std::size_t i = 0; i < list.size(); ++i) {
      const auto& d = list.at(i);
      const std::string where = "devices[" + std::to_string(i) + "]";
      if (!d.is_object() || !d.contains("name") || !d.at("name").is_string() ||
          !d.contains("type") || !d.at("type").is_string())
        throw std::runtime_error("[Engine] " + where + " needs string 'name' and 'type'");

      DeviceSpec spec;
      spec.name = d.at("name").get<std::string>();
      spec.type = d.at("type").get<std::string>();
      if (d.contains("args")) {
        if (!d.at("args").is_object())
          throw std::runtime_error("[Engine] " + where + ".args must be an object");
        spec.args = d.at("args");
      }

      for (const auto& existing : cfg.devices) {
        if (existing.name == spec.name)
          throw std::runtime_error("[Engine] duplicate device name: " + spec.name);
      }
      cfg.devices.push_back(std::move(spec));
    }
  }

  return cfg;
}

Engine::Engine() : Engine(Config{}) {}

Engine::Engine(Config config)
    : config_(std::move(config)), logger_(std::make_unique<Logger>(config_.logLevel)),
      errorMonitor_(std::make_shared<ErrorMonitor>()),
      dispatcher_(config_.dispatcherCapacity), measurement_(gates_, *logger_) {}
