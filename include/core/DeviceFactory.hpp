#pragma once
/** @file  DeviceFactory.hpp
 *  @brief Runtime registry that maps device type names to creators.
 *
 *  © 2025 Labrun — MIT-licensed.
 */

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace labrun::devices {
  class Device;
}

namespace labrun::core {

  class Engine;

  /**
 * @class DeviceFactory
 * @brief Register & instantiate devices by string key.
 *
 *  * Keeps the engine decoupled from concrete devices.
 *  * Creators are lambdas returning `unique_ptr<Device>`.
 */
  class DeviceFactory {
  public:
    using Creator = std::function<std::unique_ptr<devices::Device>(const std::string& name, Engine&)>;

    /// Register a device type under \p type.  Returns false on duplicate.
    bool registerDevice(const std::string& type, Creator maker);

    /// Create a fresh instance or throw `std::out_of_range` if unknown.
    std::unique_ptr<devices::Device> create(const std::string& type, const std::string& name,
                                            Engine& engine) const;

    bool contains(const std::string& type) const;
    std::vector<std::string> types() const; ///< sorted

  private:
    std::unordered_map<std::string, Creator> creators_;
  };

} // namespace labrun::core
