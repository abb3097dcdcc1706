/* @file Builtins.cpp
 * @brief stock device registrations
 *
 * © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <memory>
#include <stdexcept>
#include <string>

// Labrun headers
#include "core/DeviceFactory.hpp"
#include "devices/Builtins.hpp"
#include "devices/SamplerDevice.hpp"
#include "devices/SerialDevice.hpp"

void labrun::devices::registerBuiltinDevices(core::DeviceFactory& factory) {
  const bool sampler =
      factory.registerDevice("sampler", [](const std::string& name, core::Engine& engine) {
        return std::make_unique<SamplerDevice>(name, engine);
      });
  const bool serial =
      factory.registerDevice("serial", [](const std::string& name, core::Engine& engine) {
        return std::make_unique<SerialDevice>(name, engine);
      });

  if (!sampler || !serial)
    throw std::logic_error("[Builtins] stock device types registered twice");
}
