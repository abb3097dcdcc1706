#pragma once
/** @file  Builtins.hpp
 *  @brief Registers the stock device types ("sampler", "serial").
 *
 *  © 2025 Labrun — MIT-licensed.
 */

namespace labrun::core {
  class DeviceFactory;
}

namespace labrun::devices {

  void registerBuiltinDevices(core::DeviceFactory& factory);

} // namespace labrun::devices
