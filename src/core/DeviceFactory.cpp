/* @file DeviceFactory.cpp
 * @brief string-keyed device registry
 *
 * © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>
#include <utility>

// Labrun headers
#include "core/DeviceFactory.hpp"
#include "devices/Device.hpp"

using namespace labrun::core;

bool DeviceFactory::registerDevice(const std::string& type, Creator maker) {
  if (!maker)
    throw std::invalid_argument("[DeviceFactory] empty creator for " + type);
  return creators_.emplace(type, std::move(maker)).second;
}

std::unique_ptr<labrun::devices::Device> DeviceFactory::create(const std::string& type,
                                                               const std::string& name,
                                                               Engine& engine) const {
  auto it = creators_.find(type);
  if (it == creators_.end())
    throw std::out_of_range("[DeviceFactory] unknown device type: " + type);
  return it->second(name, engine);
}

bool DeviceFactory::contains(const std::string& type) const {
  return creators_.find(type) != creators_.end();
}

std::vector<std::string> DeviceFactory::types() const {
  std::vector<std::string> out;
  out.reserve(creators_.size());
  for (const auto& entry : creators_)
    out.push_back(entry.first);
  std::sort(out.begin(), out.end());
  return out;
}
