/* @file Device.cpp
 * @brief error surface and kill path shared by all operator devices
 *
 * © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <utility>

// Labrun headers
#include "core/Engine.hpp"
#include "devices/Device.hpp"

using namespace labrun::devices;

Device::Device(std::string name, core::Engine& engine)
    : name_(std::move(name)), engine_(engine),
      runtime_(name_, *this, engine.dispatcher(), engine.gates().run, engine.logger(),
               engine.runtimeOptions()) {}

void Device::finalize() { runtime_.deactivate(); }

void Device::showError(const std::string& message, const std::optional<std::string>& detail) {
  std::string text = "[" + name_ + "] " + message;
  if (detail)
    text += ": " + *detail;
  engine_.errors().notifyFailure(text);
}

void Device::showException(std::exception_ptr fault) {
  engine_.errors().notifyFailure("[" + name_ + "] " + core::describeException(fault));
}

void Device::kill() {
  if (killed_)
    return;
  killed_ = true;
  engine_.logger().error(name_, "device killed");
  finalize();
}
