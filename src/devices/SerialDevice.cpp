/* @file SerialDevice.cpp
 * @brief serial instrument device; connection work happens on the operator's worker
 *
 * © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <stdexcept>
#include <utility>

// Labrun headers
#include "core/Engine.hpp"
#include "devices/SerialDevice.hpp"
#include "devices/SerialOperator.hpp"

using namespace labrun::devices;

SerialDevice::SerialDevice(std::string name, core::Engine& engine, PortFactory makePort,
                           std::shared_ptr<core::DataChannel> values)
    : Device(std::move(name), engine), makePort_(std::move(makePort)), values_(std::move(values)) {
  if (!makePort_)
    makePort_ = [] { return std::make_unique<io::SerialChannel>(); };
  if (!values_)
    values_ = std::make_shared<core::NumericChannel>(name_ + ".values");
}

SerialDevice::~SerialDevice() {
  try {
    finalize();
  } catch (const std::exception& e) {
    std::cerr << "[SerialDevice] " << name_ << ": finalize failed: " << e.what() << "\n";
  }
}

void SerialDevice::prepare(const nlohmann::json& args) {
  auto port = makePort_();
  if (!port)
    throw std::runtime_error("[SerialDevice] " + name_ + ": port factory returned nothing");

  // the factory is called once per activation, so handing over ownership is safe
  auto shared = std::make_shared<std::unique_ptr<io::SerialChannel>>(std::move(port));
  auto sink = values_;
  runtime_.activate(
      [shared, sink](nlohmann::json a) {
        return std::make_unique<SerialOperator>(std::move(a), std::move(*shared), sink);
      },
      args);
}

void SerialDevice::operatorReady(const nlohmann::json& result) {
  identity_ = result.value("identity", std::string());
  engine_.logger().info(name_, "connected to " + identity_);
}

void SerialDevice::finalize() {
  Device::finalize();
  identity_.clear();
}

void SerialDevice::sendCommand(const std::string& command, ReplyHandler onReply) {
  if (!ready()) {
    engine_.logger().warn(name_, "command '" + command + "' sent before the device is ready");
    if (onReply)
      onReply(std::nullopt);
    return;
  }

  runtime_.post([command, onReply = std::move(onReply)](core::Operator& op) {
    auto reply = static_cast<SerialOperator&>(op).query(command);
    if (onReply)
      op.invokeOnController([onReply, reply] { onReply(reply); });
  });
}
