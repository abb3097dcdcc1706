/* @file SamplerDevice.cpp
 * @brief wires SamplerOperator into the measurement notifications
 *
 * © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <utility>

// Labrun headers
#include "core/Engine.hpp"
#include "devices/SamplerDevice.hpp"
#include "devices/SamplerOperator.hpp"

using namespace labrun::devices;
using labrun::core::Notification;

SamplerDevice::SamplerDevice(std::string name, core::Engine& engine,
                             std::shared_ptr<core::DataChannel> samples)
    : Device(std::move(name), engine), samples_(std::move(samples)) {
  if (!samples_)
    samples_ = std::make_shared<core::NumericChannel>(name_ + ".samples");
}

SamplerDevice::~SamplerDevice() {
  try {
    finalize();
  } catch (const std::exception& e) {
    std::cerr << "[SamplerDevice] " << name_ << ": finalize failed: " << e.what() << "\n";
  }
}

void SamplerDevice::prepare(const nlohmann::json& args) {
  auto sink = samples_;
  runtime_.activate(
      [sink](nlohmann::json a) { return std::make_unique<SamplerOperator>(std::move(a), sink); },
      args);
  status_ = "starting";
}

void SamplerDevice::operatorReady(const nlohmann::json& result) {
  auto& measurement = engine_.measurement();
  subscriptions_.push_back(
      measurement.subscribe(Notification::Started, [this] { measuringStarted(); }));
  subscriptions_.push_back(
      measurement.subscribe(Notification::Stopped, [this] { measuringStopped(); }));

  status_ = "standby";
  engine_.logger().info(name_, "sampling every " +
                                   std::to_string(result.value("interval_ms", 0LL)) + " ms");
}

void SamplerDevice::finalize() {
  for (auto id : subscriptions_)
    engine_.measurement().unsubscribe(id);
  subscriptions_.clear();

  Device::finalize();

  // the worker may have gone before flushing the step
  releaseStep();
  status_ = "offline";
}

void SamplerDevice::measuringStarted() {
  if (!ready())
    return;

  if (!stepHeld_) {
    engine_.gates().step.acquire();
    stepHeld_ = true;
  }
  status_ = "measuring";
  runtime_.post([](core::Operator& op) { static_cast<SamplerOperator&>(op).beginStep(); });
}

void SamplerDevice::measuringStopped() {
  if (!stepHeld_)
    return;

  status_ = "standby";
  runtime_.post([this](core::Operator& op) {
    const std::size_t n = static_cast<SamplerOperator&>(op).endStep();
    op.invokeOnController([this, n] { stepFlushed(n); });
  });
}

void SamplerDevice::stepFlushed(std::size_t samples) {
  lastStepSamples_ = samples;
  engine_.logger().debug(name_, "step flushed with " + std::to_string(samples) + " samples");
  releaseStep();
}

void SamplerDevice::releaseStep() {
  if (!stepHeld_)
    return;
  stepHeld_ = false;
  engine_.gates().step.release();
}
