/* @file SamplerOperator.cpp
 * @brief timer-driven scalar sampler
 *
 * © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <utility>

// Labrun headers
#include "devices/SamplerOperator.hpp"

using namespace labrun::devices;

SamplerOperator::SamplerOperator(nlohmann::json args, std::shared_ptr<core::DataChannel> sink)
    : core::Operator(std::move(args)), sink_(std::move(sink)) {
  if (!sink_)
    throw std::invalid_argument("[SamplerOperator] a data channel is required");
}

nlohmann::json SamplerOperator::prepare(const nlohmann::json& args) {
  const long long interval = args.value("interval_ms", 1000LL);
  if (interval <= 0)
    throw std::invalid_argument("[SamplerOperator] interval_ms must be positive");

  interval_ = std::chrono::milliseconds(interval);
  amplitude_ = args.value("amplitude", 100.0);
  offset_ = args.value("offset", 0.0);
  autostart_ = args.value("autostart", true);

  if (args.contains("seed"))
    rng_.seed(args.at("seed").get<std::uint32_t>());
  else
    rng_.seed(std::random_device{}());

  if (autostart_)
    startSampling();

  return { { "interval_ms", interval }, { "autostart", autostart_ } };
}

void SamplerOperator::finalize() { stopSampling(); }

void SamplerOperator::beginStep() {
  stepSamples_ = 0;
  if (!autostart_)
    startSampling();
}

std::size_t SamplerOperator::endStep() {
  if (!autostart_)
    stopSampling();
  return stepSamples_;
}

void SamplerOperator::tick() {
  sink_->addData(amplitude_ * dist_(rng_) + offset_);
  ++stepSamples_;
  ++total_;
}

void SamplerOperator::startSampling() {
  if (timer_)
    return;
  timer_ = worker().startTimer(interval_, [this] { tick(); });
}

void SamplerOperator::stopSampling() {
  if (!timer_)
    return;
  worker().stopTimer(*timer_);
  timer_.reset();
}
