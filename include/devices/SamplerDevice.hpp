#pragma once
/** @file  SamplerDevice.hpp
 *  @brief Device front for SamplerOperator; holds StepGate until each step is flushed.
 *
 *  © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

// Labrun headers
#include "core/DataChannel.hpp"
#include "core/MeasurementController.hpp"
#include "devices/Device.hpp"

namespace labrun::devices {

  class SamplerDevice : public Device {
  public:
    /// \p samples defaults to a NumericChannel named "<name>.samples".
    SamplerDevice(std::string name, core::Engine& engine,
                  std::shared_ptr<core::DataChannel> samples = nullptr);
    ~SamplerDevice() override;

    void prepare(const nlohmann::json& args) override;
    void finalize() override;
    void operatorReady(const nlohmann::json& result) override;

    std::shared_ptr<core::DataChannel> channel() const { return samples_; }
    const std::string& status() const { return status_; }
    std::size_t lastStepSamples() const { return lastStepSamples_; }
    bool holdsStep() const { return stepHeld_; }

  private:
    void measuringStarted();
    void measuringStopped();
    void stepFlushed(std::size_t samples);
    void releaseStep();

    std::shared_ptr<core::DataChannel> samples_;
    std::vector<core::MeasurementController::SubscriptionId> subscriptions_;
    std::string status_{ "offline" };
    std::size_t lastStepSamples_{ 0 };
    bool stepHeld_{ false };
  };

} // namespace labrun::devices
