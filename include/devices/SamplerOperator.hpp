#pragma once
/** @file  SamplerOperator.hpp
 *  @brief Periodic random-scalar sampler running on its own worker.
 *
 *  © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <random>

// Labrun headers
#include "core/DataChannel.hpp"
#include "core/Operator.hpp"
#include "core/WorkerContext.hpp"

namespace labrun::devices {

  /**
 * @class SamplerOperator
 * @brief Emits `amplitude * U[0,1) + offset` every `interval_ms` into a data channel.
 *
 *  Args: `interval_ms` (default 1000), `amplitude` (100.0), `offset` (0.0),
 *  `seed` (optional), `autostart` (true: sample from prepare() on, false: only
 *  between beginStep() and endStep()).
 */
  class SamplerOperator : public core::Operator {
  public:
    SamplerOperator(nlohmann::json args, std::shared_ptr<core::DataChannel> sink);

    // worker thread only
    void beginStep();
    std::size_t endStep(); ///< @returns samples emitted since beginStep()

    std::size_t totalSamples() const { return total_.load(); }

  protected:
    nlohmann::json prepare(const nlohmann::json& args) override;
    void finalize() override;

  private:
    void tick();
    void startSampling();
    void stopSampling();

    std::shared_ptr<core::DataChannel> sink_;
    std::chrono::milliseconds interval_{ 1000 };
    double amplitude_{ 100.0 };
    double offset_{ 0.0 };
    bool autostart_{ true };

    std::mt19937 rng_{};
    std::uniform_real_distribution<double> dist_{ 0.0, 1.0 };
    std::optional<core::WorkerContext::TimerId> timer_{};
    std::size_t stepSamples_{ 0 };
    std::atomic<std::size_t> total_{ 0 };
  };

} // namespace labrun::devices
