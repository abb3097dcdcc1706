/* @file main.cpp
 * @brief labrund: run a configured measurement against configured devices
 *
 * © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

// Labrun headers
#include "core/ConfigLoader.hpp"
#include "core/DeviceFactory.hpp"
#include "core/Engine.hpp"
#include "devices/Builtins.hpp"
#include "devices/Device.hpp"

using namespace labrun;

namespace {

  constexpr std::chrono::milliseconds kSettleTimeout{ 30000 };
  constexpr std::chrono::milliseconds kPollSlice{ 20 };

  // Dispatch events and poll the measurement controller until the run is idle again.
  bool runMeasurement(core::Engine& engine) {
    auto& measurement = engine.measurement();
    const auto& cfg = engine.config();

    measurement.start(cfg.steps);

    auto stepStarted = std::chrono::steady_clock::now();
    auto lastState = measurement.state();
    const auto deadline = std::chrono::steady_clock::now() +
                          cfg.stepDuration * static_cast<long long>(cfg.steps) + kSettleTimeout;

    while (std::chrono::steady_clock::now() < deadline) {
      engine.dispatcher().runFor(kPollSlice);
      measurement.poll();

      const auto state = measurement.state();
      if (state == core::MeasurementController::State::Running && lastState != state)
        stepStarted = std::chrono::steady_clock::now();
      if (state == core::MeasurementController::State::Running &&
          std::chrono::steady_clock::now() - stepStarted >= cfg.stepDuration)
        measurement.stopStep();
      if (state == core::MeasurementController::State::Idle)
        return true;
      lastState = state;
    }

    engine.logger().error("labrund", "measurement did not settle, aborting");
    measurement.abort();
    return false;
  }

} // namespace

int main(int argc, char** argv) {
  if (argc != 2) {
    std::cerr << "usage: " << argv[0] << " <config.json>\n";
    return 2;
  }

  core::Engine::Config cfg;
  try {
    cfg = core::Engine::Config::fromJson(core::ConfigLoader(argv[1]).load());
  } catch (const std::exception& e) {
    std::cerr << "labrund: " << e.what() << "\n";
    return 1;
  }

  core::Engine engine(cfg);
  engine.errors().registerEscalation(
      [&engine](const std::string& msg) { engine.logger().error("escalation", msg); });

  try {
    engine.logger().startNewRun(cfg.logPath);
  } catch (const std::exception& e) {
    std::cerr << "labrund: " << e.what() << "\n";
    return 1;
  }

  core::DeviceFactory factory;
  devices::registerBuiltinDevices(factory);

  std::vector<std::unique_ptr<devices::Device>> devices;
  int rc = 0;
  try {
    for (const auto& spec : cfg.devices) {
      devices.push_back(factory.create(spec.type, spec.name, engine));
      devices.back()->prepare(spec.args);
    }

    // readiness (or failure) of every device releases the run gate
    engine.dispatcher().runUntil([&engine] { return !engine.gates().run.isAcquired(); },
                                 kSettleTimeout);

    if (!engine.measurement().canStart()) {
      engine.logger().error("labrund", "devices did not settle, run gate still held");
      rc = 1;
    } else if (!runMeasurement(engine)) {
      rc = 1;
    }
  } catch (const std::exception& e) {
    engine.logger().error("labrund", e.what());
    rc = 1;
  }

  for (auto& d : devices)
    d->finalize();
  devices.clear();

  if (engine.errors().failureCount() > 0)
    engine.logger().warn("labrund", std::to_string(engine.errors().failureCount()) +
                                        " device failure(s) reported");
  engine.logger().finishRun();
  return rc;
}
