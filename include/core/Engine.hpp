#pragma once

/** @file  Engine.hpp
 *  @brief Owner of the session-wide singletons (gates, dispatcher, logger, errors).
 *
 *  © 2025 Labrun — licensed under MIT.
 */

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/CompletionGate.hpp"
#include "core/Dispatcher.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/MeasurementController.hpp"
#include "core/OperatorRuntime.hpp"

namespace labrun {
  namespace core {

    /**
 * @class Engine
 * @brief Built once in main() and passed by reference to every device.
 *
 *  * The thread that calls `dispatcher().dispatch*` is the controller context.
 *  * Destroy devices before the engine: runtimes detach from its dispatcher.
 */
    class Engine {

    public:
      struct DeviceSpec {
        std::string name;
        std::string type;
        nlohmann::json args = nlohmann::json::object();
      };

      struct Config {
        LogLevel logLevel{ LogLevel::Info };
        std::string logPath{}; ///< empty = no CSV file
        std::size_t dispatcherCapacity{ Dispatcher::kDefaultCapacity };
        std::chrono::milliseconds finalizeWarnAfter{ 5000 };
        std::size_t steps{ 1 };
        std::chrono::milliseconds stepDuration{ 1000 };
        std::vector<DeviceSpec> devices{};

        /// Validate and convert; throws std::runtime_error naming the offending key.
        static Config fromJson(const nlohmann::json& j);
      };

      Engine(); ///< default Config
      explicit Engine(Config config);
      ~Engine() = default;

      Logger& logger() { return *logger_; }
      Dispatcher& dispatcher() { return dispatcher_; }
      CompletionGates& gates() { return gates_; }
      ErrorMonitor& errors() { return *errorMonitor_; }
      std::shared_ptr<ErrorMonitor> errorMonitor() const { return errorMonitor_; }
      MeasurementController& measurement() { return measurement_; }

      const Config& config() const { return config_; }
      RuntimeOptions runtimeOptions() const { return RuntimeOptions{ config_.finalizeWarnAfter }; }

      Engine(const Engine&) = delete;
      Engine& operator=(const Engine&) = delete;

    private:
      Config config_;
      std::unique_ptr<Logger> logger_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      CompletionGates gates_;
      Dispatcher dispatcher_;
      MeasurementController measurement_;
    };

  } // namespace core
} // namespace labrun
