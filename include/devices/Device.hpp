#pragma once
/** @file  Device.hpp
 *  @brief Common base for devices that offload their work to an operator.
 *
 *  © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <exception>
#include <optional>
#include <string>

// Third-party headers
#include <nlohmann/json.hpp>

// Labrun headers
#include "core/OperatorHost.hpp"
#include "core/OperatorRuntime.hpp"

namespace labrun::core {
  class Engine;
}

namespace labrun::devices {

  /**
 * @class Device
 * @brief Owns one OperatorRuntime and routes its callbacks to the engine.
 *
 *  * Errors go to the engine's ErrorMonitor (prefixed with the device name) and log.
 *  * `kill()` finalizes the device; it stays constructed so the owner decides when
 *    to destroy it.
 *  * Controller-thread object, like the runtime it holds.
 */
  class Device : public core::OperatorHost {
  public:
    Device(std::string name, core::Engine& engine);
    ~Device() override = default;

    //---device lifecycle-------------------------------------
    /// Build channels and activate the operator; readiness arrives later.
    virtual void prepare(const nlohmann::json& args) = 0;

    /// Undo prepare(); the base implementation deactivates the runtime.
    virtual void finalize();

    //---OperatorHost-----------------------------------------
    void showError(const std::string& message, const std::optional<std::string>& detail) override;
    void showException(std::exception_ptr fault) override;
    void kill() override;

    const std::string& name() const { return name_; }
    bool killed() const { return killed_; }
    bool ready() const { return runtime_.preparedCompleted() && !killed_; }
    const core::OperatorRuntime& runtime() const { return runtime_; }

    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

  protected:
    std::string name_;
    core::Engine& engine_;
    core::OperatorRuntime runtime_;

  private:
    bool killed_{ false };
  };

} // namespace labrun::devices
