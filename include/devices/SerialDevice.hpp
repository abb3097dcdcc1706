#pragma once
/** @file  SerialDevice.hpp
 *  @brief Device front for a serial instrument handled by SerialOperator.
 *
 *  © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <functional>
#include <memory>
#include <optional>
#include <string>

// Labrun headers
#include "core/DataChannel.hpp"
#include "devices/Device.hpp"
#include "io/SerialChannel.hpp"

namespace labrun::devices {

  class SerialDevice : public Device {
  public:
    using PortFactory = std::function<std::unique_ptr<io::SerialChannel>()>;
    using ReplyHandler = std::function<void(const std::optional<std::string>&)>;

    /// \p makePort defaults to a real io::SerialChannel; tests inject fakes.
    SerialDevice(std::string name, core::Engine& engine, PortFactory makePort = {},
                 std::shared_ptr<core::DataChannel> values = nullptr);
    ~SerialDevice() override;

    void prepare(const nlohmann::json& args) override;
    void finalize() override;
    void operatorReady(const nlohmann::json& result) override;

    /// Send \p command from the worker; \p onReply runs on the controller.
    void sendCommand(const std::string& command, ReplyHandler onReply);

    const std::string& identity() const { return identity_; }
    std::shared_ptr<core::DataChannel> channel() const { return values_; }

  private:
    PortFactory makePort_;
    std::shared_ptr<core::DataChannel> values_;
    std::string identity_{};
  };

} // namespace labrun::devices
