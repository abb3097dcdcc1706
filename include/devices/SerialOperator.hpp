#pragma once
/** @file  SerialOperator.hpp
 *  @brief Serial instrument operator: blocking handshake in prepare, optional polling.
 *
 *  © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <memory>
#include <optional>
#include <string>

// Labrun headers
#include "core/DataChannel.hpp"
#include "core/Operator.hpp"
#include "io/SerialChannel.hpp"

namespace labrun::devices {

  /**
 * @class SerialOperator
 * @brief Owns the instrument's SerialChannel for the whole cycle.
 *
 *  Args: `port` (required), `baud` (115200), `handshake` ("*IDN?"),
 *  `expect` (reply prefix, "" = any), `timeout_ms` (1000),
 *  `poll_command` + `poll_interval_ms` (both optional, polling off without them).
 *
 *  * Any handshake failure throws from prepare(): fatal to the activation.
 *  * Poll replies are parsed as a number and pushed to the sink; a missing or
 *    unparsable reply is reported but does not stop polling.
 */
  class SerialOperator : public core::Operator {
  public:
    SerialOperator(nlohmann::json args, std::unique_ptr<io::SerialChannel> port,
                   std::shared_ptr<core::DataChannel> sink);

    /// Write \p command and wait for one reply line (worker thread only).
    std::optional<std::string> query(const std::string& command);

  protected:
    nlohmann::json prepare(const nlohmann::json& args) override;
    void finalize() override;

  private:
    void poll();

    std::unique_ptr<io::SerialChannel> port_;
    std::shared_ptr<core::DataChannel> sink_;
    std::chrono::milliseconds timeout_{ 1000 };
    std::string pollCommand_{};
  };

} // namespace labrun::devices
