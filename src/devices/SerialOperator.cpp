/* @file SerialOperator.cpp
 * @brief handshake + polling for line-based serial instruments
 *
 * © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <utility>

// Labrun headers
#include "core/WorkerContext.hpp"
#include "devices/SerialOperator.hpp"

using namespace labrun::devices;

SerialOperator::SerialOperator(nlohmann::json args, std::unique_ptr<io::SerialChannel> port,
                               std::shared_ptr<core::DataChannel> sink)
    : core::Operator(std::move(args)), port_(std::move(port)), sink_(std::move(sink)) {
  if (!port_)
    throw std::invalid_argument("[SerialOperator] a serial channel is required");
}

nlohmann::json SerialOperator::prepare(const nlohmann::json& args) {
  const auto device = args.at("port").get<std::string>();
  const long baud = args.value("baud", 115200L);
  const auto handshake = args.value("handshake", std::string("*IDN?"));
  const auto expect = args.value("expect", std::string());
  timeout_ = std::chrono::milliseconds(args.value("timeout_ms", 1000LL));

  auto speed = io::speedFromBaud(baud);
  if (!speed)
    throw std::invalid_argument("[SerialOperator] unsupported baud rate " + std::to_string(baud));

  if (!port_->open(device, *speed))
    throw std::runtime_error("[SerialOperator] cannot open " + device);

  auto reply = query(handshake);
  if (!reply)
    throw std::runtime_error("[SerialOperator] no reply to '" + handshake + "' on " + device);
  if (!reply->starts_with(expect))
    throw std::runtime_error("[SerialOperator] unexpected handshake reply: " + *reply);

  if (args.contains("poll_command")) {
    pollCommand_ = args.at("poll_command").get<std::string>();
    const long long every = args.value("poll_interval_ms", 1000LL);
    worker().startTimer(std::chrono::milliseconds(every), [this] { poll(); });
  }

  return { { "identity", *reply }, { "port", device } };
}

void SerialOperator::finalize() { port_->close(); }

std::optional<std::string> SerialOperator::query(const std::string& command) {
  if (!port_->writeLine(command))
    return std::nullopt;
  return port_->readLine(timeout_);
}

void SerialOperator::poll() {
  auto reply = query(pollCommand_);
  if (!reply) {
    reportError("no reply to poll command", pollCommand_);
    return;
  }

  double value = 0.0;
  try {
    std::size_t used = 0;
    value = std::stod(*reply, &used);
    if (used != reply->size())
      throw std::invalid_argument("trailing characters");
  } catch (const std::logic_error&) {
    reportError("unparsable poll reply", *reply);
    return;
  }
  if (sink_)
    sink_->addData(value);
}
