/* @file Logger.cpp
 * @brief queue-fed CSV logger with its own writer thread
 *
 * © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <stdexcept>
#include <utility>

// Labrun headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"

using namespace labrun::core;

namespace {

  constexpr std::chrono::milliseconds kPollInterval{ 50 };

  // Quote a CSV field if it contains a separator, quote or line break.
  std::string csvField(const std::string& raw) {
    if (raw.find_first_of(",\"\r\n") == std::string::npos)
      return raw;
    std::string out = "\"";
    for (char c : raw) {
      if (c == '"')
        out += '"';
      out += c;
    }
    out += '"';
    return out;
  }

} // namespace

const char* labrun::core::toString(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "debug";
  case LogLevel::Info:
    return "info";
  case LogLevel::Warn:
    return "warn";
  case LogLevel::Error:
    return "error";
  default:
    return "unknown";
  }
}

std::optional<LogLevel> labrun::core::parseLogLevel(const std::string& text) {
  if (text == "debug")
    return LogLevel::Debug;
  if (text == "info")
    return LogLevel::Info;
  if (text == "warn")
    return LogLevel::Warn;
  if (text == "error")
    return LogLevel::Error;
  return std::nullopt;
}

Logger::Logger(LogLevel threshold, std::size_t capacity)
    : threshold_(threshold), capacity_(capacity) {}

Logger::~Logger() { finishRun(); }

void Logger::startNewRun(const std::string& csvPath) {
  if (running_)
    finishRun();

  if (!csvPath.empty()) {
    std::lock_guard<std::mutex> lock(sinkMtx_);
    if (!csvFile_.open(csvPath))
      throw std::runtime_error("[Logger] cannot open log file: " + csvPath);
    csvFile_.write("timestamp_ms,level,component,message\n");
  }

  buffer_ = std::make_unique<RingBuffer<LogEvent>>(capacity_);
  running_ = true;
  worker_ = std::thread(&Logger::workerLoop, this);
}

void Logger::log(LogLevel level, std::string component, std::string message) {
  if (level < threshold_.load())
    return;

  LogEvent event{ std::chrono::system_clock::now(), level, std::move(component),
                  std::move(message) };

  if (running_.load()) {
    if (!buffer_->tryPush(std::move(event)))
      ++dropped_;
    return;
  }
  write(event);
}

void Logger::finishRun() {
  if (!running_.exchange(false))
    return;

  buffer_->close();
  if (worker_.joinable())
    worker_.join();

  std::lock_guard<std::mutex> lock(sinkMtx_);
  csvFile_.close();
}

void Logger::workerLoop() {
  for (;;) {
    auto event = buffer_->popFor(kPollInterval);
    if (event) {
      write(*event);
      continue;
    }
    if (!running_.load() && buffer_->size() == 0)
      break;
  }
}

void Logger::write(const LogEvent& event) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      event.when.time_since_epoch())
                      .count();

  std::lock_guard<std::mutex> lock(sinkMtx_);
  if (csvFile_.isOpen()) {
    csvFile_.write(std::to_string(ms) + "," + toString(event.level) + "," +
                   csvField(event.component) + "," + csvField(event.message) + "\n");
  }
  if (event.level >= LogLevel::Warn || !running_.load()) {
    std::cerr << "[" << toString(event.level) << "] " << event.component << ": " << event.message
              << "\n";
  }
}
