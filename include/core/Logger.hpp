#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV logger (runs its own worker thread).
 *
 *  © 2025 Labrun — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include "io/FileLogger.hpp"

namespace labrun {
  namespace core {

    enum class LogLevel : std::uint8_t { Debug, Info, Warn, Error };

    const char* toString(LogLevel level);

    /// Case-sensitive parse of "debug" / "info" / "warn" / "error".
    std::optional<LogLevel> parseLogLevel(const std::string& text);

    struct LogEvent {
      std::chrono::system_clock::time_point when;
      LogLevel level{ LogLevel::Info };
      std::string component;
      std::string message;
    };

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    /**
 * @class Logger
 * @brief Shared by every thread of the engine; `log()` never blocks the caller.
 *
 *  * Between `startNewRun()` and `finishRun()` events are queued and written by the
 *    logger thread as `timestamp_ms,level,component,message`.
 *  * Outside a run, events at or above the threshold go straight to std::cerr.
 *  * Warn and Error are always mirrored to std::cerr.
 */
    class Logger {

    public:
      static constexpr std::size_t kDefaultCapacity = 4096;

      explicit Logger(LogLevel threshold = LogLevel::Info,
                      std::size_t capacity = kDefaultCapacity);
      ~Logger(); ///< finishRun()

      // --- public API ---
      /// open \p csvPath (empty = no file) + launch worker thread; throws on open failure
      void startNewRun(const std::string& csvPath);
      void log(LogLevel level, std::string component, std::string message); ///< enqueue event (non-blocking)
      void finishRun();                                                     ///< flush + join worker thread

      void debug(std::string component, std::string message) {
        log(LogLevel::Debug, std::move(component), std::move(message));
      }
      void info(std::string component, std::string message) {
        log(LogLevel::Info, std::move(component), std::move(message));
      }
      void warn(std::string component, std::string message) {
        log(LogLevel::Warn, std::move(component), std::move(message));
      }
      void error(std::string component, std::string message) {
        log(LogLevel::Error, std::move(component), std::move(message));
      }

      void setThreshold(LogLevel level) { threshold_.store(level); }
      LogLevel threshold() const { return threshold_.load(); }

      /// Events lost because the queue was full.
      std::size_t dropped() const { return dropped_.load(); }

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void workerLoop();
      void write(const LogEvent& event);

      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      io::FileLogger csvFile_;
      std::mutex sinkMtx_; ///< guards csvFile_ and std::cerr interleaving
      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::atomic<LogLevel> threshold_;
      std::atomic<std::size_t> dropped_{ 0 };
      const std::size_t capacity_;
    };

  } // namespace core
} // namespace labrun
