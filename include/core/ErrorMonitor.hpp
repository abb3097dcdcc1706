#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Labrun — MIT-licensed.
 */

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace labrun::core {

  /**
 * @class ErrorMonitor
 * @brief Devices call `notifyFailure()`; we call the registered
 *        escalation callback exactly once per unique error.
 *
 * * Thread-safe (mutex-protected containers).
 * * Every failure lands in the history; only the escalation is debounced.
 * * Both the history and the de-dupe list keep the latest `limit` entries, so a
 *   device failing on every poll cannot grow them without bound. A message that
 *   fell out of the de-dupe list escalates again.
 */
  class ErrorMonitor {
  public:
    static constexpr std::size_t kDefaultLimit = 256;

    explicit ErrorMonitor(std::size_t limit = kDefaultLimit);
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a fault to the application layer.
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by devices on fault; will forward to the escalation callback.
    virtual void notifyFailure(const std::string& message);

    /// Snapshot of the retained failures, oldest first.
    std::vector<std::string> history() const;
    /// Every failure reported so far, including those evicted from history().
    std::size_t failureCount() const;

  private:
    void forwardIfNew(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::size_t limit_;
    std::size_t total_{ 0 };
    std::deque<std::string> history_;
    std::deque<std::string> seenOrder_; ///< eviction order for seen_
    std::unordered_set<std::string> seen_; ///< de-dupe list
    mutable std::mutex mtx_;
  };

} // namespace labrun::core
