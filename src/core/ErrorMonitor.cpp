/* @file ErrorMonitor.cpp
 * @brief failure history plus de-duplicated escalation
 *
 * © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <utility>

// Labrun headers
#include "core/ErrorMonitor.hpp"

using namespace labrun::core;

ErrorMonitor::ErrorMonitor(std::size_t limit) : limit_(limit) {
  if (limit_ == 0)
    throw std::invalid_argument("[ErrorMonitor] limit must be positive");
}

void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
  std::lock_guard<std::mutex> lock(mtx_);
  escalation_ = std::move(cb);
}

void ErrorMonitor::notifyFailure(const std::string& message) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    ++total_;
    history_.push_back(message);
    if (history_.size() > limit_)
      history_.pop_front();
  }
  forwardIfNew(message);
}

std::vector<std::string> ErrorMonitor::history() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return { history_.begin(), history_.end() };
}

std::size_t ErrorMonitor::failureCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return total_;
}

void ErrorMonitor::forwardIfNew(const std::string& message) {
  std::function<void(const std::string&)> cb;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!seen_.insert(message).second)
      return;
    seenOrder_.push_back(message);
    if (seenOrder_.size() > limit_) {
      seen_.erase(seenOrder_.front());
      seenOrder_.pop_front();
    }
    cb = escalation_;
  }
  // outside the lock so the callback may report further failures
  if (cb)
    cb(message);
}
