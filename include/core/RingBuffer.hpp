#pragma once
/** @file  RingBuffer.hpp
 *  @brief Bounded, thread-safe FIFO used by the logger and the dispatcher channel.
 *
 *  © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace labrun {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Fixed-capacity multi-producer / multi-consumer queue.
 *
 *  * Producers choose between `tryPush` (drop when full) and `pushFor` (wait for room).
 *  * `close()` wakes every waiter; pushes after close fail, pops drain what is left.
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0)
          throw std::invalid_argument("[RingBuffer] capacity must be > 0");
      }

      /// @returns false if full or closed.
      bool tryPush(T item) {
        {
          std::lock_guard<std::mutex> lock(mtx_);
          if (closed_ || items_.size() >= capacity_)
            return false;
          items_.push_back(std::move(item));
        }
        notEmpty_.notify_one();
        return true;
      }

      /// Waits up to \p timeout for a free slot. @returns false on timeout or close.
      bool pushFor(T item, std::chrono::milliseconds timeout) {
        {
          std::unique_lock<std::mutex> lock(mtx_);
          if (!notFull_.wait_for(lock, timeout,
                                 [&] { return closed_ || items_.size() < capacity_; }))
            return false;
          if (closed_)
            return false;
          items_.push_back(std::move(item));
        }
        notEmpty_.notify_one();
        return true;
      }

      std::optional<T> tryPop() {
        std::optional<T> out;
        {
          std::lock_guard<std::mutex> lock(mtx_);
          if (items_.empty())
            return std::nullopt;
          out.emplace(std::move(items_.front()));
          items_.pop_front();
        }
        notFull_.notify_one();
        return out;
      }

      /// Waits up to \p timeout for an item. std::nullopt on timeout or closed+empty.
      std::optional<T> popFor(std::chrono::milliseconds timeout) {
        std::optional<T> out;
        {
          std::unique_lock<std::mutex> lock(mtx_);
          if (!notEmpty_.wait_for(lock, timeout, [&] { return closed_ || !items_.empty(); }))
            return std::nullopt;
          if (items_.empty())
            return std::nullopt;
          out.emplace(std::move(items_.front()));
          items_.pop_front();
        }
        notFull_.notify_one();
        return out;
      }

      /// Removes every queued item matching \p pred, preserving their order.
      template <typename Pred> std::vector<T> extractIf(Pred pred) {
        std::vector<T> taken;
        {
          std::lock_guard<std::mutex> lock(mtx_);
          for (auto it = items_.begin(); it != items_.end();) {
            if (pred(*it)) {
              taken.push_back(std::move(*it));
              it = items_.erase(it);
            } else {
              ++it;
            }
          }
        }
        if (!taken.empty())
          notFull_.notify_all();
        return taken;
      }

      void close() {
        {
          std::lock_guard<std::mutex> lock(mtx_);
          closed_ = true;
        }
        notEmpty_.notify_all();
        notFull_.notify_all();
      }

      std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return items_.size();
      }

      std::size_t capacity() const { return capacity_; }

      //---non-copyable-----------------------------------------
      RingBuffer(const RingBuffer&) = delete;
      RingBuffer& operator=(const RingBuffer&) = delete;

    private:
      const std::size_t capacity_;
      std::deque<T> items_;
      bool closed_{ false };
      mutable std::mutex mtx_;
      std::condition_variable notEmpty_;
      std::condition_variable notFull_;
    };

  } // namespace core
} // namespace labrun
