#pragma once
/** @file  Dispatcher.hpp
 *  @brief Bounded worker -> controller channel and the controller-side dispatch loop.
 *
 *  © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

// Third-party headers
#include <nlohmann/json.hpp>

// Labrun headers
#include "core/ErrorEvent.hpp"

namespace labrun {
  namespace core {

    template <typename T> class RingBuffer;

    /// One message crossing from a worker (or any thread) to the controller.
    struct OperatorEvent {
      enum class Type : std::uint8_t { Ready, Error, Invoke };

      Type type{ Type::Invoke };
      std::uint64_t target{ 0 }; ///< EventTarget id, 0 for plain invokes
      std::uint64_t cycle{ 0 };  ///< activation cycle the event belongs to
      nlohmann::json result{};   ///< Ready payload
      std::optional<ErrorEvent> error{};
      std::function<void()> call{}; ///< Invoke payload
    };

    /// Anything that receives routed events on the controller context.
    class EventTarget {
    public:
      virtual ~EventTarget() = default;
      virtual void handleEvent(OperatorEvent& event) = 0;
    };

    /**
 * @class Dispatcher
 * @brief Many producers, one consumer: whichever thread calls `dispatch*` is the
 *        controller context.
 *
 *  * Producers block up to `postTimeout` for room, then the event is dropped and
 *    `post()` returns false so the caller can log it.
 *  * Events for detached targets are discarded at dispatch time.
 */
    class Dispatcher {
    public:
      static constexpr std::size_t kDefaultCapacity = 256;
      static constexpr std::chrono::milliseconds kDefaultPostTimeout{ 1000 };

      explicit Dispatcher(std::size_t capacity = kDefaultCapacity,
                          std::chrono::milliseconds postTimeout = kDefaultPostTimeout);
      ~Dispatcher();

      //---target registry (controller thread)------------------
      std::uint64_t attach(EventTarget& target);
      void detach(std::uint64_t id);

      //---producers (any thread)-------------------------------
      [[nodiscard]] bool post(OperatorEvent event);
      [[nodiscard]] bool invoke(std::function<void()> call); ///< run \p call on the controller

      //---consumer (controller thread)-------------------------
      /// Deliver everything queued right now; @returns number delivered.
      std::size_t dispatchPending();

      /// Wait up to \p timeout for one event and deliver it.
      bool dispatchOne(std::chrono::milliseconds timeout);

      /// Keep dispatching until \p done returns true or \p timeout elapses.
      bool runUntil(const std::function<bool()>& done, std::chrono::milliseconds timeout);

      /// Dispatch for a fixed wall-clock duration.
      void runFor(std::chrono::milliseconds duration);

      /// Pull queued events addressed to \p target out of the channel, in order.
      std::vector<OperatorEvent> takePendingFor(std::uint64_t target);

      std::size_t pending() const;
      std::size_t capacity() const;

      Dispatcher(const Dispatcher&) = delete;
      Dispatcher& operator=(const Dispatcher&) = delete;

    private:
      void deliver(OperatorEvent& event);

      std::unique_ptr<RingBuffer<OperatorEvent>> channel_;
      std::chrono::milliseconds postTimeout_;

      mutable std::mutex targetsMtx_;
      std::unordered_map<std::uint64_t, EventTarget*> targets_;
      std::uint64_t nextId_{ 1 };
    };

  } // namespace core
} // namespace labrun
