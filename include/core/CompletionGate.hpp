#pragma once
/** @file  CompletionGate.hpp
 *  @brief Process-wide reference counters gating run and step completion.
 *
 *  © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace labrun {
  namespace core {

    class CompletionGate;

    /// Thrown by `CompletionGate::release()` on a zero counter (more releases than acquires).
    class GateUnderflowError : public std::logic_error {
    public:
      explicit GateUnderflowError(const std::string& gateName)
          : std::logic_error("[CompletionGate] " + gateName + " released below zero") {}
    };

    /**
 * @class GateListener
 * @brief Optional observer notified when a gate leaves or returns to zero.
 *
 *  * Called outside any lock, on whichever thread caused the transition.
 */
    class GateListener {
    public:
      virtual ~GateListener() = default;
      virtual void gateAcquired(const CompletionGate&) {} ///< 0 -> 1
      virtual void gateReleased(const CompletionGate&) {} ///< 1 -> 0
    };

    /**
 * @class CompletionGate
 * @brief Named non-negative counter, no owner tracking.
 *
 *  * acquire/release are lock-free (compare-exchange on an atomic).
 *  * The measurement controller reads `count()` as its only completion precondition.
 *  * Non-copyable, non-movable: components hold it by reference.
 */
    class CompletionGate {
    public:
      explicit CompletionGate(std::string name);
      ~CompletionGate() = default;

      //---public API-------------------------------------------
      void acquire();
      void release(); ///< throws GateUnderflowError on a zero counter
      std::size_t count() const noexcept { return count_.load(std::memory_order_acquire); }
      bool isAcquired() const noexcept { return count() > 0; }
      const std::string& name() const { return name_; }

      /// Install or clear (nullptr) the transition listener; not owned.
      void setListener(GateListener* listener) noexcept {
        listener_.store(listener, std::memory_order_release);
      }

      //---non-copyable / non-movable---------------------------
      CompletionGate(const CompletionGate&) = delete;
      CompletionGate& operator=(const CompletionGate&) = delete;
      CompletionGate(CompletionGate&&) = delete;
      CompletionGate& operator=(CompletionGate&&) = delete;

    private:
      std::string name_;
      std::atomic<std::size_t> count_{ 0 };
      std::atomic<GateListener*> listener_{ nullptr };
    };

    /// The two session-wide gates; one instance lives in the Engine.
    struct CompletionGates {
      CompletionGate run{ "RunGate" };   ///< outstanding work for the whole run
      CompletionGate step{ "StepGate" }; ///< outstanding work for the current step
    };

  } // namespace core
} // namespace labrun
