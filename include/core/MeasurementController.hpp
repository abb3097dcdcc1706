#pragma once

/** @file  MeasurementController.hpp
 *  @brief Run/step state machine gated by the completion gates.
 *
 *  © 2025 Labrun — licensed under MIT.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>

#include "core/CompletionGate.hpp"

namespace labrun {
  namespace core {

    class Logger;

    enum class Notification : std::uint8_t { Prepared, Started, Stopped, Finalized };

    const char* toString(Notification n);

    /**
 * @class MeasurementController
 * @brief Drives a measurement run as a sequence of steps on the controller context.
 *
 *  * Sole reader of the gate counts: a step only ends once StepGate reads zero,
 *    the run only ends once both gates read zero.
 *  * `poll()` re-checks the gates every call, so an acquire that races a check is
 *    picked up on the next poll.
 *  * Listens on both gates for the lifetime of the controller and traces every
 *    held/free transition at debug level.
 */
    class MeasurementController : private GateListener {

    public:
      enum class State : std::uint8_t { Idle, Preparing, Running, Stopping, Finalizing };

      using Callback = std::function<void()>;
      using SubscriptionId = std::uint64_t;

      MeasurementController(CompletionGates& gates, Logger& logger);
      ~MeasurementController() override;

      // ---- Public API ----------------------------------------------------------
      SubscriptionId subscribe(Notification n, Callback cb);
      void unsubscribe(SubscriptionId id);

      bool canStart() const; ///< Idle and RunGate free
      void start(std::size_t steps); ///< throws std::runtime_error if a run cannot start
      void stopStep();               ///< end the running step (limit reached)
      void abort();                  ///< finish after the current step
      void poll();                   ///< advance on gate state; call from the controller loop

      State state() const { return currentState_; }
      std::size_t stepsCompleted() const { return stepsCompleted_; }
      std::size_t stepsPlanned() const { return steps_; }
      bool aborting() const { return aborting_; }
      /// Times a gate returned to zero since construction; any thread.
      std::size_t gateReleases() const { return gateReleases_.load(); }

      MeasurementController(const MeasurementController&) = delete;
      MeasurementController& operator=(const MeasurementController&) = delete;

    private:
      void gateAcquired(const CompletionGate& gate) override;
      void gateReleased(const CompletionGate& gate) override;

      void transitionTo(State next);
      void emit(Notification n);

      CompletionGates& gates_;
      Logger& logger_;

      State currentState_{ State::Idle };
      std::size_t steps_{ 0 };
      std::size_t stepsCompleted_{ 0 };
      bool aborting_{ false };
      std::atomic<std::size_t> gateReleases_{ 0 };

      struct Subscription {
        Notification which;
        Callback cb;
      };
      std::map<SubscriptionId, Subscription> subscribers_;
      SubscriptionId nextId_{ 1 };
    };

    const char* toString(MeasurementController::State s);

  } // namespace core
} // namespace labrun
