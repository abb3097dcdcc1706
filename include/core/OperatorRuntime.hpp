#pragma once
/** @file  OperatorRuntime.hpp
 *  @brief Device-side adapter: one Operator on one worker per activation cycle.
 *
 *  © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

// Third-party headers
#include <nlohmann/json.hpp>

// Labrun headers
#include "core/Dispatcher.hpp"
#include "core/Operator.hpp"

namespace labrun {
  namespace core {

    class CompletionGate;
    class Logger;
    class OperatorHost;
    class WorkerContext;

    struct RuntimeOptions {
      /// deactivate() waits without limit; a warning is logged every time this elapses.
      std::chrono::milliseconds finalizeWarnAfter{ 5000 };
    };

    /**
 * @class OperatorRuntime
 * @brief Runs the RunGate acquire/release protocol around an Operator's worker.
 *
 *  * Controller-thread object: every public method and every host callback runs
 *    on the thread that dispatches the Dispatcher.
 *  * Ready and fatal error are mutually exclusive and fire at most once per cycle.
 *  * Errors after readiness are informational; the device stays usable.
 *  * At most one live worker per runtime; `activate()` on a live cycle throws.
 */
    class OperatorRuntime : public EventTarget {
    public:
      using Factory = std::function<std::unique_ptr<Operator>(nlohmann::json args)>;
      using Task = std::function<void(Operator&)>;

      enum class Phase : std::uint8_t { Idle, Starting, Ready, Failed, Stopping, Finalized };

      OperatorRuntime(std::string name, OperatorHost& host, Dispatcher& dispatcher,
                      CompletionGate& runGate, Logger& logger, RuntimeOptions options = {});
      ~OperatorRuntime() override; ///< deactivate() + detach

      //---public API-------------------------------------------
      /// Acquire RunGate, build the operator, start its worker. Never blocks.
      void activate(const Factory& factory, nlohmann::json args);

      /// Stop the worker (finalize), wait for it, settle the gate. No-op without a live cycle.
      void deactivate();

      /// Run \p task against the operator on its worker thread.
      void post(Task task);

      bool preparedCompleted() const { return preparedCompleted_; }
      bool isActive() const { return static_cast<bool>(worker_); }
      Phase phase() const { return phase_; }
      std::uint64_t cycle() const { return cycle_; }
      const std::string& name() const { return name_; }

      void handleEvent(OperatorEvent& event) override;

      OperatorRuntime(const OperatorRuntime&) = delete;
      OperatorRuntime& operator=(const OperatorRuntime&) = delete;

    private:
      void onReady(const nlohmann::json& result, bool notifyHost);
      void onError(const ErrorEvent& error);
      void releaseGate();
      void route(OperatorEvent& event, bool notifyHost);

      std::string name_;
      OperatorHost& host_;
      Dispatcher& dispatcher_;
      CompletionGate& runGate_;
      Logger& logger_;
      RuntimeOptions options_;
      std::uint64_t targetId_{ 0 };

      std::uint64_t cycle_{ 0 };
      std::unique_ptr<Operator> operator_; ///< declared before worker_: outlives it on reset
      std::unique_ptr<WorkerContext> worker_;
      Phase phase_{ Phase::Idle };
      bool preparedCompleted_{ false };
      bool gateHeld_{ false };
      bool tearingDown_{ false };
    };

    const char* toString(OperatorRuntime::Phase p);

  } // namespace core
} // namespace labrun
