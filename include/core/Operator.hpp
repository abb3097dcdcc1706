#pragma once
/** @file  Operator.hpp
 *  @brief Unit of background device work with a prepare/finalize lifecycle.
 *
 *  © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <string>

// Third-party headers
#include <nlohmann/json.hpp>

// Labrun headers
#include "core/ErrorEvent.hpp"

namespace labrun {
  namespace core {

    class Dispatcher;
    class Logger;
    class WorkerContext;
    struct OperatorEvent;

    enum class OperatorState : std::uint8_t {
      Created,
      Starting,
      Ready,
      Failed,
      Active,
      Stopping,
      Finalized
    };

    const char* toString(OperatorState s);

    /**
 * @class Operator
 * @brief Base class for every blocking device job (serial handshake, sampling...).
 *
 *  * `prepare()` and `finalize()` run on the hosting WorkerContext, never on the
 *    controller. Faults thrown from either are caught at the worker boundary.
 *  * Arguments are fixed at construction; the prepared result is kept for the
 *    lifetime of the operator.
 *  * Subclasses may touch their own state only from the worker thread.
 */
    class Operator {
    public:
      explicit Operator(nlohmann::json args);
      virtual ~Operator() = default;

      const nlohmann::json& args() const { return args_; }
      OperatorState state() const { return state_.load(); }

      /// Emit a structured error; allowed at any time, from any thread.
      void reportError(std::string message, std::optional<std::string> detail = std::nullopt);

      /// Emit a wrapped fault; allowed at any time, from any thread.
      void reportException(std::exception_ptr fault);

      /// Run \p call on the controller context, in order with this cycle's other events.
      void invokeOnController(std::function<void()> call);

      Operator(const Operator&) = delete;
      Operator& operator=(const Operator&) = delete;

    protected:
      /// Blocking setup; the return value is handed to the device's operatorReady().
      virtual nlohmann::json prepare(const nlohmann::json& args) = 0;

      /// Blocking teardown, called once when the runtime deactivates.
      virtual void finalize() {}

      /// Prepared result; empty until prepare() returned.
      const nlohmann::json& result() const { return result_; }

      WorkerContext& worker() const; ///< throws std::logic_error while unbound
      Logger& logger() const;        ///< throws std::logic_error while unbound
      const std::string& name() const { return binding_.name; }

    private:
      friend class OperatorRuntime;

      struct Binding {
        WorkerContext* worker{ nullptr };
        Dispatcher* dispatcher{ nullptr };
        Logger* logger{ nullptr };
        std::uint64_t target{ 0 };
        std::uint64_t cycle{ 0 };
        std::string name{};
      };

      void bind(Binding binding); ///< runtime, before the worker starts
      void onStarted();           ///< worker thread
      void onFinished();          ///< worker thread
      void emit(OperatorEvent&& event);
      void emitError(ErrorEvent error);

      nlohmann::json args_;
      nlohmann::json result_{};
      std::atomic<OperatorState> state_{ OperatorState::Created };
      Binding binding_{};
    };

  } // namespace core
} // namespace labrun
