/* @file Operator.cpp
 * @brief worker-side lifecycle driver: prepare/finalize guarded at the thread boundary
 *
 * © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <utility>

// Labrun headers
#include "core/Dispatcher.hpp"
#include "core/Logger.hpp"
#include "core/Operator.hpp"
#include "core/WorkerContext.hpp"

using namespace labrun::core;

const char* labrun::core::toString(OperatorState s) {
  switch (s) {
  case OperatorState::Created:
    return "created";
  case OperatorState::Starting:
    return "starting";
  case OperatorState::Ready:
    return "ready";
  case OperatorState::Failed:
    return "failed";
  case OperatorState::Active:
    return "active";
  case OperatorState::Stopping:
    return "stopping";
  case OperatorState::Finalized:
    return "finalized";
  default:
    return "unknown";
  }
}

Operator::Operator(nlohmann::json args) : args_(std::move(args)) {}

void Operator::reportError(std::string message, std::optional<std::string> detail) {
  emitError(ErrorEvent::structured(FaultKind::Reported, std::move(message), std::move(detail)));
}

void Operator::reportException(std::exception_ptr fault) {
  emitError(ErrorEvent::wrapped(FaultKind::Reported, std::move(fault),
                                "unchecked exception in operator task"));
}

void Operator::invokeOnController(std::function<void()> call) {
  OperatorEvent ev;
  ev.type = OperatorEvent::Type::Invoke;
  ev.call = std::move(call);
  emit(std::move(ev));
}

WorkerContext& Operator::worker() const {
  if (!binding_.worker)
    throw std::logic_error("[Operator] not bound to a worker context");
  return *binding_.worker;
}

Logger& Operator::logger() const {
  if (!binding_.logger)
    throw std::logic_error("[Operator] not bound to a logger");
  return *binding_.logger;
}

void Operator::bind(Binding binding) { binding_ = std::move(binding); }

void Operator::onStarted() {
  state_ = OperatorState::Starting;

  try {
    result_ = prepare(args_);
  } catch (...) {
    state_ = OperatorState::Failed;
    emitError(ErrorEvent::wrapped(FaultKind::Prepare, std::current_exception(),
                                  "unchecked exception in Operator::prepare"));
    // the worker keeps running until the runtime stops it, so finalize() still runs
    return;
  }

  state_ = OperatorState::Ready;

  OperatorEvent ev;
  ev.type = OperatorEvent::Type::Ready;
  ev.result = result_;
  emit(std::move(ev));

  state_ = OperatorState::Active;
}

void Operator::onFinished() {
  if (state_ != OperatorState::Active && state_ != OperatorState::Failed)
    return;

  state_ = OperatorState::Stopping;
  try {
    finalize();
  } catch (...) {
    emitError(ErrorEvent::wrapped(FaultKind::Finalize, std::current_exception(),
                                  "unchecked exception in Operator::finalize"));
  }
  state_ = OperatorState::Finalized;
}

void Operator::emitError(ErrorEvent error) {
  OperatorEvent ev;
  ev.type = OperatorEvent::Type::Error;
  ev.error = std::move(error);
  emit(std::move(ev));
}

void Operator::emit(OperatorEvent&& event) {
  if (!binding_.dispatcher)
    throw std::logic_error("[Operator] event emitted before the operator was activated");

  event.target = binding_.target;
  event.cycle = binding_.cycle;

  const char* kind = event.type == OperatorEvent::Type::Ready   ? "ready event"
                     : event.type == OperatorEvent::Type::Error ? "error event"
                                                                : "invoke";
  const std::string what = event.error ? ": " + event.error->describe() : std::string{};
  if (!binding_.dispatcher->post(std::move(event)))
    binding_.logger->error(binding_.name, std::string("event channel full, dropped ") + kind + what);
}
