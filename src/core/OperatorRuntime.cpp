/* @file OperatorRuntime.cpp
 * @brief RunGate protocol and ready/error marshalling for one device's operator
 *
 * © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <stdexcept>
#include <utility>

// Labrun headers
#include "core/CompletionGate.hpp"
#include "core/Logger.hpp"
#include "core/OperatorHost.hpp"
#include "core/OperatorRuntime.hpp"
#include "core/WorkerContext.hpp"

using namespace labrun::core;

const char* labrun::core::toString(OperatorRuntime::Phase p) {
  switch (p) {
  case OperatorRuntime::Phase::Idle:
    return "idle";
  case OperatorRuntime::Phase::Starting:
    return "starting";
  case OperatorRuntime::Phase::Ready:
    return "ready";
  case OperatorRuntime::Phase::Failed:
    return "failed";
  case OperatorRuntime::Phase::Stopping:
    return "stopping";
  case OperatorRuntime::Phase::Finalized:
    return "finalized";
  default:
    return "unknown";
  }
}

OperatorRuntime::OperatorRuntime(std::string name, OperatorHost& host, Dispatcher& dispatcher,
                                 CompletionGate& runGate, Logger& logger, RuntimeOptions options)
    : name_(std::move(name)), host_(host), dispatcher_(dispatcher), runGate_(runGate),
      logger_(logger), options_(options) {
  targetId_ = dispatcher_.attach(*this);
}

OperatorRuntime::~OperatorRuntime() {
  try {
    deactivate();
  } catch (const std::exception& e) {
    std::cerr << "[OperatorRuntime] " << name_ << ": teardown failed: " << e.what() << "\n";
  }
  dispatcher_.detach(targetId_);
}

void OperatorRuntime::activate(const Factory& factory, nlohmann::json args) {
  if (worker_)
    throw std::logic_error("[OperatorRuntime] " + name_ + " is already active");
  if (!factory)
    throw std::invalid_argument("[OperatorRuntime] " + name_ + ": empty operator factory");

  runGate_.acquire();
  gateHeld_ = true;

  ++cycle_;
  preparedCompleted_ = false;
  phase_ = Phase::Starting;

  try {
    operator_ = factory(std::move(args));
    if (!operator_)
      throw std::invalid_argument("[OperatorRuntime] " + name_ + ": factory returned no operator");
  } catch (...) {
    operator_.reset();
    phase_ = Phase::Finalized;
    releaseGate();
    throw;
  }

  worker_ = std::make_unique<WorkerContext>(name_);

  Operator* op = operator_.get();
  op->bind(Operator::Binding{ worker_.get(), &dispatcher_, &logger_, targetId_, cycle_, name_ });
  worker_->setFaultHandler([op](std::exception_ptr fault) { op->reportException(fault); });
  worker_->start([op] { op->onStarted(); }, [op] { op->onFinished(); });

  logger_.debug(name_, "activated cycle " + std::to_string(cycle_));
}

void OperatorRuntime::deactivate() {
  if (!worker_ || tearingDown_)
    return;

  tearingDown_ = true;
  if (phase_ != Phase::Failed)
    phase_ = Phase::Stopping;

  worker_->requestStop();
  while (!worker_->waitForExit(options_.finalizeWarnAfter)) {
    logger_.warn(name_, "finalize still running after " +
                            std::to_string(options_.finalizeWarnAfter.count()) + " ms");
  }
  worker_->join();

  // the worker is gone; whatever it left in the channel for this cycle is settled here
  for (auto& ev : dispatcher_.takePendingFor(targetId_)) {
    if (ev.cycle == cycle_)
      route(ev, false);
  }

  if (gateHeld_) {
    logger_.warn(name_, "deactivated before the operator settled, releasing run gate");
    releaseGate();
  }

  worker_.reset();
  operator_.reset();
  phase_ = Phase::Finalized;
  tearingDown_ = false;

  logger_.debug(name_, "finalized cycle " + std::to_string(cycle_));
}

void OperatorRuntime::post(Task task) {
  if (!worker_ || tearingDown_) {
    logger_.warn(name_, "task posted without a live operator, ignored");
    return;
  }
  Operator* op = operator_.get();
  worker_->post([op, task = std::move(task)] { task(*op); });
}

void OperatorRuntime::handleEvent(OperatorEvent& event) {
  if (!worker_ || event.cycle != cycle_) {
    logger_.debug(name_, "stale event for cycle " + std::to_string(event.cycle) + " dropped");
    return;
  }
  route(event, true);
}

void OperatorRuntime::route(OperatorEvent& event, bool notifyHost) {
  switch (event.type) {
  case OperatorEvent::Type::Ready:
    onReady(event.result, notifyHost);
    break;
  case OperatorEvent::Type::Error:
    if (event.error)
      onError(*event.error);
    break;
  case OperatorEvent::Type::Invoke:
    if (event.call)
      event.call();
    break;
  }
}

void OperatorRuntime::onReady(const nlohmann::json& result, bool notifyHost) {
  if (phase_ == Phase::Failed || preparedCompleted_) {
    logger_.debug(name_, "ready after a fatal error ignored");
    return;
  }

  preparedCompleted_ = true;
  if (phase_ == Phase::Starting)
    phase_ = Phase::Ready;

  if (notifyHost) {
    try {
      host_.operatorReady(result);
    } catch (...) {
      releaseGate();
      throw;
    }
  }
  releaseGate();

  logger_.info(name_, "operator ready");
}

void OperatorRuntime::onError(const ErrorEvent& error) {
  const bool fatal = !preparedCompleted_ && phase_ != Phase::Failed;
  logger_.log(fatal ? LogLevel::Error : LogLevel::Warn, name_, error.describe());

  if (error.isWrapped())
    host_.showException(error.fault());
  else
    host_.showError(error.message(), error.detail());

  if (!fatal)
    return;

  phase_ = Phase::Failed;
  releaseGate();

  if (!tearingDown_)
    host_.kill();
}

void OperatorRuntime::releaseGate() {
  if (!gateHeld_)
    return;
  gateHeld_ = false;
  runGate_.release();
}
