/* @file MeasurementController.cpp
 * @brief step sequencing that waits on RunGate/StepGate before moving on
 *
 * © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <utility>
#include <vector>

// Labrun headers
#include "core/CompletionGate.hpp"
#include "core/Logger.hpp"
#include "core/MeasurementController.hpp"

using namespace labrun::core;

const char* labrun::core::toString(Notification n) {
  switch (n) {
  case Notification::Prepared:
    return "prepared";
  case Notification::Started:
    return "started";
  case Notification::Stopped:
    return "stopped";
  case Notification::Finalized:
    return "finalized";
  default:
    return "unknown";
  }
}

const char* labrun::core::toString(MeasurementController::State s) {
  switch (s) {
  case MeasurementController::State::Idle:
    return "IDLE";
  case MeasurementController::State::Preparing:
    return "PREPARING";
  case MeasurementController::State::Running:
    return "RUNNING";
  case MeasurementController::State::Stopping:
    return "STOPPING";
  case MeasurementController::State::Finalizing:
    return "FINALIZING";
  default:
    return "UNKNOWN";
  }
}

MeasurementController::MeasurementController(CompletionGates& gates, Logger& logger)
    : gates_(gates), logger_(logger) {
  gates_.run.setListener(this);
  gates_.step.setListener(this);
}

MeasurementController::~MeasurementController() {
  gates_.run.setListener(nullptr);
  gates_.step.setListener(nullptr);
}

void MeasurementController::gateAcquired(const CompletionGate& gate) {
  logger_.debug("measurement", gate.name() + " held");
}

void MeasurementController::gateReleased(const CompletionGate& gate) {
  ++gateReleases_;
  logger_.debug("measurement", gate.name() + " free");
}

MeasurementController::SubscriptionId MeasurementController::subscribe(Notification n, Callback cb) {
  const SubscriptionId id = nextId_++;
  subscribers_.emplace(id, Subscription{ n, std::move(cb) });
  return id;
}

void MeasurementController::unsubscribe(SubscriptionId id) { subscribers_.erase(id); }

bool MeasurementController::canStart() const {
  return currentState_ == State::Idle && !gates_.run.isAcquired();
}

void MeasurementController::start(std::size_t steps) {
  if (steps == 0)
    throw std::invalid_argument("[MeasurementController] a run needs at least one step");
  if (currentState_ != State::Idle)
    throw std::runtime_error("[MeasurementController] run already in progress");
  if (gates_.run.isAcquired())
    throw std::runtime_error("[MeasurementController] run gate is acquired (" +
                             std::to_string(gates_.run.count()) + " holders)");

  steps_ = steps;
  stepsCompleted_ = 0;
  aborting_ = false;

  transitionTo(State::Preparing);
  emit(Notification::Prepared);
}

void MeasurementController::stopStep() {
  if (currentState_ != State::Running)
    throw std::logic_error("[MeasurementController] no step is running");

  transitionTo(State::Stopping);
  emit(Notification::Stopped);
}

void MeasurementController::abort() {
  if (currentState_ == State::Idle)
    return;
  aborting_ = true;
  if (currentState_ == State::Running)
    stopStep();
}

void MeasurementController::poll() {
  switch (currentState_) {
  case State::Idle:
  case State::Running:
    return;

  case State::Preparing:
    if (gates_.run.isAcquired() || gates_.step.isAcquired())
      return;
    if (aborting_) {
      transitionTo(State::Finalizing);
      return;
    }
    transitionTo(State::Running);
    emit(Notification::Started);
    return;

  case State::Stopping:
    if (gates_.step.isAcquired())
      return;
    ++stepsCompleted_;
    logger_.info("measurement", "step " + std::to_string(stepsCompleted_) + "/" +
                                    std::to_string(steps_) + " done");
    if (aborting_ || stepsCompleted_ >= steps_) {
      transitionTo(State::Finalizing);
      return;
    }
    transitionTo(State::Running);
    emit(Notification::Started);
    return;

  case State::Finalizing:
    if (gates_.run.isAcquired() || gates_.step.isAcquired())
      return;
    transitionTo(State::Idle);
    emit(Notification::Finalized);
    return;
  }
}

void MeasurementController::transitionTo(State next) {
  logger_.debug("measurement",
                std::string(toString(currentState_)) + " -> " + toString(next));
  currentState_ = next;
}

void MeasurementController::emit(Notification n) {
  // copy first: callbacks may subscribe or unsubscribe
  std::vector<Callback> targets;
  for (const auto& [id, sub] : subscribers_) {
    if (sub.which == n)
      targets.push_back(sub.cb);
  }
  for (auto& cb : targets)
    cb();
}
