/* @file CompletionGate.cpp
 * @brief lock-free run/step gate counters
 *
 * © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <utility>

// Labrun headers
#include "core/CompletionGate.hpp"

using namespace labrun::core;

CompletionGate::CompletionGate(std::string name) : name_(std::move(name)) {}

void CompletionGate::acquire() {
  const std::size_t previous = count_.fetch_add(1, std::memory_order_acq_rel);

  if (previous == 0) {
    if (auto* l = listener_.load(std::memory_order_acquire))
      l->gateAcquired(*this);
  }
}

void CompletionGate::release() {
  std::size_t current = count_.load(std::memory_order_acquire);
  do {
    if (current == 0)
      throw GateUnderflowError(name_);
  } while (!count_.compare_exchange_weak(current, current - 1, std::memory_order_acq_rel,
                                         std::memory_order_acquire));

  if (current == 1) {
    if (auto* l = listener_.load(std::memory_order_acquire))
      l->gateReleased(*this);
  }
}
