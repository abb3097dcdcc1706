/* @file Dispatcher.cpp
 * @brief routes worker events to their targets on the controller context
 *
 * © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>
#include <utility>

// Labrun headers
#include "core/Dispatcher.hpp"
#include "core/RingBuffer.hpp"

using namespace labrun::core;

namespace {
  constexpr std::chrono::milliseconds kRunSlice{ 10 };
}

Dispatcher::Dispatcher(std::size_t capacity, std::chrono::milliseconds postTimeout)
    : channel_(std::make_unique<RingBuffer<OperatorEvent>>(capacity)), postTimeout_(postTimeout) {}

Dispatcher::~Dispatcher() { channel_->close(); }

std::uint64_t Dispatcher::attach(EventTarget& target) {
  std::lock_guard<std::mutex> lock(targetsMtx_);
  const std::uint64_t id = nextId_++;
  targets_.emplace(id, &target);
  return id;
}

void Dispatcher::detach(std::uint64_t id) {
  std::lock_guard<std::mutex> lock(targetsMtx_);
  targets_.erase(id);
}

bool Dispatcher::post(OperatorEvent event) {
  return channel_->pushFor(std::move(event), postTimeout_);
}

bool Dispatcher::invoke(std::function<void()> call) {
  if (!call)
    throw std::invalid_argument("[Dispatcher] invoke needs a callable");

  OperatorEvent ev;
  ev.type = OperatorEvent::Type::Invoke;
  ev.call = std::move(call);
  return post(std::move(ev));
}

std::size_t Dispatcher::dispatchPending() {
  std::size_t delivered = 0;
  // bounded by what is queued now, so a handler that re-posts cannot spin us forever
  for (std::size_t budget = channel_->size(); budget > 0; --budget) {
    auto ev = channel_->tryPop();
    if (!ev)
      break;
    deliver(*ev);
    ++delivered;
  }
  return delivered;
}

bool Dispatcher::dispatchOne(std::chrono::milliseconds timeout) {
  auto ev = channel_->popFor(timeout);
  if (!ev)
    return false;
  deliver(*ev);
  return true;
}

bool Dispatcher::runUntil(const std::function<bool()>& done, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!done()) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline)
      return false;
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    dispatchOne(std::min(left, kRunSlice));
  }
  return true;
}

void Dispatcher::runFor(std::chrono::milliseconds duration) {
  const auto deadline = std::chrono::steady_clock::now() + duration;
  for (;;) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline)
      break;
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    dispatchOne(std::min(left, kRunSlice));
  }
}

std::vector<OperatorEvent> Dispatcher::takePendingFor(std::uint64_t target) {
  return channel_->extractIf([target](const OperatorEvent& ev) { return ev.target == target; });
}

std::size_t Dispatcher::pending() const { return channel_->size(); }

std::size_t Dispatcher::capacity() const { return channel_->capacity(); }

void Dispatcher::deliver(OperatorEvent& event) {
  if (event.type == OperatorEvent::Type::Invoke && event.target == 0) {
    if (event.call)
      event.call();
    return;
  }

  EventTarget* target = nullptr;
  {
    std::lock_guard<std::mutex> lock(targetsMtx_);
    auto it = targets_.find(event.target);
    if (it != targets_.end())
      target = it->second;
  }
  if (target)
    target->handleEvent(event);
}
