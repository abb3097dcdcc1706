/* @file DataChannel.cpp
 * @brief in-process numeric channel
 *
 * © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <utility>

// Labrun headers
#include "core/DataChannel.hpp"

using namespace labrun::core;

NumericChannel::NumericChannel(std::string name) : name_(std::move(name)) {}

void NumericChannel::addData(double value) {
  std::vector<ChannelListener*> listeners;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_)
      return;
    ++count_;
    last_ = value;
    listeners = listeners_;
  }
  for (auto* l : listeners)
    l->dataAdded(name_, value);
}

void NumericChannel::close() {
  std::vector<ChannelListener*> listeners;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_)
      return;
    closed_ = true;
    listeners = listeners_;
  }
  for (auto* l : listeners)
    l->channelClosed(name_);
}

void NumericChannel::subscribe(ChannelListener* listener) {
  if (!listener)
    return;
  std::lock_guard<std::mutex> lock(mtx_);
  if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end())
    listeners_.push_back(listener);
}

void NumericChannel::unsubscribe(ChannelListener* listener) {
  std::lock_guard<std::mutex> lock(mtx_);
  listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

std::size_t NumericChannel::count() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return count_;
}

std::optional<double> NumericChannel::last() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return last_;
}

bool NumericChannel::closed() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return closed_;
}
