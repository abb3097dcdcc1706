/* @file WorkerContext.cpp
 * @brief single-thread event loop with posted tasks and recurring timers
 *
 * © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <stdexcept>
#include <utility>

// Labrun headers
#include "core/WorkerContext.hpp"

using namespace labrun::core;

WorkerContext::WorkerContext(std::string name) : name_(std::move(name)) {}

WorkerContext::~WorkerContext() {
  requestStop();
  join();
}

void WorkerContext::setFaultHandler(FaultHandler handler) {
  std::lock_guard<std::mutex> lock(mtx_);
  onFault_ = std::move(handler);
}

void WorkerContext::start(Task onStarted, Task onFinished) {
  if (started_)
    throw std::logic_error("[WorkerContext] " + name_ + " already started");

  {
    std::lock_guard<std::mutex> lock(mtx_);
    onFinished_ = std::move(onFinished);
  }
  started_ = true;
  thread_ = std::thread(&WorkerContext::loop, this, std::move(onStarted));
}

void WorkerContext::post(Task task) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stopRequested_ || exited_)
      return;
    tasks_.push_back(std::move(task));
  }
  cv_.notify_one();
}

WorkerContext::TimerId WorkerContext::startTimer(std::chrono::milliseconds interval, Task tick) {
  if (interval.count() <= 0)
    throw std::invalid_argument("[WorkerContext] timer interval must be positive");

  TimerId id = 0;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    id = nextTimerId_++;
    timers_.emplace(id, Timer{ interval, Clock::now() + interval, std::move(tick) });
  }
  cv_.notify_one();
  return id;
}

void WorkerContext::stopTimer(TimerId id) {
  std::lock_guard<std::mutex> lock(mtx_);
  timers_.erase(id);
}

void WorkerContext::requestStop() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    stopRequested_ = true;
  }
  cv_.notify_one();
}

bool WorkerContext::waitForExit(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mtx_);
  if (!started_)
    return true;
  return exitCv_.wait_for(lock, timeout, [&] { return exited_; });
}

void WorkerContext::join() {
  if (thread_.joinable()) {
    if (std::this_thread::get_id() == thread_.get_id())
      throw std::logic_error("[WorkerContext] " + name_ + " cannot join itself");
    thread_.join();
  }
}

bool WorkerContext::isCurrentThread() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return workerId_ == std::this_thread::get_id();
}

void WorkerContext::runGuarded(const Task& task) {
  if (!task)
    return;
  try {
    task();
  } catch (...) {
    FaultHandler handler;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      handler = onFault_;
    }
    if (handler)
      handler(std::current_exception());
    else
      std::cerr << "[WorkerContext] " << name_ << ": unhandled fault in worker task\n";
  }
}

void WorkerContext::loop(Task onStarted) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    workerId_ = std::this_thread::get_id();
  }

  runGuarded(onStarted);

  std::unique_lock<std::mutex> lock(mtx_);
  for (;;) {
    if (stopRequested_)
      break;

    if (!tasks_.empty()) {
      Task task = std::move(tasks_.front());
      tasks_.pop_front();
      lock.unlock();
      runGuarded(task);
      lock.lock();
      continue;
    }

    auto next = timers_.end();
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
      if (next == timers_.end() || it->second.due < next->second.due)
        next = it;
    }

    if (next == timers_.end()) {
      cv_.wait(lock);
      continue;
    }

    const auto now = Clock::now();
    if (next->second.due > now) {
      cv_.wait_until(lock, next->second.due);
      continue;
    }

    // fixed-rate schedule; missed periods are skipped rather than replayed
    Timer& t = next->second;
    t.due += t.interval;
    if (t.due <= now)
      t.due = now + t.interval;

    Task tick = t.tick;
    lock.unlock();
    runGuarded(tick);
    lock.lock();
  }

  Task finish = std::move(onFinished_);
  tasks_.clear();
  timers_.clear();
  lock.unlock();

  runGuarded(finish);

  lock.lock();
  exited_ = true;
  lock.unlock();
  exitCv_.notify_all();
}
