#pragma once
/** @file  WorkerContext.hpp
 *  @brief One thread with its own task queue and recurring timers.
 *
 *  © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace labrun {
  namespace core {

    /**
 * @class WorkerContext
 * @brief Event loop hosting exactly one Operator for its lifetime.
 *
 *  * `start()` runs the on-started hook first on the new thread, then serves posted
 *    tasks and due timers until `requestStop()`.
 *  * The on-finished hook runs on the worker before the thread exits; timers pending
 *    at that point are discarded.
 *  * Exceptions escaping a task or timer tick go to the fault handler, never past
 *    the thread boundary.
 */
    class WorkerContext {
    public:
      using Task = std::function<void()>;
      using FaultHandler = std::function<void(std::exception_ptr)>;
      using TimerId = std::uint64_t;
      using Clock = std::chrono::steady_clock;

      explicit WorkerContext(std::string name);
      ~WorkerContext(); ///< requestStop() + join()

      //---public API-------------------------------------------
      void setFaultHandler(FaultHandler handler); ///< call before start()

      /// Launch the thread; throws std::logic_error if already started.
      void start(Task onStarted, Task onFinished);

      void post(Task task); ///< queue for the worker; dropped once stopping

      /// Recurring timer; first tick one \p interval from now. Worker-thread or any-thread safe.
      TimerId startTimer(std::chrono::milliseconds interval, Task tick);
      void stopTimer(TimerId id);

      void requestStop();   ///< cooperative; the current task/tick finishes first

      /// @returns true if the thread has left its loop within \p timeout.
      bool waitForExit(std::chrono::milliseconds timeout);
      void join();

      bool isCurrentThread() const;
      bool started() const { return started_; }
      const std::string& name() const { return name_; }

      //---non-copyable / non-movable---------------------------
      WorkerContext(const WorkerContext&) = delete;
      WorkerContext& operator=(const WorkerContext&) = delete;

    private:
      struct Timer {
        std::chrono::milliseconds interval;
        Clock::time_point due;
        Task tick;
      };

      void loop(Task onStarted);
      void runGuarded(const Task& task);

      std::string name_;
      std::thread thread_;
      bool started_{ false };

      mutable std::mutex mtx_;
      std::condition_variable cv_;     ///< wakes the loop
      std::condition_variable exitCv_; ///< wakes waitForExit()
      std::thread::id workerId_{};
      std::deque<Task> tasks_;
      std::map<TimerId, Timer> timers_;
      TimerId nextTimerId_{ 1 };
      bool stopRequested_{ false };
      bool exited_{ false };
      Task onFinished_{};
      FaultHandler onFault_{};
    };

  } // namespace core
} // namespace labrun
