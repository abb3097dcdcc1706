// Labrun headers
#include "core/WorkerContext.hpp"

// GTest headers
#include <gtest/gtest.h>

// STL headers
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace labrun::test {

  using labrun::core::WorkerContext;
  using namespace std::chrono_literals;

  TEST(worker_context, runs_started_hook_before_posted_tasks) {
    WorkerContext worker("w");
    std::mutex mtx;
    std::vector<std::string> order;
    std::promise<void> done;

    worker.post([&] {
      std::lock_guard<std::mutex> lock(mtx);
      order.push_back("task");
      done.set_value();
    });
    worker.start(
        [&] {
          std::lock_guard<std::mutex> lock(mtx);
          order.push_back("started");
        },
        {});

    ASSERT_EQ(done.get_future().wait_for(2s), std::future_status::ready);
    worker.requestStop();
    worker.join();

    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], "started");
    EXPECT_EQ(order[1], "task");
  }

  TEST(worker_context, tasks_run_on_the_worker_thread) {
    WorkerContext worker("w");
    std::promise<bool> onWorker;
    worker.start({}, {});
    worker.post([&] { onWorker.set_value(worker.isCurrentThread()); });

    auto fut = onWorker.get_future();
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(fut.get());
    EXPECT_FALSE(worker.isCurrentThread());
  }

  TEST(worker_context, finished_hook_runs_once_on_stop) {
    std::atomic<int> finished{ 0 };
    {
      WorkerContext worker("w");
      worker.start({}, [&] { ++finished; });
      worker.requestStop();
      EXPECT_TRUE(worker.waitForExit(2s));
      worker.join();
    }
    EXPECT_EQ(finished.load(), 1);
  }

  TEST(worker_context, start_twice_throws) {
    WorkerContext worker("w");
    worker.start({}, {});
    EXPECT_THROW(worker.start({}, {}), std::logic_error);
  }

  TEST(worker_context, recurring_timer_ticks_until_stopped) {
    WorkerContext worker("w");
    std::atomic<int> ticks{ 0 };
    worker.start({}, {});

    auto id = worker.startTimer(20ms, [&] { ++ticks; });
    std::this_thread::sleep_for(150ms);
    worker.stopTimer(id);
    const int seen = ticks.load();
    std::this_thread::sleep_for(80ms);

    EXPECT_GE(seen, 3);
    EXPECT_LE(seen, 8);
    EXPECT_LE(ticks.load(), seen + 1); // one tick may already be in flight
  }

  TEST(worker_context, timer_interval_must_be_positive) {
    WorkerContext worker("w");
    EXPECT_THROW(worker.startTimer(0ms, [] {}), std::invalid_argument);
  }

  TEST(worker_context, timers_are_discarded_when_the_loop_exits) {
    WorkerContext worker("w");
    std::atomic<int> ticks{ 0 };
    worker.start({}, {});
    worker.startTimer(10ms, [&] { ++ticks; });

    std::this_thread::sleep_for(50ms);
    worker.requestStop();
    ASSERT_TRUE(worker.waitForExit(2s));
    const int seen = ticks.load();
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(ticks.load(), seen);
  }

  TEST(worker_context, faults_go_to_the_fault_handler) {
    WorkerContext worker("w");
    std::promise<std::string> caught;
    worker.setFaultHandler([&](std::exception_ptr fault) {
      try {
        std::rethrow_exception(fault);
      } catch (const std::exception& e) {
        caught.set_value(e.what());
      }
    });
    worker.start({}, {});
    worker.post([] { throw std::runtime_error("tick failed"); });

    auto fut = caught.get_future();
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(fut.get(), "tick failed");

    // the loop survives a faulting task
    std::promise<void> alive;
    worker.post([&] { alive.set_value(); });
    EXPECT_EQ(alive.get_future().wait_for(2s), std::future_status::ready);
  }

  TEST(worker_context, posts_after_stop_are_ignored) {
    WorkerContext worker("w");
    std::atomic<bool> ran{ false };
    worker.start({}, {});
    worker.requestStop();
    ASSERT_TRUE(worker.waitForExit(2s));

    worker.post([&] { ran = true; });
    worker.join();
    EXPECT_FALSE(ran.load());
  }

  TEST(worker_context, wait_for_exit_times_out_on_a_busy_worker) {
    WorkerContext worker("w");
    std::promise<void> release;
    auto gate = release.get_future().share();
    worker.start({}, [gate] { gate.wait(); });

    worker.requestStop();
    EXPECT_FALSE(worker.waitForExit(30ms));
    release.set_value();
    EXPECT_TRUE(worker.waitForExit(2s));
  }

} // namespace labrun::test
