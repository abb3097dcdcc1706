// Labrun headers
#include "core/CompletionGate.hpp"
#include "core/Logger.hpp"
#include "core/MeasurementController.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL headers
#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace labrun::test {

  using labrun::core::CompletionGates;
  using labrun::core::Logger;
  using labrun::core::LogLevel;
  using labrun::core::MeasurementController;
  using labrun::core::Notification;
  using State = labrun::core::MeasurementController::State;

  class MeasurementControllerTest : public ::testing::Test {
  protected:
    void SetUp() override {
      for (auto n : { Notification::Prepared, Notification::Started, Notification::Stopped,
                      Notification::Finalized })
        controller.subscribe(n, [this, n] { seen.push_back(core::toString(n)); });
    }

    Logger logger{ LogLevel::Error };
    CompletionGates gates;
    MeasurementController controller{ gates, logger };
    std::vector<std::string> seen;
  };

  TEST_F(MeasurementControllerTest, single_step_run_without_holders) {
    ASSERT_TRUE(controller.canStart());
    controller.start(1);
    EXPECT_EQ(controller.state(), State::Preparing);

    controller.poll();
    EXPECT_EQ(controller.state(), State::Running);

    controller.stopStep();
    controller.poll();
    EXPECT_EQ(controller.state(), State::Finalizing);
    controller.poll();
    EXPECT_EQ(controller.state(), State::Idle);

    EXPECT_EQ(controller.stepsCompleted(), 1u);
    EXPECT_THAT(seen, testing::ElementsAre("prepared", "started", "stopped", "finalized"));
  }

  TEST_F(MeasurementControllerTest, refuses_to_start_while_the_run_gate_is_held) {
    gates.run.acquire();
    EXPECT_FALSE(controller.canStart());
    EXPECT_THROW(controller.start(1), std::runtime_error);
    EXPECT_EQ(controller.state(), State::Idle);
    gates.run.release();

    EXPECT_TRUE(controller.canStart());
  }

  TEST_F(MeasurementControllerTest, rejects_zero_steps_and_double_start) {
    EXPECT_THROW(controller.start(0), std::invalid_argument);
    controller.start(2);
    EXPECT_THROW(controller.start(1), std::runtime_error);
  }

  TEST_F(MeasurementControllerTest, stop_step_outside_running_is_a_logic_error) {
    EXPECT_THROW(controller.stopStep(), std::logic_error);
    controller.start(1);
    EXPECT_THROW(controller.stopStep(), std::logic_error);
  }

  TEST_F(MeasurementControllerTest, preparing_waits_for_devices_acquired_on_prepared) {
    controller.subscribe(Notification::Prepared, [this] { gates.run.acquire(); });
    controller.start(1);

    controller.poll();
    controller.poll();
    EXPECT_EQ(controller.state(), State::Preparing);

    gates.run.release();
    controller.poll();
    EXPECT_EQ(controller.state(), State::Running);
  }

  TEST_F(MeasurementControllerTest, step_ends_only_once_the_step_gate_is_free) {
    controller.subscribe(Notification::Started, [this] { gates.step.acquire(); });
    controller.start(1);
    controller.poll();
    ASSERT_EQ(controller.state(), State::Running);

    controller.stopStep();
    controller.poll();
    EXPECT_EQ(controller.state(), State::Stopping);
    EXPECT_EQ(controller.stepsCompleted(), 0u);

    gates.step.release();
    controller.poll();
    EXPECT_EQ(controller.state(), State::Finalizing);
    EXPECT_EQ(controller.stepsCompleted(), 1u);
  }

  TEST_F(MeasurementControllerTest, finalizing_waits_for_both_gates) {
    controller.start(1);
    controller.poll();
    controller.stopStep();
    gates.run.acquire(); // e.g. a device re-preparing late in the run
    controller.poll();
    ASSERT_EQ(controller.state(), State::Finalizing);

    controller.poll();
    EXPECT_EQ(controller.state(), State::Finalizing);
    gates.run.release();
    controller.poll();
    EXPECT_EQ(controller.state(), State::Idle);
  }

  TEST_F(MeasurementControllerTest, runs_every_planned_step) {
    controller.start(3);
    for (int i = 0; i < 3; ++i) {
      controller.poll();
      ASSERT_EQ(controller.state(), State::Running);
      controller.stopStep();
    }
    controller.poll();
    controller.poll();

    EXPECT_EQ(controller.state(), State::Idle);
    EXPECT_EQ(controller.stepsCompleted(), 3u);
    EXPECT_EQ(std::count(seen.begin(), seen.end(), "started"), 3);
  }

  TEST_F(MeasurementControllerTest, abort_finishes_after_the_current_step) {
    controller.start(5);
    controller.poll();
    controller.abort();
    EXPECT_TRUE(controller.aborting());
    EXPECT_EQ(controller.state(), State::Stopping);

    controller.poll();
    controller.poll();
    EXPECT_EQ(controller.state(), State::Idle);
    EXPECT_EQ(controller.stepsCompleted(), 1u);
  }

  TEST_F(MeasurementControllerTest, counts_gates_returning_to_zero) {
    gates.run.acquire();
    gates.run.acquire();
    gates.run.release();
    EXPECT_EQ(controller.gateReleases(), 0u);
    gates.run.release();
    gates.step.acquire();
    gates.step.release();
    EXPECT_EQ(controller.gateReleases(), 2u);
  }

  TEST_F(MeasurementControllerTest, unsubscribed_callbacks_are_not_called) {
    int calls = 0;
    auto id = controller.subscribe(Notification::Started, [&calls] { ++calls; });
    controller.unsubscribe(id);

    controller.start(1);
    controller.poll();
    EXPECT_EQ(calls, 0);
  }

} // namespace labrun::test
