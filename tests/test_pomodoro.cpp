#include <gtest/gtest.h>

#include <chrono>
#include <vector>

#include "pomodoro.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;

class PomodoroTest : public ::testing::Test {
  protected:
    ManualClock clock;
    EventLoop loop{[this] { return clock.steady; }};

    void Tick(std::chrono::milliseconds d) {
        clock.Advance(d);
        loop.RunPending();
    }
};

TEST_F(PomodoroTest, FocusThenBreakCountsOneInterval) {
    Pomodoro pomodoro(loop, 25min, 5min);
    std::vector<int> done;
    std::vector<PomodoroPhase> phases;
    pomodoro.SetOnFocusDone([&](int count) { done.push_back(count); });
    pomodoro.SetOnPhaseChanged([&](PomodoroPhase phase) { phases.push_back(phase); });

    pomodoro.Toggle();
    EXPECT_EQ(pomodoro.Phase(), POMODORO_FOCUS);
    EXPECT_TRUE(pomodoro.IsRunning());

    Tick(25min);
    EXPECT_EQ(pomodoro.Count(), 1);
    EXPECT_EQ(done, std::vector<int>{1});
    EXPECT_EQ(pomodoro.Phase(), POMODORO_BREAK);

    Tick(5min);
    EXPECT_EQ(pomodoro.Phase(), POMODORO_IDLE);
    EXPECT_EQ(phases, (std::vector<PomodoroPhase>{POMODORO_FOCUS, POMODORO_BREAK, POMODORO_IDLE}));
}

TEST_F(PomodoroTest, PauseFreezesRemainingTime) {
    Pomodoro pomodoro(loop, 25min, 5min);
    pomodoro.Toggle();
    Tick(10min);

    pomodoro.Toggle();
    EXPECT_TRUE(pomodoro.IsPaused());
    EXPECT_EQ(pomodoro.Remaining(), std::chrono::milliseconds(15min));

    Tick(60min);
    EXPECT_EQ(pomodoro.Count(), 0);
    EXPECT_EQ(pomodoro.Remaining(), std::chrono::milliseconds(15min));

    pomodoro.Toggle();
    EXPECT_TRUE(pomodoro.IsRunning());
    Tick(15min);
    EXPECT_EQ(pomodoro.Count(), 1);
}

TEST_F(PomodoroTest, StopCancelsTheRunningInterval) {
    Pomodoro pomodoro(loop, 25min, 5min);
    pomodoro.Toggle();
    pomodoro.Stop();
    EXPECT_EQ(pomodoro.Phase(), POMODORO_IDLE);
    Tick(30min);
    EXPECT_EQ(pomodoro.Count(), 0);
}

TEST_F(PomodoroTest, WithoutAutoBreakGoesIdleAfterFocus) {
    Pomodoro pomodoro(loop, 25min, 5min, false);
    pomodoro.Toggle();
    Tick(25min);
    EXPECT_EQ(pomodoro.Count(), 1);
    EXPECT_EQ(pomodoro.Phase(), POMODORO_IDLE);
}
