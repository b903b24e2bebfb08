#include <gtest/gtest.h>
#include "RecordingSink.hpp"
#include "core/Errors.hpp"
#include "core/automation/StepInterpreter.hpp"
#include <chrono>
#include <limits>
#include <thread>

using namespace hotmacro;
using namespace hotmacro::automation;
using namespace hotmacro::test;
using namespace std::chrono_literals;

class StepInterpreterTest : public ::testing::Test {
protected:
    RecordingSink sink;
    HeldKeys held;
    PlaybackSignals signals;
    StepInterpreter interpreter{sink, held};
};

TEST_F(StepInterpreterTest, KeyTapEmitsDownUpSync) {
    interpreter.execute(KeyStep{KEY_A, KeyAction::Tap}, signals);
    std::vector<RecordedEvent> expected = {KeyDown(KEY_A), KeyUp(KEY_A), SyncEvent()};
    EXPECT_EQ(sink.Events(), expected);
    EXPECT_TRUE(held.empty());
}

TEST_F(StepInterpreterTest, PressAndReleaseUpdateLedger) {
    interpreter.execute(KeyStep{KEY_LEFTSHIFT, KeyAction::Press}, signals);
    EXPECT_TRUE(held.contains(KEY_LEFTSHIFT));

    interpreter.execute(KeyStep{KEY_LEFTSHIFT, KeyAction::Release}, signals);
    EXPECT_TRUE(held.empty());

    std::vector<RecordedEvent> expected = {
        KeyDown(KEY_LEFTSHIFT), SyncEvent(), KeyUp(KEY_LEFTSHIFT), SyncEvent()};
    EXPECT_EQ(sink.Events(), expected);
}

TEST_F(StepInterpreterTest, ComboReleasesInReverseOrder) {
    interpreter.execute(ComboStep{{KEY_LEFTCTRL, KEY_C}}, signals);
    std::vector<RecordedEvent> expected = {
        KeyDown(KEY_LEFTCTRL), KeyDown(KEY_C), KeyUp(KEY_C), KeyUp(KEY_LEFTCTRL), SyncEvent()};
    EXPECT_EQ(sink.Events(), expected);
    EXPECT_TRUE(held.empty());
}

TEST_F(StepInterpreterTest, MouseClickRepeatsAtLeastOnce) {
    interpreter.execute(MouseClickStep{BTN_LEFT, 2}, signals);
    EXPECT_EQ(sink.Count(KeyDown(BTN_LEFT)), 2u);
    EXPECT_EQ(sink.Count(KeyUp(BTN_LEFT)), 2u);
    EXPECT_EQ(sink.Count(SyncEvent()), 2u);

    sink.Clear();
    interpreter.execute(MouseClickStep{BTN_RIGHT, 0}, signals);
    EXPECT_EQ(sink.Count(KeyDown(BTN_RIGHT)), 1u);
}

TEST_F(StepInterpreterTest, MouseButtonPressIsTracked) {
    interpreter.execute(MouseButtonStep{BTN_MIDDLE, KeyAction::Press}, signals);
    EXPECT_TRUE(held.contains(BTN_MIDDLE));
}

TEST_F(StepInterpreterTest, MouseMoveSkipsZeroAxes) {
    interpreter.execute(MouseMoveStep{15, 0, MoveMode::Relative}, signals);
    std::vector<RecordedEvent> expected = {{EV_REL, REL_X, 15}, SyncEvent()};
    EXPECT_EQ(sink.Events(), expected);

    sink.Clear();
    interpreter.execute(MouseMoveStep{-3, 7, MoveMode::Relative}, signals);
    expected = {{EV_REL, REL_X, -3}, {EV_REL, REL_Y, 7}, SyncEvent()};
    EXPECT_EQ(sink.Events(), expected);
}

TEST_F(StepInterpreterTest, AbsoluteMoveIsUnsupported) {
    EXPECT_THROW(interpreter.execute(MouseMoveStep{1, 1, MoveMode::Absolute}, signals),
                 UnsupportedMode);
    EXPECT_TRUE(sink.Events().empty());
}

TEST_F(StepInterpreterTest, ScrollZeroIsNoOp) {
    interpreter.execute(MouseScrollStep{0}, signals);
    EXPECT_TRUE(sink.Events().empty());

    interpreter.execute(MouseScrollStep{-3}, signals);
    std::vector<RecordedEvent> expected = {{EV_REL, REL_WHEEL, -3}, SyncEvent()};
    EXPECT_EQ(sink.Events(), expected);
}

TEST_F(StepInterpreterTest, CancelledStepsEmitNothing) {
    signals.requestCancel();
    interpreter.execute(KeyStep{KEY_A, KeyAction::Press}, signals);
    interpreter.execute(ComboStep{{KEY_LEFTCTRL, KEY_V}}, signals);
    interpreter.execute(MouseScrollStep{1}, signals);
    EXPECT_TRUE(sink.Events().empty());
    EXPECT_TRUE(held.empty());
}

TEST_F(StepInterpreterTest, PrimaryWriteFailurePropagates) {
    sink.FailCode(KEY_Q);
    EXPECT_THROW(interpreter.execute(KeyStep{KEY_Q, KeyAction::Tap}, signals), DeviceWriteError);
}

TEST_F(StepInterpreterTest, WaitDoesNotCountPausedTime) {
    std::thread controller([this] {
        std::this_thread::sleep_for(100ms);
        signals.closeGate();
        std::this_thread::sleep_for(400ms);
        signals.openGate();
    });

    auto start = std::chrono::steady_clock::now();
    interpreter.execute(WaitStep{0.3}, signals);
    auto elapsed = std::chrono::steady_clock::now() - start;
    controller.join();

    EXPECT_GE(elapsed, 650ms);
    EXPECT_FALSE(signals.isCancelled());
}

TEST_F(StepInterpreterTest, WaitEndsEarlyOnCancel) {
    std::thread canceller([this] {
        std::this_thread::sleep_for(50ms);
        signals.requestCancel();
    });
    auto start = std::chrono::steady_clock::now();
    interpreter.execute(WaitStep{30.0}, signals);
    canceller.join();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST_F(StepInterpreterTest, NonPositiveWaitReturnsImmediately) {
    auto start = std::chrono::steady_clock::now();
    interpreter.execute(WaitStep{0.0}, signals);
    interpreter.execute(WaitStep{-1.0}, signals);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 50ms);
}

TEST_F(StepInterpreterTest, NanWaitReturnsImmediately) {
    auto start = std::chrono::steady_clock::now();
    interpreter.execute(WaitStep{std::numeric_limits<double>::quiet_NaN()}, signals);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 50ms);
}

TEST_F(StepInterpreterTest, OversizedWaitStillBlocksUntilCancelled) {
    for (double seconds : {1e10, 1e300, std::numeric_limits<double>::infinity()}) {
        signals.reset();
        std::thread canceller([this] {
            std::this_thread::sleep_for(200ms);
            signals.requestCancel();
        });
        auto start = std::chrono::steady_clock::now();
        interpreter.execute(WaitStep{seconds}, signals);
        auto elapsed = std::chrono::steady_clock::now() - start;
        canceller.join();
        EXPECT_GE(elapsed, 150ms) << "seconds=" << seconds;
    }
}
