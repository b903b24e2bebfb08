#include <gtest/gtest.h>
#include "RecordingSink.hpp"
#include "core/MacroConfig.hpp"
#include "core/automation/MacroPlayer.hpp"
#include "core/io/MacroListener.hpp"
#include <chrono>
#include <deque>
#include <functional>
#include <thread>

using namespace hotmacro;
using namespace hotmacro::automation;
using namespace hotmacro::test;
using namespace std::chrono_literals;

namespace {

// Replays a fixed list of events, then reports end of stream
class ScriptedSource : public InputSource {
public:
    explicit ScriptedSource(std::deque<KeyEvent> events) : events(std::move(events)) {}

    std::optional<KeyEvent> ReadEvent() override {
        if (events.empty()) return std::nullopt;
        KeyEvent ev = events.front();
        events.pop_front();
        return ev;
    }

    size_t Remaining() const { return events.size(); }

private:
    std::deque<KeyEvent> events;
};

KeyEvent Down(int code) { return {code, KeyEvent::Down}; }
KeyEvent Up(int code) { return {code, KeyEvent::Up}; }
KeyEvent Repeat(int code) { return {code, KeyEvent::Repeat}; }

bool waitUntil(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 2s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

const char* kHoldShift = R"([
    {"type": "key", "key": "Key.shift", "action": "press"},
    {"type": "wait", "seconds": 10},
    {"type": "key", "key": "Key.shift", "action": "release"}
])";

} // namespace

class MacroListenerTest : public ::testing::Test {
protected:
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();

    std::unique_ptr<MacroPlayer> makePlayer(const MacroConfig& config) {
        return std::make_unique<MacroPlayer>("macro", config.macro, config.loop, sink);
    }
};

TEST_F(MacroListenerTest, TriggerRunsSinglePassMacro) {
    auto config = ParseConfigString(R"({"trigger_hotkey": "<ctrl>+e", "loop": false,
        "macro": [{"type": "key", "key": "a", "action": "tap"}]})");
    auto player = makePlayer(config);
    MacroListener listener(config, *player);

    EXPECT_EQ(listener.OnKeyEvent(Down(KEY_LEFTCTRL)), ListenAction::None);
    EXPECT_FALSE(player->isRunning());
    EXPECT_EQ(listener.OnKeyEvent(Down(KEY_E)), ListenAction::None);
    EXPECT_TRUE(player->isRunning());

    ASSERT_TRUE(player->waitForIdle(2s));
    std::vector<RecordedEvent> expected = {KeyDown(KEY_A), KeyUp(KEY_A), SyncEvent()};
    EXPECT_EQ(sink->Events(), expected);
    EXPECT_TRUE(player->heldKeys().empty());
}

TEST_F(MacroListenerTest, PressedSetFollowsEdgesAndIgnoresRepeat) {
    auto config = ParseConfigString(R"({"trigger_hotkey": "<ctrl>+e"})");
    auto player = makePlayer(config);
    MacroListener listener(config, *player);

    listener.OnKeyEvent(Down(KEY_A));
    listener.OnKeyEvent(Repeat(KEY_B));
    EXPECT_EQ(listener.Pressed(), (PressedSet{KEY_A}));

    listener.OnKeyEvent(Up(KEY_A));
    listener.OnKeyEvent(Up(KEY_Z));
    EXPECT_TRUE(listener.Pressed().empty());
}

TEST_F(MacroListenerTest, CycleModePausesAndResumes) {
    auto config = ParseConfigString(std::string(R"({"trigger_hotkey": "<ctrl>+e", "macro": )") +
                                    kHoldShift + "}");
    auto player = makePlayer(config);
    MacroListener listener(config, *player);

    listener.OnKeyEvent(Down(KEY_RIGHTCTRL));
    listener.OnKeyEvent(Down(KEY_E));
    ASSERT_TRUE(waitUntil([&] { return player->heldKeys().contains(KEY_LEFTSHIFT); }));

    // Held chord auto-repeats without re-firing
    for (int i = 0; i < 10; ++i) {
        listener.OnKeyEvent(Repeat(KEY_E));
    }
    EXPECT_EQ(player->state(), MacroPlayer::State::Running);

    listener.OnKeyEvent(Up(KEY_E));
    listener.OnKeyEvent(Down(KEY_E));
    EXPECT_EQ(player->state(), MacroPlayer::State::Paused);
    EXPECT_TRUE(player->heldKeys().empty());

    listener.OnKeyEvent(Up(KEY_E));
    listener.OnKeyEvent(Down(KEY_E));
    EXPECT_EQ(player->state(), MacroPlayer::State::Running);
    EXPECT_TRUE(player->heldKeys().contains(KEY_LEFTSHIFT));

    player->stop();
    ASSERT_TRUE(player->waitForIdle(2s));
}

TEST_F(MacroListenerTest, ToggleModeStartsAndStops) {
    auto config = ParseConfigString(std::string(R"({"trigger_hotkey": "<alt>+t", "trigger_mode": "toggle", "macro": )") +
                                    kHoldShift + "}");
    auto player = makePlayer(config);
    MacroListener listener(config, *player);

    listener.OnKeyEvent(Down(KEY_LEFTALT));
    listener.OnKeyEvent(Down(KEY_T));
    ASSERT_TRUE(waitUntil([&] { return player->heldKeys().contains(KEY_LEFTSHIFT); }));

    listener.OnKeyEvent(Up(KEY_T));
    listener.OnKeyEvent(Down(KEY_T));
    ASSERT_TRUE(player->waitForIdle(2s));
    EXPECT_TRUE(player->heldKeys().empty());
    EXPECT_EQ(sink->Count(KeyUp(KEY_LEFTSHIFT)), 1u);
}

TEST_F(MacroListenerTest, QuitHotkeyStopsRunAndEndsListening) {
    auto config = ParseConfigString(std::string(R"({"trigger_hotkey": "<ctrl>+e", "quit_hotkey": "<ctrl>+q", "macro": )") +
                                    kHoldShift + "}");
    auto player = makePlayer(config);
    MacroListener listener(config, *player);

    listener.OnKeyEvent(Down(KEY_LEFTCTRL));
    listener.OnKeyEvent(Down(KEY_E));
    ASSERT_TRUE(waitUntil([&] { return player->heldKeys().contains(KEY_LEFTSHIFT); }));
    listener.OnKeyEvent(Up(KEY_E));

    EXPECT_EQ(listener.OnKeyEvent(Down(KEY_Q)), ListenAction::Quit);
    ASSERT_TRUE(player->waitForIdle(2s));
    EXPECT_TRUE(player->heldKeys().empty());
    EXPECT_EQ(sink->Count(KeyUp(KEY_LEFTSHIFT)), 1u);
}

TEST_F(MacroListenerTest, RunReturnsQuitAndStopsReading) {
    auto config = ParseConfigString(R"({"trigger_hotkey": "<ctrl>+e", "quit_hotkey": "<ctrl>+q"})");
    auto player = makePlayer(config);
    MacroListener listener(config, *player);

    ScriptedSource source({Down(KEY_LEFTCTRL), Down(KEY_Q), Up(KEY_Q), Up(KEY_LEFTCTRL)});
    EXPECT_EQ(listener.Run(source), ListenResult::Quit);
    EXPECT_EQ(source.Remaining(), 2u);
}

TEST_F(MacroListenerTest, RunReportsEndOfStream) {
    auto config = ParseConfigString(R"({"trigger_hotkey": "<ctrl>+e",
        "macro": [{"type": "key", "key": "b"}]})");
    auto player = makePlayer(config);
    MacroListener listener(config, *player);

    ScriptedSource source({Down(KEY_LEFTCTRL), Down(KEY_E), Up(KEY_E), Up(KEY_LEFTCTRL)});
    EXPECT_EQ(listener.Run(source), ListenResult::EndOfStream);
    ASSERT_TRUE(player->waitForIdle(2s));
    EXPECT_EQ(sink->Count(KeyDown(KEY_B)), 1u);
}

namespace {

// Counts calls without running anything
class CountingTask : public PausableTask {
public:
    void start() override { ++starts; }
    void stop() override { ++stops; }
    void toggle() override { ++toggles; }
    bool isRunning() const override { return false; }
    std::string getName() const override { return "counting"; }
    void pause() override {}
    void resume() override {}
    void trigger() override { ++triggers; }
    bool isPaused() const override { return false; }

    int starts = 0;
    int stops = 0;
    int toggles = 0;
    int triggers = 0;
};

} // namespace

TEST(MacroListenerDispatchTest, QuitIsCheckedBeforeTrigger) {
    auto config = ParseConfigString(R"({"trigger_hotkey": "<ctrl>+x", "quit_hotkey": "<ctrl>+x"})");
    CountingTask task;
    MacroListener listener(config, task);

    listener.OnKeyEvent(Down(KEY_LEFTCTRL));
    EXPECT_EQ(listener.OnKeyEvent(Down(KEY_X)), ListenAction::Quit);
    EXPECT_EQ(task.stops, 1);
    EXPECT_EQ(task.triggers, 0);
}

TEST(MacroListenerDispatchTest, ModeSelectsTriggerOrToggle) {
    auto cycle = ParseConfigString(R"({"trigger_hotkey": "<f8>"})");
    auto toggle = ParseConfigString(R"({"trigger_hotkey": "<f8>", "trigger_mode": "toggle"})");
    CountingTask cycleTask;
    CountingTask toggleTask;
    MacroListener cycleListener(cycle, cycleTask);
    MacroListener toggleListener(toggle, toggleTask);

    for (int i = 0; i < 3; ++i) {
        cycleListener.OnKeyEvent(Down(KEY_F8));
        cycleListener.OnKeyEvent(Up(KEY_F8));
        toggleListener.OnKeyEvent(Down(KEY_F8));
        toggleListener.OnKeyEvent(Up(KEY_F8));
    }
    EXPECT_EQ(cycleTask.triggers, 3);
    EXPECT_EQ(cycleTask.toggles, 0);
    EXPECT_EQ(toggleTask.toggles, 3);
    EXPECT_EQ(toggleTask.triggers, 0);
}
