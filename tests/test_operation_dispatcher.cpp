#include <gtest/gtest.h>
#include "control/OperationDispatcher.hpp"
#include "fakes/FakeConsole.hpp"

using Kind = OperationDispatcher::Outcome::Kind;

class OperationDispatcherTest : public ::testing::Test {
protected:
    BridgeConfig  config = testConfig();
    ToggleState   state;
    FakeTransport transport;

    InputEvent press(int code, int value = 127,
                     std::chrono::steady_clock::time_point at =
                         std::chrono::steady_clock::now()) {
        InputEvent ev;
        ev.sourceCode = code;
        ev.value      = value;
        ev.receivedAt = at;
        return ev;
    }
};

TEST_F(OperationDispatcherTest, UnmappedCodeIsNoOp) {
    OperationDispatcher d(config, state, transport);
    auto out = d.handle(press(99));

    EXPECT_EQ(out.kind, Kind::Unmapped);
    EXPECT_FALSE(out.operation.has_value());
    EXPECT_TRUE(transport.sent.empty());
}

TEST_F(OperationDispatcherTest, ReleaseIgnoredWithPressPolarity) {
    OperationDispatcher d(config, state, transport);
    auto out = d.handle(press(22, 0));

    EXPECT_EQ(out.kind, Kind::NotTriggered);
    EXPECT_FALSE(state.get(controllable::kFxMute));
    EXPECT_TRUE(transport.sent.empty());
}

TEST_F(OperationDispatcherTest, ReleasePolarityFiresOnRelease) {
    config.buttons[2].trigger = TriggerPolarity::Release;
    OperationDispatcher d(config, state, transport);

    EXPECT_EQ(d.handle(press(22, 127)).kind, Kind::NotTriggered);
    EXPECT_EQ(d.handle(press(22, 0)).kind, Kind::Sent);
    EXPECT_TRUE(state.get(controllable::kFxMute));
}

TEST_F(OperationDispatcherTest, ThresholdIsExclusive) {
    config.buttons[2].threshold = 64;
    OperationDispatcher d(config, state, transport);

    EXPECT_EQ(d.handle(press(22, 64)).kind, Kind::NotTriggered);
    EXPECT_EQ(d.handle(press(22, 65)).kind, Kind::Sent);
}

TEST_F(OperationDispatcherTest, RecordingPulsesEveryPress) {
    OperationDispatcher d(config, state, transport);

    auto first  = d.handle(press(20));
    auto second = d.handle(press(20));

    ASSERT_TRUE(first.operation.has_value());
    ASSERT_TRUE(std::holds_alternative<PulseKey>(*first.operation));
    EXPECT_EQ(std::get<PulseKey>(*first.operation).code, 0x30);
    ASSERT_TRUE(std::holds_alternative<PulseKey>(*second.operation));

    ASSERT_EQ(transport.sent.size(), 2u);
    EXPECT_EQ(transport.sent[0], transport.sent[1]);
    EXPECT_FALSE(state.get(controllable::kRecording));
}

TEST_F(OperationDispatcherTest, MonitorLevelAlternatesPresets) {
    OperationDispatcher d(config, state, transport);

    auto high = d.handle(press(21));
    auto low  = d.handle(press(21));

    EXPECT_EQ(std::get<SetLevel>(*high.operation).value, 100);
    EXPECT_EQ(std::get<SetLevel>(*low.operation).value, 60);
    EXPECT_EQ(std::get<SetLevel>(*low.operation).channelRef, "aux_send_level");
    EXPECT_EQ(transport.sent[0][3].bytes[2], 100);
    EXPECT_EQ(transport.sent[1][3].bytes[2], 60);
}

TEST_F(OperationDispatcherTest, FxMuteTogglesGroup) {
    OperationDispatcher d(config, state, transport);

    auto on  = std::get<SetGroupState>(*d.handle(press(22)).operation);
    auto off = std::get<SetGroupState>(*d.handle(press(22)).operation);

    EXPECT_EQ(on.groupId, 1);
    EXPECT_TRUE(on.muted);
    EXPECT_FALSE(off.muted);
    EXPECT_FALSE(state.get(controllable::kFxMute));
}

TEST_F(OperationDispatcherTest, BreakModeSelectsSceneForNewState) {
    OperationDispatcher d(config, state, transport);

    auto active = std::get<ApplyScene>(*d.handle(press(23)).operation);
    EXPECT_EQ(active.muteGroups, (std::set<int>{1, 2, 4}));
    EXPECT_EQ(active.unmuteGroups, (std::set<int>{3}));
    EXPECT_EQ(transport.sent[0].size(), 16u);

    auto inactive = std::get<ApplyScene>(*d.handle(press(23)).operation);
    EXPECT_EQ(inactive.muteGroups, (std::set<int>{3}));
    EXPECT_EQ(inactive.unmuteGroups, (std::set<int>{1, 2, 4}));
}

TEST_F(OperationDispatcherTest, NoRollbackWhenNotConnected) {
    transport.nextStatus = SendStatus::NotConnected;
    OperationDispatcher d(config, state, transport);

    auto out = d.handle(press(22));

    EXPECT_EQ(out.kind, Kind::SendFailed);
    EXPECT_EQ(out.sendStatus, SendStatus::NotConnected);
    EXPECT_TRUE(state.get(controllable::kFxMute));
}

TEST_F(OperationDispatcherTest, DebounceDropsRepeatsInWindow) {
    config.input.debounceWindow = std::chrono::milliseconds(100);
    OperationDispatcher d(config, state, transport);

    auto t0 = std::chrono::steady_clock::now();
    EXPECT_EQ(d.handle(press(22, 127, t0)).kind, Kind::Sent);
    EXPECT_EQ(d.handle(press(22, 127, t0 + std::chrono::milliseconds(20))).kind,
              Kind::Debounced);
    EXPECT_TRUE(state.get(controllable::kFxMute));

    EXPECT_EQ(d.handle(press(22, 127, t0 + std::chrono::milliseconds(150))).kind,
              Kind::Sent);
    EXPECT_FALSE(state.get(controllable::kFxMute));
    EXPECT_EQ(transport.sent.size(), 2u);
}

TEST_F(OperationDispatcherTest, DebounceIsPerSourceCode) {
    config.input.debounceWindow = std::chrono::milliseconds(100);
    OperationDispatcher d(config, state, transport);

    auto t0 = std::chrono::steady_clock::now();
    EXPECT_EQ(d.handle(press(22, 127, t0)).kind, Kind::Sent);
    EXPECT_EQ(d.handle(press(21, 127, t0)).kind, Kind::Sent);
}

TEST_F(OperationDispatcherTest, WithoutDebounceDuplicatesBothToggle) {
    OperationDispatcher d(config, state, transport);

    auto t0 = std::chrono::steady_clock::now();
    d.handle(press(22, 127, t0));
    d.handle(press(22, 127, t0));

    EXPECT_EQ(transport.sent.size(), 2u);
    EXPECT_FALSE(state.get(controllable::kFxMute));
}

TEST_F(OperationDispatcherTest, MissingAddressRejectedAtConstruction) {
    config.behaviors.fxMuteGroup = 7;
    EXPECT_THROW({ OperationDispatcher d(config, state, transport); }, ConfigError);
}

TEST_F(OperationDispatcherTest, UnknownControllableRejectedAtConstruction) {
    config.buttons.push_back({30, "talkback"});
    EXPECT_THROW({ OperationDispatcher d(config, state, transport); }, ConfigError);
}
