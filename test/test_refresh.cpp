/*
 * Unit tests for the per-device refresh state machine
 * Attempt budgets, retry pacing, and the notifications each outcome emits
 */

#include <gtest/gtest.h>
#include <monitor/refresh.hpp>
#include "fakes/fake_transport.hpp"

using namespace battwatch;
using namespace battwatch::test;
using std::chrono::milliseconds;

class RefreshTest : public ::testing::Test {
protected:
    void SetUp() override {
        options.retry.sleep = [this](milliseconds d) { sleeps.push_back(d); };
    }

    RegisteredDevice device(bool disconnected, TelemetrySnapshot telemetry = {}) {
        RegisteredDevice d;
        d.device = {ID, "Headphones"};
        d.telemetry = std::move(telemetry);
        d.disconnected = disconnected;
        return d;
    }

    RegisteredDevice refresh(const RegisteredDevice& previous) {
        return refresh_device(previous, transport, notifier, options);
    }

    static constexpr const char* ID = "11:22:33:44:55:66";

    FakeTransport transport;
    RecordingNotifier notifier;
    RefreshOptions options;
    std::vector<milliseconds> sleeps;
};

// ============================================================================
// Test Suite: attempts and pacing
// ============================================================================

TEST_F(RefreshTest, BudgetDependsOnConnectionState) {
    EXPECT_EQ(attempt_budget(device(false)), 3);
    EXPECT_EQ(attempt_budget(device(true)), 1);
}

TEST_F(RefreshTest, ConnectedDeviceGetsThreeAttempts) {
    auto result = refresh(device(false, {level(70)}));

    EXPECT_EQ(transport.fetch_count(ID), 3);
    EXPECT_EQ(sleeps, (std::vector<milliseconds>{RETRY_DELAY, RETRY_DELAY}));
    EXPECT_TRUE(result.disconnected);
}

TEST_F(RefreshTest, DisconnectedDeviceGetsOneAttempt) {
    auto result = refresh(device(true));

    EXPECT_EQ(transport.fetch_count(ID), 1);
    EXPECT_TRUE(sleeps.empty());
    EXPECT_TRUE(result.disconnected);
}

TEST_F(RefreshTest, StopsAtFirstSuccess) {
    transport.queue_telemetry(ID, std::nullopt);
    transport.queue_telemetry(ID, TelemetrySnapshot{level(64)});

    auto result = refresh(device(false, {level(70)}));

    EXPECT_EQ(transport.fetch_count(ID), 2);
    EXPECT_EQ(sleeps.size(), 1u);
    EXPECT_FALSE(result.disconnected);
    ASSERT_EQ(result.telemetry.size(), 1u);
    EXPECT_EQ(result.telemetry[0].level, 64);
    EXPECT_TRUE(notifier.messages().empty());
}

TEST_F(RefreshTest, ThrowingFetchCountsAsFailedAttempt) {
    transport.throw_on_fetch(ID);

    auto result = refresh(device(false));

    EXPECT_EQ(transport.fetch_count(ID), 3);
    EXPECT_TRUE(result.disconnected);
}

TEST_F(RefreshTest, UsesConfiguredDelay) {
    options.retry.delay = milliseconds(5);
    refresh(device(false));
    EXPECT_EQ(sleeps, (std::vector<milliseconds>{milliseconds(5), milliseconds(5)}));
}

// ============================================================================
// Test Suite: outcomes
// ============================================================================

TEST_F(RefreshTest, ExhaustionKeepsTelemetryAndNotifiesDisconnect) {
    auto result = refresh(device(false, {level(55)}));

    EXPECT_TRUE(result.disconnected);
    ASSERT_EQ(result.telemetry.size(), 1u);
    EXPECT_EQ(result.telemetry[0].level, 55);
    EXPECT_EQ(notifier.messages(),
              std::vector<std::string>{"Headphones has been disconnected."});
}

TEST_F(RefreshTest, StillDisconnectedIsSilent) {
    refresh(device(true, {level(55)}));
    EXPECT_TRUE(notifier.messages().empty());
}

TEST_F(RefreshTest, ReconnectNotifies) {
    transport.set_telemetry(ID, TelemetrySnapshot{level(80)});

    auto result = refresh(device(true, {level(90)}));

    EXPECT_FALSE(result.disconnected);
    EXPECT_EQ(notifier.messages(), std::vector<std::string>{"Headphones has been connected."});
}

TEST_F(RefreshTest, ReconnectThenLowBatteryInOrder) {
    transport.set_telemetry(ID, TelemetrySnapshot{level(10)});

    refresh(device(true, {level(50)}));

    EXPECT_EQ(notifier.messages(), (std::vector<std::string>{
        "Headphones has been connected.",
        "Headphones has low battery.",
    }));
}

TEST_F(RefreshTest, LowBatteryFiresOncePerCrossing) {
    transport.set_telemetry(ID, TelemetrySnapshot{level(15)});

    auto first = refresh(device(false, {level(30)}));
    auto second = refresh(first);

    EXPECT_EQ(notifier.messages(), std::vector<std::string>{"Headphones has low battery."});
    EXPECT_EQ(second.telemetry[0].level, 15);
}

TEST_F(RefreshTest, UnchangedTelemetryEmitsNothing) {
    transport.set_telemetry(ID, TelemetrySnapshot{level(80), level(75)});

    auto previous = device(false, {level(80), level(75)});
    auto result = refresh(refresh(previous));

    EXPECT_TRUE(notifier.messages().empty());
    EXPECT_FALSE(result.disconnected);
}

TEST_F(RefreshTest, LowBatteryNamesComponent) {
    transport.set_telemetry(ID, TelemetrySnapshot{level(15, "Left"), level(60, "Right"),
                                                  level(90, "Case")});

    refresh(device(false, {level(40, "Left"), level(60, "Right"), level(90, "Case")}));

    EXPECT_EQ(notifier.messages(), std::vector<std::string>{"Headphones Left has low battery."});
}

TEST_F(RefreshTest, EdgeJudgedAgainstStoredSnapshot) {
    // A failed attempt in between must not reset the baseline
    transport.queue_telemetry(ID, std::nullopt);
    transport.queue_telemetry(ID, TelemetrySnapshot{level(18)});

    refresh(device(false, {level(35)}));

    EXPECT_EQ(notifier.messages(), std::vector<std::string>{"Headphones has low battery."});
}

// ============================================================================
// Test Suite: notification settings
// ============================================================================

TEST_F(RefreshTest, MasterSwitchSilencesEverything) {
    options.notifications.enabled = false;

    auto result = refresh(device(false, {level(50)}));

    EXPECT_TRUE(result.disconnected);
    EXPECT_TRUE(notifier.messages().empty());
}

TEST_F(RefreshTest, DisabledTypeIsSkippedOthersStillSent) {
    options.notifications.on_connected = false;
    transport.set_telemetry(ID, TelemetrySnapshot{level(10)});

    refresh(device(true, {level(50)}));

    EXPECT_EQ(notifier.messages(), std::vector<std::string>{"Headphones has low battery."});
}

TEST_F(RefreshTest, ThrowingNotifierDoesNotFailRefresh) {
    notifier.set_throws(true);
    transport.set_telemetry(ID, TelemetrySnapshot{level(10)});

    auto result = refresh(device(true, {level(50)}));

    EXPECT_FALSE(result.disconnected);
    EXPECT_EQ(result.telemetry[0].level, 10);
}

TEST_F(RefreshTest, NonStandardNotifierExceptionIsContained) {
    notifier.set_throws_foreign(true);

    auto result = refresh(device(false, {level(50)}));

    EXPECT_TRUE(result.disconnected);
    EXPECT_EQ(transport.fetch_count(ID), 3);
}

TEST_F(RefreshTest, NonStandardFetchExceptionCountsAsFailedAttempt) {
    transport.throw_foreign_on_fetch(ID);

    auto result = refresh(device(false));

    EXPECT_EQ(transport.fetch_count(ID), 3);
    EXPECT_TRUE(result.disconnected);
}

// ============================================================================
// Test Suite: InitialFetch
// ============================================================================

TEST_F(RefreshTest, InitialFetchSucceeds) {
    transport.set_telemetry(ID, TelemetrySnapshot{level(42, "Battery")});

    auto result = initial_fetch({ID, "Headphones"}, transport);

    EXPECT_EQ(transport.fetch_count(ID), 1);
    EXPECT_FALSE(result.disconnected);
    ASSERT_EQ(result.telemetry.size(), 1u);
    EXPECT_EQ(result.telemetry[0].level, 42);
}

TEST_F(RefreshTest, InitialFetchFailureRegistersDisconnected) {
    auto result = initial_fetch({ID, "Headphones"}, transport);

    EXPECT_EQ(transport.fetch_count(ID), 1);
    EXPECT_TRUE(result.disconnected);
    EXPECT_TRUE(result.telemetry.empty());
    EXPECT_EQ(result.device.name, "Headphones");
}
