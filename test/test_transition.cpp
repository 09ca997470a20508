/*
 * Unit tests for low-battery edge detection and notification text
 */

#include <gtest/gtest.h>
#include <monitor/transition.hpp>
#include "fakes/fake_transport.hpp"

using namespace battwatch;
using battwatch::test::level;
using battwatch::test::unknown;

using Edges = std::vector<std::size_t>;

// ============================================================================
// Test Suite: IsLow
// ============================================================================

TEST(IsLow, UnknownIsNotLow) {
    EXPECT_FALSE(is_low(std::nullopt));
}

TEST(IsLow, ZeroIsNotLow) {
    EXPECT_FALSE(is_low(0));
}

TEST(IsLow, ThresholdBoundaries) {
    EXPECT_TRUE(is_low(1));
    EXPECT_TRUE(is_low(LOW_BATTERY_THRESHOLD));
    EXPECT_FALSE(is_low(LOW_BATTERY_THRESHOLD + 1));
    EXPECT_FALSE(is_low(100));
}

TEST(IsBaseline, RequiresKnownNonZeroLevel) {
    EXPECT_FALSE(is_baseline(std::nullopt));
    EXPECT_FALSE(is_baseline(0));
    EXPECT_TRUE(is_baseline(15));
    EXPECT_TRUE(is_baseline(80));
}

// ============================================================================
// Test Suite: DetectLowBatteryEdges
// ============================================================================

TEST(DetectLowBatteryEdges, CrossingIntoLowFires) {
    EXPECT_EQ(detect_low_battery_edges({level(30)}, {level(15)}), Edges{0});
}

TEST(DetectLowBatteryEdges, ExactThresholdCrossing) {
    EXPECT_EQ(detect_low_battery_edges({level(21)}, {level(20)}), Edges{0});
}

TEST(DetectLowBatteryEdges, AlreadyLowDoesNotRefire) {
    EXPECT_TRUE(detect_low_battery_edges({level(15)}, {level(10)}).empty());
}

TEST(DetectLowBatteryEdges, ZeroPreviousIsNoBaseline) {
    EXPECT_TRUE(detect_low_battery_edges({level(0)}, {level(15)}).empty());
}

TEST(DetectLowBatteryEdges, UnknownPreviousIsNoBaseline) {
    EXPECT_TRUE(detect_low_battery_edges({unknown()}, {level(15)}).empty());
}

TEST(DetectLowBatteryEdges, DropToZeroIsNotLow) {
    EXPECT_TRUE(detect_low_battery_edges({level(30)}, {level(0)}).empty());
}

TEST(DetectLowBatteryEdges, RecoveryDoesNotFire) {
    EXPECT_TRUE(detect_low_battery_edges({level(10)}, {level(60)}).empty());
}

TEST(DetectLowBatteryEdges, EmptyPreviousSnapshot) {
    EXPECT_TRUE(detect_low_battery_edges({}, {level(10), level(10)}).empty());
}

TEST(DetectLowBatteryEdges, OnlyChangedComponentFires) {
    TelemetrySnapshot before = {level(80, "Left"), level(15, "Right"), level(50, "Case")};
    TelemetrySnapshot after = {level(15, "Left"), level(10, "Right"), level(50, "Case")};
    EXPECT_EQ(detect_low_battery_edges(before, after), Edges{0});
}

TEST(DetectLowBatteryEdges, MultipleEdgesAscending) {
    TelemetrySnapshot before = {level(50), level(40), level(90)};
    TelemetrySnapshot after = {level(5), level(60), level(20)};
    EXPECT_EQ(detect_low_battery_edges(before, after), (Edges{0, 2}));
}

TEST(DetectLowBatteryEdges, ComparesOnlyCommonPrefix) {
    // Shrunk snapshot
    EXPECT_EQ(detect_low_battery_edges({level(50), level(50), level(50)}, {level(10)}), Edges{0});
    // Grown snapshot, the new reading has no predecessor
    EXPECT_EQ(detect_low_battery_edges({level(50)}, {level(10), level(10)}), Edges{0});
}

// ============================================================================
// Test Suite: DescribeEdge
// ============================================================================

TEST(DescribeEdge, Connected) {
    Device d{"AA:BB:CC:DD:EE:FF", "Keyboard"};
    EXPECT_EQ(describe_edge(d, {}, {NotificationType::Connected, 0}),
              "Keyboard has been connected.");
}

TEST(DescribeEdge, Disconnected) {
    Device d{"AA:BB:CC:DD:EE:FF", "Keyboard"};
    EXPECT_EQ(describe_edge(d, {level(40)}, {NotificationType::Disconnected, 0}),
              "Keyboard has been disconnected.");
}

TEST(DescribeEdge, SingleReadingOmitsLabel) {
    Device d{"AA:BB:CC:DD:EE:FF", "Mouse"};
    EXPECT_EQ(describe_edge(d, {level(12, "Main")}, {NotificationType::LowBattery, 0}),
              "Mouse has low battery.");
}

TEST(DescribeEdge, MultiReadingUsesLabel) {
    Device d{"AA:BB:CC:DD:EE:FF", "AirPods"};
    TelemetrySnapshot t = {level(80, "Left"), level(12, "Right")};
    EXPECT_EQ(describe_edge(d, t, {NotificationType::LowBattery, 1}),
              "AirPods Right has low battery.");
}

TEST(DescribeEdge, MissingLabelDefaultsToCentral) {
    Device d{"AA:BB:CC:DD:EE:FF", "Split Keyboard"};
    TelemetrySnapshot t = {level(12), level(70, "Peripheral")};
    EXPECT_EQ(describe_edge(d, t, {NotificationType::LowBattery, 0}),
              "Split Keyboard Central has low battery.");
}
