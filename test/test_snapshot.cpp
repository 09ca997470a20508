/*
 * Unit tests for composing a fetch's snapshot from its battery sources
 */

#include <gtest/gtest.h>
#include <monitor/snapshot.hpp>
#include <monitor/transition.hpp>

using namespace battwatch;

namespace {

aap::Battery earbuds(int left, int right, int case_level) {
    aap::Battery b;
    b.left = {static_cast<int8_t>(left), false, true};
    b.right = {static_cast<int8_t>(right), false, true};
    b.case_ = {static_cast<int8_t>(case_level), false, true};
    return b;
}

Reading service_level(int value) {
    Reading r;
    r.level = value;
    r.label = "Hands-Free";
    return r;
}

} // namespace

TEST(ComposeSnapshot, AccessoryReportGivesComponents) {
    BatterySources sources;
    sources.accessory = true;
    sources.accessory_report = earbuds(80, 70, 60);

    auto snapshot = compose_snapshot(sources);
    ASSERT_TRUE(snapshot.has_value());
    ASSERT_EQ(snapshot->size(), 3u);
    EXPECT_EQ((*snapshot)[1].label, "Right");
    EXPECT_EQ((*snapshot)[1].level, 70);
}

TEST(ComposeSnapshot, MissedAccessoryReportFailsInsteadOfFallingBack) {
    BatterySources sources;
    sources.accessory = true;
    sources.battery_service = service_level(50);

    EXPECT_FALSE(compose_snapshot(sources).has_value());
}

TEST(ComposeSnapshot, BatteryServiceIsSingleReading) {
    BatterySources sources;
    sources.battery_service = service_level(45);

    auto snapshot = compose_snapshot(sources);
    ASSERT_TRUE(snapshot.has_value());
    ASSERT_EQ(snapshot->size(), 1u);
    EXPECT_EQ((*snapshot)[0].level, 45);
}

TEST(ComposeSnapshot, NoSourcesFails) {
    EXPECT_FALSE(compose_snapshot({}).has_value());
}

TEST(ComposeSnapshot, AccessoryShapeIsStableAcrossFetches) {
    BatterySources before;
    before.accessory = true;
    before.accessory_report = earbuds(50, 50, 60);

    BatterySources missed = before;
    missed.accessory_report.reset();
    missed.battery_service = service_level(50);

    BatterySources after = before;
    after.accessory_report = earbuds(50, 15, 60);

    // The missed fetch leaves the stored snapshot untouched, so the
    // right earbud's crossing is still seen on the next good fetch
    auto previous = compose_snapshot(before);
    ASSERT_TRUE(previous.has_value());
    EXPECT_FALSE(compose_snapshot(missed).has_value());
    auto current = compose_snapshot(after);
    ASSERT_TRUE(current.has_value());

    EXPECT_EQ(detect_low_battery_edges(*previous, *current), std::vector<std::size_t>{1});
}
