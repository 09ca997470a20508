/*
 * Unit tests for the discovery session
 * Enumeration raced against a timeout, error text and permission hint
 */

#include <gtest/gtest.h>
#include <monitor/discovery.hpp>
#include "fakes/fake_transport.hpp"

using namespace battwatch;
using namespace battwatch::test;
using std::chrono::milliseconds;

namespace {

DiscoveryOptions options(bool gated, milliseconds timeout = milliseconds(2000)) {
    DiscoveryOptions o;
    o.timeout = timeout;
    o.permission_gated = gated;
    return o;
}

} // namespace

// ============================================================================
// Test Suite: WithPermissionHint
// ============================================================================

TEST(WithPermissionHint, AppendedWhenGated) {
    EXPECT_EQ(with_permission_hint("Bluetooth is off.", true),
              std::string("Bluetooth is off.") + PERMISSION_HINT);
}

TEST(WithPermissionHint, NotAppendedWhenUngated) {
    EXPECT_EQ(with_permission_hint("Bluetooth is off.", false), "Bluetooth is off.");
}

TEST(WithPermissionHint, NotDuplicatedWhenMessageMentionsPermission) {
    EXPECT_EQ(with_permission_hint("PERMISSION denied by user", true),
              "PERMISSION denied by user");
}

// ============================================================================
// Test Suite: Discover
// ============================================================================

TEST(Discover, ReturnsEnumeratedDevices) {
    auto transport = std::make_shared<FakeTransport>();
    transport->set_devices({{"AA:AA:AA:AA:AA:01", "Mouse"}, {"AA:AA:AA:AA:AA:02", "Keyboard"}});

    auto result = discover(transport, options(false));

    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.devices.size(), 2u);
    EXPECT_EQ(result.devices[0].name, "Mouse");
    EXPECT_EQ(result.devices[1].id, "AA:AA:AA:AA:AA:02");
    EXPECT_TRUE(result.message.empty());
}

TEST(Discover, EmptyListIsSuccess) {
    auto transport = std::make_shared<FakeTransport>();
    auto result = discover(transport, options(true));
    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(result.devices.empty());
}

TEST(Discover, TransportErrorPassesThrough) {
    auto transport = std::make_shared<FakeTransport>();
    transport->fail_enumerate("org.bluez.Error.NotReady: Resource Not Ready");

    auto result = discover(transport, options(false));

    EXPECT_EQ(result.error, DiscoveryError::Transport);
    EXPECT_EQ(result.message, "org.bluez.Error.NotReady: Resource Not Ready");
}

TEST(Discover, TransportErrorGetsHintWhenGated) {
    auto transport = std::make_shared<FakeTransport>();
    transport->fail_enumerate("Adapter unavailable.");

    auto result = discover(transport, options(true));

    EXPECT_EQ(result.error, DiscoveryError::Transport);
    EXPECT_EQ(result.message, std::string("Adapter unavailable.") + PERMISSION_HINT);
}

TEST(Discover, PermissionErrorNotHintedTwice) {
    auto transport = std::make_shared<FakeTransport>();
    transport->fail_enumerate("Bluetooth permission was denied.");

    auto result = discover(transport, options(true));

    EXPECT_EQ(result.message, "Bluetooth permission was denied.");
}

TEST(Discover, EmptyErrorFallsBackToGenericMessage) {
    auto transport = std::make_shared<FakeTransport>();
    transport->fail_enumerate("");

    auto result = discover(transport, options(false));

    EXPECT_EQ(result.error, DiscoveryError::Transport);
    EXPECT_EQ(result.message, DISCOVERY_FAILED_MESSAGE);
}

TEST(Discover, ThrowingEnumerateIsTransportError) {
    auto transport = std::make_shared<FakeTransport>();
    transport->throw_on_enumerate();

    auto result = discover(transport, options(false));

    EXPECT_EQ(result.error, DiscoveryError::Transport);
    EXPECT_EQ(result.message, "adapter vanished");
}

TEST(Discover, NonStandardExceptionIsTransportError) {
    auto transport = std::make_shared<FakeTransport>();
    transport->throw_foreign_on_enumerate();

    auto result = discover(transport, options(false));

    EXPECT_EQ(result.error, DiscoveryError::Transport);
    EXPECT_EQ(result.message, DISCOVERY_FAILED_MESSAGE);
}

TEST(Discover, TimeoutWinsAndLateResultIsIgnored) {
    auto transport = std::make_shared<FakeTransport>();
    transport->set_devices({{"AA:AA:AA:AA:AA:01", "Mouse"}});
    transport->hold_enumerate();

    auto result = discover(transport, options(false, milliseconds(50)));

    EXPECT_EQ(result.error, DiscoveryError::Timeout);
    EXPECT_EQ(result.message, DISCOVERY_FAILED_MESSAGE);
    EXPECT_TRUE(result.devices.empty());

    // The abandoned enumeration still completes without touching the result
    transport->release_enumerate();
    ASSERT_TRUE(transport->wait_enumerate_done(milliseconds(2000)));
    EXPECT_TRUE(result.devices.empty());
}

TEST(Discover, TimeoutGetsHintWhenGated) {
    auto transport = std::make_shared<FakeTransport>();
    transport->hold_enumerate();

    auto result = discover(transport, options(true, milliseconds(20)));

    EXPECT_EQ(result.error, DiscoveryError::Timeout);
    EXPECT_EQ(result.message, std::string(DISCOVERY_FAILED_MESSAGE) + PERMISSION_HINT);

    transport->release_enumerate();
    transport->wait_enumerate_done(milliseconds(2000));
}

TEST(Discover, TransportOutlivesCaller) {
    std::weak_ptr<FakeTransport> watch;
    {
        auto transport = std::make_shared<FakeTransport>();
        watch = transport;
        transport->hold_enumerate();
        auto result = discover(transport, options(false, milliseconds(20)));
        EXPECT_EQ(result.error, DiscoveryError::Timeout);
    }

    // Only the enumeration thread keeps it alive now
    auto transport = watch.lock();
    ASSERT_NE(transport, nullptr);
    transport->release_enumerate();
    EXPECT_TRUE(transport->wait_enumerate_done(milliseconds(2000)));
}
