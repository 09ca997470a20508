/*
 * Unit tests for the AAP battery exchange
 * Runs against a local socket pair standing in for the accessory channel
 */

#include <gtest/gtest.h>
#include "aap.hpp"

#include <protocol/packets.hpp>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <span>
#include <thread>
#include <vector>

using namespace battwatch;
using std::chrono::milliseconds;

namespace {

const std::vector<uint8_t> BATTERY_REPORT = {
    0x04, 0x00, 0x04, 0x00, 0x04, 0x00, 0x02,
    0x04, 0x01, 0x3c, 0x02, 0x01,
    0x02, 0x01, 0x12, 0x02, 0x01,
};

} // namespace

class AapExchangeTest : public ::testing::Test {
protected:
    void SetUp() override {
        int fds[2];
        ASSERT_EQ(socketpair(AF_UNIX, SOCK_SEQPACKET, 0, fds), 0);
        channel = l2cap::Connection(fds[0], "00:11:22:33:44:55");
        accessory = fds[1];
    }

    void TearDown() override {
        if (accessory >= 0) close(accessory);
    }

    std::vector<uint8_t> accessory_read() {
        pollfd pfd = {};
        pfd.fd = accessory;
        pfd.events = POLLIN;
        if (poll(&pfd, 1, 2000) <= 0) return {};

        std::vector<uint8_t> buffer(256);
        ssize_t n = recv(accessory, buffer.data(), buffer.size(), 0);
        if (n <= 0) return {};
        buffer.resize(static_cast<size_t>(n));
        return buffer;
    }

    void accessory_write(std::span<const uint8_t> data) {
        send(accessory, data.data(), data.size(), MSG_NOSIGNAL);
    }

    l2cap::Connection channel;
    int accessory = -1;
};

TEST_F(AapExchangeTest, ReadsFirstBatteryReport) {
    std::vector<std::vector<uint8_t>> received;

    std::thread peer([&] {
        received.push_back(accessory_read());
        accessory_write(aap::packets::headers::HANDSHAKE_ACK);
        received.push_back(accessory_read());
        accessory_write(aap::packets::headers::FEATURES_ACK);
        received.push_back(accessory_read());
        accessory_write(BATTERY_REPORT);
    });

    auto battery = aap::exchange(channel, 2000);
    peer.join();

    ASSERT_TRUE(battery.has_value());
    EXPECT_EQ(battery->left.level, 60);
    EXPECT_EQ(battery->right.level, 18);

    using namespace aap::packets::connection;
    ASSERT_EQ(received.size(), 3u);
    EXPECT_EQ(received[0], std::vector<uint8_t>(HANDSHAKE.begin(), HANDSHAKE.end()));
    EXPECT_EQ(received[1], std::vector<uint8_t>(SET_FEATURES.begin(), SET_FEATURES.end()));
    EXPECT_EQ(received[2],
              std::vector<uint8_t>(REQUEST_NOTIFICATIONS.begin(), REQUEST_NOTIFICATIONS.end()));
}

TEST_F(AapExchangeTest, FailedSendEndsExchangeEarly) {
    std::thread peer([this] {
        accessory_read();
        // Stop accepting data before acknowledging, so the next send fails
        shutdown(accessory, SHUT_RD);
        accessory_write(aap::packets::headers::HANDSHAKE_ACK);
    });

    auto begin = std::chrono::steady_clock::now();
    auto battery = aap::exchange(channel, 4000);
    auto elapsed = std::chrono::steady_clock::now() - begin;
    peer.join();

    EXPECT_FALSE(battery.has_value());
    EXPECT_LT(elapsed, milliseconds(1000));
}

TEST_F(AapExchangeTest, SilentAccessoryTimesOut) {
    auto battery = aap::exchange(channel, 100);
    EXPECT_FALSE(battery.has_value());
}
