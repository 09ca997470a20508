#include "aap.hpp"

#include <protocol/packets.hpp>
#include <protocol/parse.hpp>

#include <chrono>
#include <iostream>

namespace battwatch::aap {

std::optional<Battery> read_battery(const std::string& mac_address, int timeout_ms) {
    l2cap::Connection conn = l2cap::connect(mac_address, SERVICE_UUID);
    if (!conn.is_open()) {
        return std::nullopt;
    }
    return exchange(conn, timeout_ms);
}

std::optional<Battery> exchange(const l2cap::Connection& conn, int timeout_ms) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms);
    const std::string& mac_address = conn.address;

    if (!l2cap::send(conn, packets::connection::HANDSHAKE)) {
        std::cerr << "aap: handshake to " << mac_address << " failed" << std::endl;
        return std::nullopt;
    }

    while (clock::now() < deadline) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        auto data = l2cap::recv_timeout(conn, static_cast<int>(remaining.count()));
        if (data.empty()) {
            break;  // Timed out or channel closed
        }

        switch (parse::identify_packet(data)) {
            case parse::PacketType::HandshakeAck:
                if (!l2cap::send(conn, packets::connection::SET_FEATURES)) {
                    std::cerr << "aap: set features on " << mac_address << " failed" << std::endl;
                    return std::nullopt;
                }
                break;

            case parse::PacketType::FeaturesAck:
                // Battery reports start once notifications are requested
                if (!l2cap::send(conn, packets::connection::REQUEST_NOTIFICATIONS)) {
                    std::cerr << "aap: notification request to " << mac_address << " failed"
                              << std::endl;
                    return std::nullopt;
                }
                break;

            case parse::PacketType::Battery:
                if (auto battery = parse::parse_battery(data)) {
                    return battery;
                }
                std::cerr << "aap: malformed battery packet (" << data.size() << " bytes)" << std::endl;
                break;

            default:
                break;
        }
    }

    std::cerr << "aap: no battery report from " << mac_address << " within "
              << timeout_ms << "ms" << std::endl;
    return std::nullopt;
}

} // namespace battwatch::aap
