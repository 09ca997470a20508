#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace battwatch::aap::packets {

// Helper to create packet from hex string literal
template<size_t N>
constexpr std::array<uint8_t, (N - 1) / 2> from_hex(const char (&hex)[N]) {
    std::array<uint8_t, (N - 1) / 2> result{};
    for (size_t i = 0; i < result.size(); ++i) {
        auto hex_to_nibble = [](char c) -> uint8_t {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return 0;
        };
        result[i] = (hex_to_nibble(hex[i * 2]) << 4) | hex_to_nibble(hex[i * 2 + 1]);
    }
    return result;
}

// Session setup, sent in this order
namespace connection {
    // 00 00 04 00 01 00 02 00 00 00 00 00 00 00 00 00
    constexpr auto HANDSHAKE = from_hex("00000400010002000000000000000000");

    // 04 00 04 00 4d 00 d7 00 00 00 00 00 00 00
    constexpr auto SET_FEATURES = from_hex("040004004d00d700000000000000");

    // 04 00 04 00 0f 00 ff ff ff ff ff
    constexpr auto REQUEST_NOTIFICATIONS = from_hex("040004000f00ffffffffff");
}

namespace headers {
    // Battery status: 04 00 04 00 04 00
    constexpr auto BATTERY = from_hex("040004000400");

    // Handshake ack: 01 00 04 00
    constexpr auto HANDSHAKE_ACK = from_hex("01000400");

    // Features ack: 04 00 04 00 2b 00
    constexpr auto FEATURES_ACK = from_hex("040004002b00");
}

template<size_t N>
inline bool starts_with(std::span<const uint8_t> data, const std::array<uint8_t, N>& header) {
    if (data.size() < N) return false;
    for (size_t i = 0; i < N; ++i) {
        if (data[i] != header[i]) return false;
    }
    return true;
}

} // namespace battwatch::aap::packets
