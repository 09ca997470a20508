#pragma once

#include "../types/battery.hpp"
#include "packets.hpp"
#include <cstdint>
#include <optional>
#include <span>

namespace battwatch::aap::parse {

enum class PacketType {
    Unknown,
    HandshakeAck,
    FeaturesAck,
    Battery,
};

PacketType identify_packet(std::span<const uint8_t> data);

// Parse battery status packet
// Returns nullopt if packet is invalid
std::optional<Battery> parse_battery(std::span<const uint8_t> data);

} // namespace battwatch::aap::parse
