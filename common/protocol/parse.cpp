#include "parse.hpp"

namespace battwatch::aap::parse {

namespace {

constexpr size_t BATTERY_HEADER_SIZE = packets::headers::BATTERY.size() + 1;  // + count
constexpr size_t COMPONENT_SIZE = 5;
constexpr size_t MAX_COMPONENTS = 4;

// [type] 01 [level] [status] 01
std::optional<ComponentBattery> parse_component(std::span<const uint8_t> entry) {
    if (entry[1] != 0x01 || entry[4] != 0x01) {
        return std::nullopt;
    }

    uint8_t level = entry[2];
    if (level > 100) {
        return std::nullopt;
    }

    auto status = static_cast<BatteryStatus>(entry[3]);

    ComponentBattery comp;
    comp.level = static_cast<int8_t>(level);
    comp.charging = status == BatteryStatus::Charging;
    comp.available = status != BatteryStatus::Disconnected;
    return comp;
}

} // namespace

PacketType identify_packet(std::span<const uint8_t> data) {
    using namespace packets;

    if (starts_with(data, headers::HANDSHAKE_ACK)) return PacketType::HandshakeAck;
    if (starts_with(data, headers::FEATURES_ACK)) return PacketType::FeaturesAck;
    if (starts_with(data, headers::BATTERY)) return PacketType::Battery;

    return PacketType::Unknown;
}

std::optional<Battery> parse_battery(std::span<const uint8_t> data) {
    if (data.size() < BATTERY_HEADER_SIZE ||
        !packets::starts_with(data, packets::headers::BATTERY)) {
        return std::nullopt;
    }

    size_t count = data[BATTERY_HEADER_SIZE - 1];
    if (count > MAX_COMPONENTS || data.size() != BATTERY_HEADER_SIZE + COMPONENT_SIZE * count) {
        return std::nullopt;
    }

    Battery battery{};
    bool pod_seen = false;

    for (size_t i = 0; i < count; ++i) {
        auto entry = data.subspan(BATTERY_HEADER_SIZE + COMPONENT_SIZE * i, COMPONENT_SIZE);
        auto comp = parse_component(entry);
        if (!comp) {
            return std::nullopt;
        }

        switch (static_cast<BatteryComponent>(entry[0])) {
            case BatteryComponent::Left:
                battery.left = *comp;
                break;
            case BatteryComponent::Right:
                battery.right = *comp;
                break;
            case BatteryComponent::Case:
                battery.case_ = *comp;
                continue;
            case BatteryComponent::Headset:
                battery.headset = *comp;
                continue;
            default:
                return std::nullopt;
        }

        // The pod reported first is the primary one
        if (!pod_seen) {
            battery.left_is_primary = static_cast<BatteryComponent>(entry[0]) == BatteryComponent::Left;
            pod_seen = true;
        }
    }

    return battery;
}

} // namespace battwatch::aap::parse
