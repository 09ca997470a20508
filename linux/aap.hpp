#pragma once

#include "l2cap.hpp"

#include <types/battery.hpp>
#include <optional>
#include <string>

namespace battwatch::aap {

// AirPods accessory service UUID
constexpr const char* SERVICE_UUID = "74ec2172-0bad-4d01-8f77-997b2be0722a";

// Total time allowed for handshake plus first battery report
constexpr int READ_TIMEOUT_MS = 4000;

// Open a short-lived session and wait for the first battery report.
// Returns nullopt if the device is unreachable or stays silent.
std::optional<Battery> read_battery(const std::string& mac_address,
                                    int timeout_ms = READ_TIMEOUT_MS);

// Handshake on an open channel and wait for the first battery report.
// Gives up as soon as a send fails.
std::optional<Battery> exchange(const l2cap::Connection& conn, int timeout_ms);

} // namespace battwatch::aap
