#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace battwatch::l2cap {

// Open L2CAP channel. Move-only, closes on destruction.
struct Connection {
    int fd = -1;
    std::string address;

    bool is_open() const { return fd >= 0; }
    void close();

    Connection() = default;
    Connection(int fd, std::string addr) : fd(fd), address(std::move(addr)) {}
    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
};

// True if the string is a well-formed Bluetooth address
bool valid_address(const std::string& mac_address);

// Connect to the service `uuid` on a device, resolving its PSM over SDP.
// Returns a closed connection on failure.
Connection connect(const std::string& mac_address, const char* uuid);

bool send(const Connection& conn, std::span<const uint8_t> data);

// Wait up to timeout_ms for one packet. Empty on timeout or error.
std::vector<uint8_t> recv_timeout(const Connection& conn, int timeout_ms);

} // namespace battwatch::l2cap
