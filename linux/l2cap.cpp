#include "l2cap.hpp"

#include <bluetooth/bluetooth.h>
#include <bluetooth/l2cap.h>
#include <bluetooth/sdp.h>
#include <bluetooth/sdp_lib.h>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>

namespace battwatch::l2cap {

Connection::Connection(Connection&& other) noexcept
    : fd(other.fd), address(std::move(other.address)) {
    other.fd = -1;
}

Connection& Connection::operator=(Connection&& other) noexcept {
    if (this != &other) {
        close();
        fd = other.fd;
        address = std::move(other.address);
        other.fd = -1;
    }
    return *this;
}

Connection::~Connection() {
    close();
}

void Connection::close() {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// 128-bit UUID in canonical dashed form, stored big-endian
static bool parse_uuid(const char* text, uuid_t* uuid) {
    uint8_t bytes[16] = {};
    size_t n = 0;

    for (const char* c = text; *c; ++c) {
        if (*c == '-') continue;
        int v = hex_value(*c);
        if (v < 0 || n >= 32) return false;
        bytes[n / 2] |= static_cast<uint8_t>(n % 2 == 0 ? v << 4 : v);
        ++n;
    }
    if (n != 32) return false;

    sdp_uuid128_create(uuid, bytes);
    return true;
}

static void free_access_protos(sdp_list_t* protos) {
    for (sdp_list_t* p = protos; p; p = p->next) {
        sdp_list_free(static_cast<sdp_list_t*>(p->data), nullptr);
    }
    sdp_list_free(protos, nullptr);
}

// First L2CAP PSM advertised by any record in the response
static int psm_from_records(sdp_list_t* records) {
    int psm = -1;
    for (sdp_list_t* r = records; r && psm < 0; r = r->next) {
        auto* rec = static_cast<sdp_record_t*>(r->data);
        sdp_list_t* protos = nullptr;
        if (sdp_get_access_protos(rec, &protos) == 0) {
            psm = sdp_get_proto_port(protos, L2CAP_UUID);
            free_access_protos(protos);
        }
    }
    return psm > 0 ? psm : -1;
}

// Resolve the PSM of a service over SDP
static int lookup_psm(const bdaddr_t* target, uuid_t* uuid) {
    bdaddr_t any = {};
    sdp_session_t* session = sdp_connect(&any, target, SDP_RETRY_IF_BUSY);
    if (!session) {
        std::cerr << "l2cap: SDP connect failed: " << strerror(errno) << std::endl;
        return -1;
    }

    uint32_t range = 0x0000ffff;
    sdp_list_t* search = sdp_list_append(nullptr, uuid);
    sdp_list_t* attrs = sdp_list_append(nullptr, &range);
    sdp_list_t* records = nullptr;

    int psm = -1;
    if (sdp_service_search_attr_req(session, search, SDP_ATTR_REQ_RANGE, attrs, &records) == 0) {
        psm = psm_from_records(records);
        sdp_list_free(records, reinterpret_cast<sdp_free_func_t>(sdp_record_free));
    } else {
        std::cerr << "l2cap: SDP search failed: " << strerror(errno) << std::endl;
    }

    sdp_list_free(attrs, nullptr);
    sdp_list_free(search, nullptr);
    sdp_close(session);
    return psm;
}

bool valid_address(const std::string& mac_address) {
    return bachk(mac_address.c_str()) == 0;
}

Connection connect(const std::string& mac_address, const char* uuid_str) {
    bdaddr_t target;
    if (str2ba(mac_address.c_str(), &target) < 0) {
        std::cerr << "l2cap: invalid address: " << mac_address << std::endl;
        return {};
    }

    uuid_t uuid;
    if (!parse_uuid(uuid_str, &uuid)) {
        std::cerr << "l2cap: malformed service UUID " << uuid_str << std::endl;
        return {};
    }

    int psm = lookup_psm(&target, &uuid);
    if (psm < 0) {
        std::cerr << "l2cap: no PSM for " << uuid_str << " on " << mac_address << std::endl;
        return {};
    }

    int sock = socket(AF_BLUETOOTH, SOCK_SEQPACKET, BTPROTO_L2CAP);
    if (sock < 0) {
        std::cerr << "l2cap: socket: " << strerror(errno) << std::endl;
        return {};
    }
    Connection conn(sock, mac_address);

    struct sockaddr_l2 local_addr = {};
    local_addr.l2_family = AF_BLUETOOTH;
    memset(&local_addr.l2_bdaddr, 0, sizeof(local_addr.l2_bdaddr));

    if (bind(sock, reinterpret_cast<struct sockaddr*>(&local_addr), sizeof(local_addr)) < 0) {
        std::cerr << "l2cap: bind: " << strerror(errno) << std::endl;
        return {};
    }

    struct sockaddr_l2 remote_addr = {};
    remote_addr.l2_family = AF_BLUETOOTH;
    remote_addr.l2_bdaddr = target;
    remote_addr.l2_psm = htobs(psm);

    if (::connect(sock, reinterpret_cast<struct sockaddr*>(&remote_addr), sizeof(remote_addr)) < 0) {
        std::cerr << "l2cap: connect to " << mac_address << ": " << strerror(errno) << std::endl;
        return {};
    }

    return conn;
}

bool send(const Connection& conn, std::span<const uint8_t> data) {
    if (!conn.is_open()) return false;

    // A dropped link reports EPIPE instead of raising SIGPIPE
    ssize_t written = ::send(conn.fd, data.data(), data.size(), MSG_NOSIGNAL);
    if (written < 0) {
        std::cerr << "l2cap: send: " << strerror(errno) << std::endl;
        return false;
    }
    return static_cast<size_t>(written) == data.size();
}

std::vector<uint8_t> recv_timeout(const Connection& conn, int timeout_ms) {
    if (!conn.is_open()) return {};

    struct pollfd pfd = {};
    pfd.fd = conn.fd;
    pfd.events = POLLIN;

    if (poll(&pfd, 1, timeout_ms) <= 0 || !(pfd.revents & POLLIN)) {
        return {};
    }

    std::vector<uint8_t> buffer(1024);
    ssize_t n = ::recv(conn.fd, buffer.data(), buffer.size(), 0);
    if (n <= 0) {
        return {};
    }

    buffer.resize(static_cast<size_t>(n));
    return buffer;
}

} // namespace battwatch::l2cap
