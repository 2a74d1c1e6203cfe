#pragma once

#include <netinet/in.h>
#include <cstdint>
#include <string>

namespace ingest {
namespace network {

// IPv4 endpoint. Default-constructed it is 0.0.0.0:0.
class InetAddress {
public:
    InetAddress();
    explicit InetAddress(const struct sockaddr_in& addr)
        : addr_(addr) {}

    // Dotted-quad only; returns false and leaves *out untouched on bad input.
    static bool FromIpPort(const std::string& ip, uint16_t port, InetAddress* out);

    // Peer IP as written into the event host field.
    std::string toIp() const;
    std::string toIpPort() const;
    uint16_t port() const { return ntohs(addr_.sin_port); }

    const struct sockaddr* getSockAddr() const { return reinterpret_cast<const struct sockaddr*>(&addr_); }
    void setSockAddr(const struct sockaddr_in& addr) { addr_ = addr; }

private:
    struct sockaddr_in addr_;
};

} // namespace network
} // namespace ingest
