#include "ingest/network/InetAddress.h"

#include <arpa/inet.h>
#include <cstring>

namespace ingest {
namespace network {

InetAddress::InetAddress() {
    std::memset(&addr_, 0, sizeof addr_);
    addr_.sin_family = AF_INET;
}

bool InetAddress::FromIpPort(const std::string& ip, uint16_t port, InetAddress* out) {
    InetAddress parsed;
    if (::inet_pton(AF_INET, ip.c_str(), &parsed.addr_.sin_addr) != 1) {
        return false;
    }
    parsed.addr_.sin_port = htons(port);
    *out = parsed;
    return true;
}

std::string InetAddress::toIp() const {
    char buf[INET_ADDRSTRLEN] = "";
    if (!::inet_ntop(AF_INET, &addr_.sin_addr, buf, sizeof buf)) {
        return std::string();
    }
    return buf;
}

std::string InetAddress::toIpPort() const {
    return toIp() + ":" + std::to_string(port());
}

} // namespace network
} // namespace ingest
