#include "ingest/network/Socket.h"
#include "ingest/network/InetAddress.h"
#include "ingest/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace ingest {
namespace network {

Socket::~Socket() {
    if (sockfd_ >= 0) {
        ::close(sockfd_);
    }
}

int Socket::CreateTcp() {
    return ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, IPPROTO_TCP);
}

bool Socket::BindAddress(const InetAddress& localaddr) {
    if (::bind(sockfd_, localaddr.getSockAddr(), sizeof(struct sockaddr_in)) != 0) {
        LOG_ERROR << "Socket::BindAddress " << localaddr.toIpPort() << " failed: " << std::strerror(errno);
        return false;
    }
    return true;
}

bool Socket::Listen() {
    if (::listen(sockfd_, SOMAXCONN) != 0) {
        LOG_ERROR << "Socket::Listen failed: " << std::strerror(errno);
        return false;
    }
    return true;
}

int Socket::Accept(InetAddress* peeraddr) {
    struct sockaddr_in addr;
    socklen_t len = sizeof addr;
    std::memset(&addr, 0, sizeof addr);
    int connfd = ::accept4(sockfd_, reinterpret_cast<struct sockaddr*>(&addr), &len, SOCK_CLOEXEC);
    if (connfd >= 0) {
        peeraddr->setSockAddr(addr);
    }
    return connfd;
}

bool Socket::GetLocalAddress(InetAddress* out) const {
    struct sockaddr_in addr;
    socklen_t len = sizeof addr;
    std::memset(&addr, 0, sizeof addr);
    if (::getsockname(sockfd_, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {
        return false;
    }
    out->setSockAddr(addr);
    return true;
}

void Socket::SetReuseAddr(bool on) {
    int optval = on ? 1 : 0;
    ::setsockopt(sockfd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof optval);
}

void Socket::SetNonBlocking(bool on) {
    int flags = ::fcntl(sockfd_, F_GETFL, 0);
    if (flags < 0) return;
    flags = on ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    ::fcntl(sockfd_, F_SETFL, flags);
}

void Socket::SetIoTimeout(int fd, int timeoutMs) {
    struct timeval tv;
    tv.tv_sec = timeoutMs / 1000;
    tv.tv_usec = (timeoutMs % 1000) * 1000;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof tv);
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof tv);
}

void Socket::ShutdownWrite(int fd) {
    if (::shutdown(fd, SHUT_WR) < 0 && errno != ENOTCONN) {
        LOG_DEBUG << "Socket::ShutdownWrite fd=" << fd << ": " << std::strerror(errno);
    }
}

} // namespace network
} // namespace ingest
