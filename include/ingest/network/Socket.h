#pragma once

#include "ingest/common/noncopyable.h"

namespace ingest {
namespace network {

class InetAddress;

// Owns a socket fd; closes it on destruction.
class Socket : ingest::common::noncopyable {
public:
    explicit Socket(int sockfd)
        : sockfd_(sockfd) {}
    ~Socket();

    // Blocking-mode TCP socket, or -1 with errno set.
    static int CreateTcp();

    int fd() const { return sockfd_; }

    bool BindAddress(const InetAddress& localaddr);
    bool Listen();
    // Accepted sockets are blocking; returns -1 on failure.
    int Accept(InetAddress* peeraddr);
    bool GetLocalAddress(InetAddress* out) const;

    void SetReuseAddr(bool on);
    void SetNonBlocking(bool on);

    // Applies SO_RCVTIMEO and SO_SNDTIMEO to fd; 0 disables.
    static void SetIoTimeout(int fd, int timeoutMs);
    // Half-closes fd: the peer reads EOF after the data already sent.
    static void ShutdownWrite(int fd);

private:
    const int sockfd_;
};

} // namespace network
} // namespace ingest
