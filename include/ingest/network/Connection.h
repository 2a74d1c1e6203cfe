#pragma once

#include "ingest/common/noncopyable.h"
#include "ingest/network/InetAddress.h"

#include <cstddef>
#include <string>
#include <sys/types.h>

struct ssl_ctx_st;
struct ssl_st;

namespace ingest {
namespace network {

// One accepted client socket used with blocking I/O by a single thread at a time.
// With a TLS context every read/write goes through the SSL session.
class Connection : ingest::common::noncopyable {
public:
    Connection(int sockfd, const InetAddress& peerAddr, ssl_ctx_st* tlsCtx);
    ~Connection();

    int fd() const { return sockfd_; }
    const InetAddress& peerAddress() const { return peerAddr_; }

    // SO_RCVTIMEO/SO_SNDTIMEO; 0 disables.
    void SetIoTimeout(int timeoutMs);

    // Server-side TLS handshake; plaintext connections return true immediately.
    bool Handshake();

    // >0 bytes read, 0 on orderly close, -1 on error or timeout.
    ssize_t Read(char* buf, size_t cap);
    bool WriteAll(const std::string& data);

    // Stops sending (TLS close_notify + SHUT_WR) and detaches the fd; the caller
    // becomes responsible for closing it, directly or through Acceptor::Linger().
    int Release();

private:
    int sockfd_;
    InetAddress peerAddr_;
    ssl_ctx_st* tlsCtx_;
    ssl_st* ssl_{nullptr};
};

} // namespace network
} // namespace ingest
