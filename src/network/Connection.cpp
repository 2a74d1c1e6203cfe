#include "ingest/network/Connection.h"
#include "ingest/network/Socket.h"
#include "ingest/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <cerrno>
#include <climits>
#include <sys/socket.h>
#include <unistd.h>

namespace ingest {
namespace network {

Connection::Connection(int sockfd, const InetAddress& peerAddr, ssl_ctx_st* tlsCtx)
    : sockfd_(sockfd),
      peerAddr_(peerAddr),
      tlsCtx_(tlsCtx) {
}

Connection::~Connection() {
    if (ssl_) {
        SSL_free(reinterpret_cast<SSL*>(ssl_));
        ssl_ = nullptr;
    }
    if (sockfd_ >= 0) {
        ::close(sockfd_);
        sockfd_ = -1;
    }
}

void Connection::SetIoTimeout(int timeoutMs) {
    Socket::SetIoTimeout(sockfd_, timeoutMs);
}

bool Connection::Handshake() {
    if (!tlsCtx_) return true;
    if (ssl_) return true;

    SSL* s = SSL_new(reinterpret_cast<SSL_CTX*>(tlsCtx_));
    if (!s) {
        LOG_ERROR << "TLS: SSL_new failed";
        return false;
    }
    SSL_set_fd(s, sockfd_);
    SSL_set_accept_state(s);
    ssl_ = reinterpret_cast<ssl_st*>(s);

    const int r = SSL_accept(s);
    if (r != 1) {
        const int e = SSL_get_error(s, r);
        LOG_DEBUG << "TLS handshake failed peer=" << peerAddr_.toIpPort() << " ssl_error=" << e;
        ERR_clear_error();
        return false;
    }
    return true;
}

ssize_t Connection::Read(char* buf, size_t cap) {
    if (ssl_) {
        SSL* s = reinterpret_cast<SSL*>(ssl_);
        const int want = cap > static_cast<size_t>(INT_MAX) ? INT_MAX : static_cast<int>(cap);
        const int r = SSL_read(s, buf, want);
        if (r > 0) return r;
        const int e = SSL_get_error(s, r);
        ERR_clear_error();
        if (e == SSL_ERROR_ZERO_RETURN) return 0;
        return -1;
    }

    while (true) {
        const ssize_t n = ::recv(sockfd_, buf, cap, 0);
        if (n >= 0) return n;
        if (errno == EINTR) continue;
        return -1;
    }
}

bool Connection::WriteAll(const std::string& data) {
    const char* p = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        if (ssl_) {
            SSL* s = reinterpret_cast<SSL*>(ssl_);
            const int chunk = remaining > static_cast<size_t>(INT_MAX) ? INT_MAX : static_cast<int>(remaining);
            const int w = SSL_write(s, p, chunk);
            if (w <= 0) {
                LOG_DEBUG << "Connection::WriteAll SSL_write failed peer=" << peerAddr_.toIpPort()
                          << " ssl_error=" << SSL_get_error(s, w);
                ERR_clear_error();
                return false;
            }
            p += w;
            remaining -= static_cast<size_t>(w);
            continue;
        }
        const ssize_t w = ::send(sockfd_, p, remaining, MSG_NOSIGNAL);
        if (w < 0) {
            if (errno == EINTR) continue;
            LOG_DEBUG << "Connection::WriteAll send failed peer=" << peerAddr_.toIpPort() << " errno=" << errno;
            return false;
        }
        p += w;
        remaining -= static_cast<size_t>(w);
    }
    return true;
}

int Connection::Release() {
    if (ssl_) {
        SSL* s = reinterpret_cast<SSL*>(ssl_);
        SSL_shutdown(s);
        ERR_clear_error();
        SSL_free(s);
        ssl_ = nullptr;
    }
    const int fd = sockfd_;
    sockfd_ = -1;
    if (fd >= 0) {
        Socket::ShutdownWrite(fd);
    }
    return fd;
}

} // namespace network
} // namespace ingest
