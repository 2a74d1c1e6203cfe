#include "ingest/network/Acceptor.h"
#include "ingest/common/Logger.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

namespace ingest {
namespace network {

namespace {

const int kPollTimeMs = 10000;

int CreateEventfd() {
    int evtfd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (evtfd < 0) {
        LOG_FATAL << "Failed in eventfd: " << std::strerror(errno);
    }
    return evtfd;
}

} // namespace

Acceptor::Acceptor(const InetAddress& listenAddr)
    : listenAddr_(listenAddr),
      accept_socket_(new Socket(Socket::CreateTcp())),
      wakeup_fd_(CreateEventfd()),
      boundPort_(0),
      quit_(false) {
    if (accept_socket_->fd() < 0) {
        LOG_FATAL << "Acceptor: socket() failed: " << std::strerror(errno);
    }
    accept_socket_->SetReuseAddr(true);
}

Acceptor::~Acceptor() {
    TakePendingLingering();
    for (const auto& l : lingering_) {
        ::close(l.fd);
    }
    lingering_.clear();
    if (wakeup_fd_ >= 0) {
        ::close(wakeup_fd_);
    }
}

bool Acceptor::Listen() {
    if (!accept_socket_ || accept_socket_->fd() < 0 || wakeup_fd_ < 0) return false;
    if (!accept_socket_->BindAddress(listenAddr_)) return false;
    if (!accept_socket_->Listen()) return false;
    // Non-blocking so HandleRead can drain the backlog without stalling the loop.
    accept_socket_->SetNonBlocking(true);

    InetAddress local;
    if (accept_socket_->GetLocalAddress(&local)) {
        boundPort_ = local.port();
    } else {
        boundPort_ = listenAddr_.port();
    }
    return true;
}

void Acceptor::Loop() {
    LOG_DEBUG << "Acceptor loop start port=" << boundPort_;
    std::vector<pollfd> fds;
    std::vector<short> lingerEvents;
    while (!quit_) {
        TakePendingLingering();
        fds.clear();
        fds.push_back(pollfd{accept_socket_->fd(), POLLIN, 0});
        fds.push_back(pollfd{wakeup_fd_, POLLIN, 0});
        for (const auto& l : lingering_) {
            fds.push_back(pollfd{l.fd, POLLIN, 0});
        }

        const int n = ::poll(fds.data(), fds.size(), NextPollTimeoutMs());
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR << "Acceptor poll failed: " << std::strerror(errno);
            break;
        }

        if (fds[1].revents & POLLIN) {
            HandleWakeup();
        }
        if (quit_) break;

        lingerEvents.clear();
        for (size_t i = 2; i < fds.size(); ++i) {
            lingerEvents.push_back(fds[i].revents);
        }
        ServiceLingering(lingerEvents);

        if (fds[0].revents & POLLIN) {
            HandleRead();
        }
    }
    LOG_DEBUG << "Acceptor loop stop port=" << boundPort_;
}

void Acceptor::Quit() {
    quit_ = true;
    Wakeup();
}

void Acceptor::CloseListener() {
    accept_socket_.reset();
}

void Acceptor::Wakeup() {
    uint64_t one = 1;
    ssize_t n = ::write(wakeup_fd_, &one, sizeof one);
    if (n != sizeof one) {
        LOG_ERROR << "Acceptor::Wakeup writes " << n << " bytes instead of 8";
    }
}

void Acceptor::Linger(int fd, int timeoutMs) {
    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        if (static_cast<int>(pendingLingering_.size()) < kMaxLingering) {
            pendingLingering_.push_back(
                Lingering{fd, std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs)});
            fd = -1;
        }
    }
    if (fd >= 0) {
        ::close(fd);
        return;
    }
    Wakeup();
}

void Acceptor::TakePendingLingering() {
    std::vector<Lingering> pending;
    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        pending.swap(pendingLingering_);
    }
    for (const auto& l : pending) {
        if (static_cast<int>(lingering_.size()) >= kMaxLingering) {
            ::close(l.fd);
        } else {
            lingering_.push_back(l);
        }
    }
}

void Acceptor::FlushLingering() {
    std::vector<pollfd> fds;
    std::vector<short> revents;
    while (true) {
        TakePendingLingering();
        if (lingering_.empty()) return;
        fds.clear();
        for (const auto& l : lingering_) {
            fds.push_back(pollfd{l.fd, POLLIN, 0});
        }
        const int n = ::poll(fds.data(), fds.size(), NextPollTimeoutMs());
        if (n < 0 && errno != EINTR) {
            LOG_ERROR << "Acceptor::FlushLingering poll failed: " << std::strerror(errno);
            for (const auto& l : lingering_) {
                ::close(l.fd);
            }
            lingering_.clear();
            return;
        }
        revents.clear();
        for (const auto& pfd : fds) {
            revents.push_back(n > 0 ? pfd.revents : 0);
        }
        ServiceLingering(revents);
    }
}

void Acceptor::HandleRead() {
    while (!quit_) {
        InetAddress peerAddr;
        int connfd = accept_socket_->Accept(&peerAddr);
        if (connfd < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            if (errno == EINTR || errno == ECONNABORTED) continue;
            LOG_ERROR << "in Acceptor::HandleRead: " << std::strerror(errno);
            if (errno == EMFILE || errno == ENFILE) {
                LOG_ERROR << "sockfd reached limit";
            }
            return;
        }
        if (new_connection_callback_) {
            new_connection_callback_(connfd, peerAddr);
        } else {
            ::close(connfd);
        }
    }
}

void Acceptor::HandleWakeup() {
    uint64_t one = 1;
    ssize_t n = ::read(wakeup_fd_, &one, sizeof one);
    if (n != sizeof one) {
        LOG_ERROR << "Acceptor::HandleWakeup reads " << n << " bytes instead of 8";
    }
}

void Acceptor::ServiceLingering(const std::vector<short>& revents) {
    const auto now = std::chrono::steady_clock::now();
    std::vector<Lingering> keep;
    keep.reserve(lingering_.size());
    char sink[4096];
    for (size_t i = 0; i < lingering_.size(); ++i) {
        const Lingering& l = lingering_[i];
        bool done = now >= l.deadline;
        // Entries added after poll() was armed have no revents yet.
        const short ev = i < revents.size() ? revents[i] : 0;
        if (!done && (ev & (POLLIN | POLLHUP | POLLERR))) {
            while (true) {
                const ssize_t r = ::recv(l.fd, sink, sizeof sink, MSG_DONTWAIT);
                if (r > 0) continue;
                if (r < 0 && errno == EINTR) continue;
                if (r < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                done = true;
                break;
            }
        }
        if (done) {
            ::close(l.fd);
        } else {
            keep.push_back(l);
        }
    }
    lingering_.swap(keep);
}

int Acceptor::NextPollTimeoutMs() const {
    if (lingering_.empty()) return kPollTimeMs;
    const auto now = std::chrono::steady_clock::now();
    auto earliest = lingering_.front().deadline;
    for (const auto& l : lingering_) {
        earliest = std::min(earliest, l.deadline);
    }
    if (earliest <= now) return 0;
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(earliest - now).count() + 1;
    return static_cast<int>(std::min<long long>(ms, kPollTimeMs));
}

} // namespace network
} // namespace ingest
