#pragma once

#include "ingest/common/noncopyable.h"
#include "ingest/network/InetAddress.h"
#include "ingest/network/Socket.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace ingest {
namespace network {

// Accept loop: poll()s the listening socket and an eventfd used by Quit().
// Also drains and closes half-closed sockets handed over with Linger(), so a
// rejected client receives its response before the connection goes away.
class Acceptor : ingest::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd, const InetAddress&)>;

    static constexpr int kMaxLingering = 1024;

    explicit Acceptor(const InetAddress& listenAddr);
    ~Acceptor();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) {
        new_connection_callback_ = cb;
    }

    // Binds and listens; false if either fails.
    bool Listen();
    // Bound port, meaningful once Listen() succeeded (resolves port 0).
    uint16_t port() const { return boundPort_; }

    // Runs in the calling thread until Quit().
    void Loop();
    // Any thread.
    void Quit();
    // After Loop() returned: new connection attempts are refused from here on.
    void CloseListener();

    // Any thread. Takes ownership of a half-closed fd and closes it once the
    // peer sends EOF or timeoutMs elapses. Beyond kMaxLingering fds are closed
    // at once.
    void Linger(int fd, int timeoutMs);
    // After Loop() returned: blocks until every lingering fd is closed.
    void FlushLingering();

private:
    struct Lingering {
        int fd;
        std::chrono::steady_clock::time_point deadline;
    };

    void HandleRead();
    void HandleWakeup();
    void Wakeup();
    void TakePendingLingering();
    void ServiceLingering(const std::vector<short>& revents);
    int NextPollTimeoutMs() const;

    InetAddress listenAddr_;
    std::unique_ptr<Socket> accept_socket_;
    int wakeup_fd_;
    NewConnectionCallback new_connection_callback_;
    uint16_t boundPort_;
    std::atomic_bool quit_;
    // Owned by the loop thread (or the flushing thread once the loop is gone).
    std::vector<Lingering> lingering_;
    std::mutex pendingMutex_;
    std::vector<Lingering> pendingLingering_;
};

} // namespace network
} // namespace ingest
