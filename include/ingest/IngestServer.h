#pragma once

#include "ingest/codec/CodecRegistry.h"
#include "ingest/common/ServerConfig.h"
#include "ingest/common/noncopyable.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace ingest {

namespace network {
class Acceptor;
class Connection;
class InetAddress;
class TlsContext;
class WorkerPool;
}

namespace pipeline {
class AdmissionController;
class EventQueue;
class RequestHandler;
}

// HTTP ingestion endpoint: one accept thread, config.threads worker slots,
// every decoded event pushed onto the injected queue.
class IngestServer : ingest::common::noncopyable {
public:
    // Cap on draining unread request bytes after a response, so the peer
    // reads the response instead of a reset. Runs on the accept thread.
    static constexpr int kLingerMs = 1000;
    // Socket timeout for the handshake and write of a 429.
    static constexpr int kRejectIoTimeoutMs = 1000;
    // Threads answering 429 over TLS; beyond that, rejected TLS clients are
    // closed without a response.
    static constexpr int kRejectThreads = 2;

    // Validates config and codec names; throws common::ConfigurationError.
    // Does not bind. queue must outlive the server.
    IngestServer(const common::ServerConfig& config, pipeline::EventQueue* queue);
    ~IngestServer();

    // Loads TLS material (ConfigurationError), binds and listens
    // (std::runtime_error), then starts the worker and accept threads.
    void Start();

    // Stops accepting, lets in-flight requests finish, joins all threads.
    // A worker blocked on a full queue only returns once the queue drains or
    // is closed. Idempotent.
    void Stop();

    bool running() const { return running_; }
    // Bound port; resolves an ephemeral port once started.
    uint16_t port() const { return port_; }
    int busyWorkers() const;
    uint64_t rejectedConnections() const;

    const common::ServerConfig& config() const { return config_; }
    const codec::CodecRegistry& codecs() const { return registry_; }

private:
    void OnNewConnection(int sockfd, const network::InetAddress& peerAddr);
    void RejectConnection(const std::shared_ptr<network::Connection>& conn);
    void ServeConnection(const std::shared_ptr<network::Connection>& conn);
    // Half-closes conn and closes its fd, lingering when the peer may still be sending.
    void CloseConnection(network::Connection* conn, bool drained);

    const common::ServerConfig config_;
    pipeline::EventQueue* queue_;
    codec::CodecRegistry registry_;
    std::unique_ptr<pipeline::RequestHandler> handler_;

    std::unique_ptr<network::TlsContext> tls_;
    std::unique_ptr<network::Acceptor> acceptor_;
    std::unique_ptr<network::WorkerPool> pool_;
    std::unique_ptr<network::WorkerPool> rejectPool_;
    std::unique_ptr<pipeline::AdmissionController> admission_;
    std::thread acceptThread_;

    std::mutex lifecycleMutex_;
    std::atomic_bool running_;
    std::atomic<uint16_t> port_;
};

} // namespace ingest
