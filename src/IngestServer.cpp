#include "ingest/IngestServer.h"
#include "ingest/common/Logger.h"
#include "ingest/network/Acceptor.h"
#include "ingest/network/Buffer.h"
#include "ingest/network/Connection.h"
#include "ingest/network/InetAddress.h"
#include "ingest/network/TlsContext.h"
#include "ingest/network/WorkerPool.h"
#include "ingest/pipeline/AdmissionController.h"
#include "ingest/pipeline/EventQueue.h"
#include "ingest/pipeline/RequestHandler.h"
#include "ingest/protocol/HttpContext.h"
#include "ingest/protocol/HttpResponse.h"

#include <cctype>
#include <cstring>
#include <stdexcept>
#include <unistd.h>

namespace ingest {

using protocol::HttpResponse;

namespace {

const char kContinue[] = "HTTP/1.1 100 Continue\r\n\r\n";

bool IEquals(const std::string& a, const char* b) {
    const size_t n = std::strlen(b);
    if (a.size() != n) return false;
    for (size_t i = 0; i < n; ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool SendResponse(network::Connection* conn, const HttpResponse& resp) {
    network::Buffer out;
    resp.appendToBuffer(&out);
    return conn->WriteAll(out.RetrieveAllAsString());
}

} // namespace

IngestServer::IngestServer(const common::ServerConfig& config, pipeline::EventQueue* queue)
    : config_(config),
      queue_(queue),
      running_(false),
      port_(config.port) {
    config_.Validate();
    if (!queue_) {
        throw common::ConfigurationError("an event queue is required");
    }
    network::InetAddress parsed;
    if (!network::InetAddress::FromIpPort(config_.host, config_.port, &parsed)) {
        throw common::ConfigurationError("host is not an IPv4 address: " + config_.host);
    }
    std::string err;
    if (!registry_.Configure(config_.codec, config_.additionalCodecs, &err)) {
        throw common::ConfigurationError(err);
    }
    handler_.reset(new pipeline::RequestHandler(config_, &registry_, queue_));
}

IngestServer::~IngestServer() {
    Stop();
}

void IngestServer::Start() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (running_) return;

    tls_.reset();
    if (config_.ssl) {
        std::unique_ptr<network::TlsContext> tls(new network::TlsContext());
        std::string err;
        if (!tls->InitServerFromPkcs12(config_.keystore, config_.keystorePassword, &err)) {
            throw common::ConfigurationError("cannot load keystore " + config_.keystore + ": " + err);
        }
        tls_ = std::move(tls);
    }

    network::InetAddress listenAddr;
    if (!network::InetAddress::FromIpPort(config_.host, config_.port, &listenAddr)) {
        throw common::ConfigurationError("host is not an IPv4 address: " + config_.host);
    }
    std::unique_ptr<network::Acceptor> acceptor(new network::Acceptor(listenAddr));
    if (!acceptor->Listen()) {
        throw std::runtime_error("cannot bind or listen on " + listenAddr.toIpPort());
    }
    acceptor_ = std::move(acceptor);
    port_ = acceptor_->port();

    pool_.reset(new network::WorkerPool("ingest-worker"));
    pool_->SetThreadNum(config_.threads);
    pool_->Start();
    if (tls_) {
        rejectPool_.reset(new network::WorkerPool("ingest-reject"));
        rejectPool_->SetThreadNum(kRejectThreads);
        rejectPool_->Start();
    }
    admission_.reset(new pipeline::AdmissionController(
        pool_.get(), [this](const std::shared_ptr<network::Connection>& conn) { ServeConnection(conn); }));

    acceptor_->SetNewConnectionCallback(
        [this](int sockfd, const network::InetAddress& peer) { OnNewConnection(sockfd, peer); });
    acceptThread_ = std::thread([this]() { acceptor_->Loop(); });
    running_ = true;

    LOG_INFO << "IngestServer listening on " << config_.host << ":" << port_
             << " threads=" << config_.threads
             << " tls=" << (tls_ ? "on" : "off")
             << " auth=" << (config_.authEnabled() ? "on" : "off")
             << " codec=" << registry_.defaultCodec();
}

void IngestServer::Stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!running_) return;
    running_ = false;

    acceptor_->Quit();
    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    acceptor_->CloseListener();

    LOG_INFO << "IngestServer on port " << port_ << " draining " << pool_->busy() << " in-flight requests";
    if (rejectPool_) {
        rejectPool_->Stop();
    }
    pool_->Stop();
    // Workers may have handed fds to the acceptor up to their last request.
    acceptor_->FlushLingering();
    acceptor_.reset();
    LOG_INFO << "IngestServer stopped, rejected " << admission_->rejected()
             << " of " << (admission_->accepted() + admission_->rejected()) << " connections";
}

int IngestServer::busyWorkers() const {
    return pool_ ? pool_->busy() : 0;
}

uint64_t IngestServer::rejectedConnections() const {
    return admission_ ? admission_->rejected() : 0;
}

void IngestServer::OnNewConnection(int sockfd, const network::InetAddress& peerAddr) {
    std::shared_ptr<network::Connection> conn =
        std::make_shared<network::Connection>(sockfd, peerAddr, tls_ ? tls_->ctx() : nullptr);
    if (admission_->Admit(conn) == pipeline::AdmissionController::kAccepted) {
        return;
    }
    if (!rejectPool_) {
        RejectConnection(conn);
        return;
    }
    // A TLS handshake can stall for kRejectIoTimeoutMs; keep it off the accept thread.
    if (!rejectPool_->TrySubmit([this, conn]() { RejectConnection(conn); })) {
        LOG_DEBUG << "dropping rejected TLS connection from " << peerAddr.toIpPort();
    }
}

void IngestServer::RejectConnection(const std::shared_ptr<network::Connection>& conn) {
    conn->SetIoTimeout(kRejectIoTimeoutMs);
    if (!conn->Handshake()) {
        return;
    }
    if (!SendResponse(conn.get(), handler_->MakeResponse(HttpResponse::k429TooManyRequests))) {
        LOG_DEBUG << "failed to send 429 to " << conn->peerAddress().toIpPort();
        return;
    }
    CloseConnection(conn.get(), false);
}

void IngestServer::CloseConnection(network::Connection* conn, bool drained) {
    const int fd = conn->Release();
    if (fd < 0) return;
    if (drained) {
        ::close(fd);
    } else {
        acceptor_->Linger(fd, kLingerMs);
    }
}

void IngestServer::ServeConnection(const std::shared_ptr<network::Connection>& conn) {
    conn->SetIoTimeout(config_.readTimeoutMs);
    if (!conn->Handshake()) {
        return;
    }

    const std::string remoteIp = conn->peerAddress().toIp();
    protocol::HttpContext context(config_.maxContentLength);
    network::Buffer input;
    char buf[16384];
    bool continueSent = false;
    HttpResponse resp;

    while (true) {
        const ssize_t n = conn->Read(buf, sizeof buf);
        if (n <= 0) {
            LOG_DEBUG << "connection from " << conn->peerAddress().toIpPort()
                      << (n == 0 ? " closed" : " read error or timeout") << " before a full request";
            return;
        }
        input.Append(buf, static_cast<size_t>(n));

        if (!context.parseRequest(&input)) {
            if (context.bodyTooLarge()) {
                LOG_INFO << "request body from " << remoteIp << " exceeds " << config_.maxContentLength << " bytes";
                resp = handler_->MakeResponse(HttpResponse::k413PayloadTooLarge, "Payload Too Large");
            } else {
                LOG_DEBUG << "malformed request from " << remoteIp;
                resp = handler_->MakeResponse(HttpResponse::k400BadRequest, "Bad Request");
            }
            break;
        }
        if (context.gotAll()) {
            resp = handler_->Handle(context.request(), remoteIp);
            break;
        }
        if (context.expectingBody() && !continueSent &&
            IEquals(context.request().getHeader("expect"), "100-continue")) {
            continueSent = true;
            if (!conn->WriteAll(kContinue)) return;
        }
    }

    if (!SendResponse(conn.get(), resp)) {
        LOG_DEBUG << "failed to send " << resp.statusCode() << " to " << conn->peerAddress().toIpPort();
        return;
    }
    // After an early 413/400 the client may still be sending its body.
    CloseConnection(conn.get(), context.gotAll() && input.ReadableBytes() == 0);
}

} // namespace ingest
