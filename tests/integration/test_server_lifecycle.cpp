#include "ingest/IngestServer.h"
#include "ingest/common/Logger.h"
#include "ingest/pipeline/EventQueue.h"

#include "integration/test_client.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>

using namespace ingest;
using namespace ingest::common;
using namespace ingest::codec;
using namespace ingest::pipeline;
using testclient::ClientResponse;

static ServerConfig LocalConfig() {
    ServerConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = 0;
    cfg.threads = 2;
    return cfg;
}

template <typename Fn>
static bool ThrowsConfigurationError(Fn fn) {
    try {
        fn();
    } catch (const ConfigurationError& e) {
        LOG_INFO << "expected: " << e.what();
        return true;
    }
    return false;
}

void testStartStop() {
    BoundedEventQueue q(8);
    IngestServer server(LocalConfig(), &q);
    assert(!server.running());
    assert(server.busyWorkers() == 0);
    assert(server.rejectedConnections() == 0);
    assert(server.codecs().defaultCodec() == "plain");

    server.Start();
    assert(server.running());
    assert(server.port() != 0);
    // Starting twice is a no-op.
    const uint16_t port = server.port();
    server.Start();
    assert(server.port() == port);

    ClientResponse resp = testclient::Post(port, "/", {}, "alive");
    assert(resp.status == 200);

    server.Stop();
    assert(!server.running());
    server.Stop();

    // The listener is gone once stopped.
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    assert(::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0);
    ::close(fd);
    LOG_INFO << "Start/stop PASS";
}

void testBindConflict() {
    BoundedEventQueue q(8);
    IngestServer first(LocalConfig(), &q);
    first.Start();

    ServerConfig cfg = LocalConfig();
    cfg.port = first.port();
    IngestServer second(cfg, &q);
    bool threw = false;
    try {
        second.Start();
    } catch (const std::runtime_error& e) {
        threw = true;
        LOG_INFO << "expected: " << e.what();
    }
    assert(threw);
    assert(!second.running());
    first.Stop();
    LOG_INFO << "Bind conflict PASS";
}

void testInvalidConfiguration() {
    BoundedEventQueue q(8);

    ServerConfig unknownCodec = LocalConfig();
    unknownCodec.codec = "msgpack";
    assert(ThrowsConfigurationError([&] { IngestServer s(unknownCodec, &q); }));

    ServerConfig unknownOverride = LocalConfig();
    unknownOverride.additionalCodecs["text/csv"] = "csv";
    assert(ThrowsConfigurationError([&] { IngestServer s(unknownOverride, &q); }));

    ServerConfig halfAuth = LocalConfig();
    halfAuth.user = "only-user";
    assert(ThrowsConfigurationError([&] { IngestServer s(halfAuth, &q); }));

    ServerConfig noThreads = LocalConfig();
    noThreads.threads = 0;
    assert(ThrowsConfigurationError([&] { IngestServer s(noThreads, &q); }));

    ServerConfig badCode = LocalConfig();
    badCode.responseCode = 302;
    assert(ThrowsConfigurationError([&] { IngestServer s(badCode, &q); }));

    ServerConfig badHost = LocalConfig();
    badHost.host = "not-an-ip";
    assert(ThrowsConfigurationError([&] { IngestServer s(badHost, &q); }));

    assert(ThrowsConfigurationError([&] { IngestServer s(LocalConfig(), nullptr); }));
    LOG_INFO << "Invalid configuration PASS";
}

void testStopDrainsInFlightRequest() {
    BoundedEventQueue q(8);
    IngestServer server(LocalConfig(), &q);
    server.Start();

    // Headers now, body after Stop has begun.
    int fd = testclient::ConnectTo(server.port());
    assert(testclient::SendAll(fd, "POST / HTTP/1.1\r\nHost: x\r\nContent-Length: 8\r\n\r\nhalf"));
    assert(testclient::WaitFor([&] { return server.busyWorkers() == 1; }));

    std::atomic<bool> stopped{false};
    std::thread stopper([&]() {
        server.Stop();
        stopped = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    assert(!stopped);

    assert(testclient::SendAll(fd, "done"));
    std::string raw = testclient::RecvUntilClose(fd);
    ::close(fd);
    stopper.join();
    assert(stopped);

    ClientResponse resp;
    assert(testclient::ParseResponse(raw, &resp));
    assert(resp.status == 200);
    Event e;
    assert(q.TryPop(&e, std::chrono::milliseconds(1000)));
    assert(e.getString("message") == "halfdone");
    LOG_INFO << "Stop drains in-flight request PASS";
}

void testDestructorStops() {
    BoundedEventQueue q(8);
    uint16_t port = 0;
    {
        IngestServer server(LocalConfig(), &q);
        server.Start();
        port = server.port();
        ClientResponse resp = testclient::Post(port, "/", {}, "bye");
        assert(resp.status == 200);
    }
    assert(port != 0);
    // The port can be bound again right away.
    ServerConfig cfg = LocalConfig();
    cfg.port = port;
    IngestServer again(cfg, &q);
    again.Start();
    assert(again.port() == port);
    again.Stop();
    LOG_INFO << "Destructor stops PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testStartStop();
    testBindConflict();
    testInvalidConfiguration();
    testStopDrainsInFlightRequest();
    testDestructorStops();
    return 0;
}
