#include "ingest/pipeline/RequestHandler.h"
#include "ingest/pipeline/EventQueue.h"
#include "ingest/codec/CodecRegistry.h"
#include "ingest/common/Logger.h"
#include "ingest/protocol/BasicAuth.h"
#include "ingest/protocol/Compression.h"

#include <cassert>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace ingest::pipeline;
using namespace ingest::codec;
using namespace ingest::common;
using namespace ingest::protocol;

static HttpRequest MakeRequest(const std::string& method,
                               const std::vector<std::pair<std::string, std::string>>& headers,
                               const std::string& body) {
    HttpRequest req;
    req.setMethod(method.data(), method.data() + method.size());
    const std::string path = "/";
    req.setPath(path.data(), path.data() + path.size());
    req.setVersion(HttpRequest::kHttp11);
    for (const auto& h : headers) req.setHeader(h.first, h.second);
    req.setBody(body);
    return req;
}

static std::vector<Event> Drain(BoundedEventQueue* q) {
    std::vector<Event> out;
    Event e;
    while (q->TryPop(&e, std::chrono::milliseconds(0))) out.push_back(e);
    return out;
}

static bool DecodeThrows(const std::string&, std::vector<Event>*, std::string*) {
    throw std::runtime_error("codec blew up");
}

void testPlainPost() {
    ServerConfig cfg;
    CodecRegistry reg;
    BoundedEventQueue q(16);
    RequestHandler handler(cfg, &reg, &q);

    HttpResponse resp = handler.Handle(MakeRequest("POST", {{"Content-Type", "text/plain"}}, "hello"), "127.0.0.1");
    assert(resp.statusCode() == HttpResponse::k200Ok);
    assert(resp.body() == "ok");
    assert(resp.getHeader("content-type") == "text/plain");

    std::vector<Event> events = Drain(&q);
    assert(events.size() == 1);
    assert(events[0].getString("message") == "hello");
    assert(events[0].getString("host") == "127.0.0.1");

    resp = handler.Handle(MakeRequest("PUT", {}, "again"), "10.1.2.3");
    assert(resp.statusCode() == HttpResponse::k200Ok);
    events = Drain(&q);
    assert(events.size() == 1);
    assert(events[0].getString("host") == "10.1.2.3");
    LOG_INFO << "Plain post PASS";
}

void testMethodNotAllowed() {
    ServerConfig cfg;
    cfg.user = "test";
    cfg.password = "pwd";
    CodecRegistry reg;
    BoundedEventQueue q(4);
    RequestHandler handler(cfg, &reg, &q);

    // Method is checked before credentials.
    const char* methods[] = {"GET", "DELETE", "HEAD", "PATCH", "FOO"};
    for (const char* m : methods) {
        HttpResponse resp = handler.Handle(MakeRequest(m, {}, ""), "127.0.0.1");
        assert(resp.statusCode() == HttpResponse::k405MethodNotAllowed);
        assert(resp.getHeader("allow") == "POST, PUT");
    }
    assert(q.Size() == 0);
    LOG_INFO << "Method not allowed PASS";
}

void testAuth() {
    ServerConfig cfg;
    cfg.user = "test";
    cfg.password = "pwd";
    CodecRegistry reg;
    BoundedEventQueue q(4);
    RequestHandler handler(cfg, &reg, &q);

    HttpResponse resp = handler.Handle(MakeRequest("POST", {}, "x"), "127.0.0.1");
    assert(resp.statusCode() == HttpResponse::k401Unauthorized);
    assert(resp.getHeader("www-authenticate").find("Basic") == 0);

    resp = handler.Handle(MakeRequest("POST", {{"Authorization", "Basic meh"}}, "x"), "127.0.0.1");
    assert(resp.statusCode() == HttpResponse::k401Unauthorized);
    assert(q.Size() == 0);

    const std::string good = "Basic " + BasicAuth::EncodeBase64("test:pwd");
    resp = handler.Handle(MakeRequest("POST", {{"Authorization", good}}, "x"), "127.0.0.1");
    assert(resp.statusCode() == HttpResponse::k200Ok);
    assert(q.Size() == 1);
    LOG_INFO << "Auth PASS";
}

void testCompressedBodies() {
    ServerConfig cfg;
    CodecRegistry reg;
    BoundedEventQueue q(16);
    RequestHandler handler(cfg, &reg, &q);

    std::string gz, zl;
    assert(Compression::Compress(Compression::Encoding::kGzip, std::string("zipped"), &gz));
    assert(Compression::Compress(Compression::Encoding::kDeflate, std::string("deflated"), &zl));

    HttpResponse resp = handler.Handle(MakeRequest("POST", {{"Content-Encoding", "gzip"}}, gz), "127.0.0.1");
    assert(resp.statusCode() == HttpResponse::k200Ok);
    resp = handler.Handle(MakeRequest("POST", {{"Content-Encoding", "deflate"}}, zl), "127.0.0.1");
    assert(resp.statusCode() == HttpResponse::k200Ok);
    std::vector<Event> events = Drain(&q);
    assert(events.size() == 2);
    assert(events[0].getString("message") == "zipped");
    assert(events[1].getString("message") == "deflated");

    resp = handler.Handle(MakeRequest("POST", {{"Content-Encoding", "gzip"}}, "not gzip"), "127.0.0.1");
    assert(resp.statusCode() == HttpResponse::k400BadRequest);
    assert(resp.body() == "Failed to decompress body");
    resp = handler.Handle(MakeRequest("POST", {{"Content-Encoding", "deflate"}}, "not deflate"), "127.0.0.1");
    assert(resp.statusCode() == HttpResponse::k400BadRequest);
    assert(resp.body() == "Failed to decompress body");
    assert(q.Size() == 0);

    // Unknown encodings pass the body through untouched.
    resp = handler.Handle(MakeRequest("POST", {{"Content-Encoding", "br"}}, "raw"), "127.0.0.1");
    assert(resp.statusCode() == HttpResponse::k200Ok);
    events = Drain(&q);
    assert(events.size() == 1 && events[0].getString("message") == "raw");
    LOG_INFO << "Compressed bodies PASS";
}

void testDecompressedSizeLimit() {
    ServerConfig cfg;
    cfg.maxContentLength = 64;
    CodecRegistry reg;
    BoundedEventQueue q(4);
    RequestHandler handler(cfg, &reg, &q);

    std::string gz;
    assert(Compression::Compress(Compression::Encoding::kGzip, std::string(4096, 'a'), &gz));
    assert(gz.size() < 64);
    HttpResponse resp = handler.Handle(MakeRequest("POST", {{"Content-Encoding", "gzip"}}, gz), "127.0.0.1");
    assert(resp.statusCode() == HttpResponse::k413PayloadTooLarge);
    assert(q.Size() == 0);
    LOG_INFO << "Decompressed size limit PASS";
}

void testJsonAndCodecErrors() {
    ServerConfig cfg;
    CodecRegistry reg;
    BoundedEventQueue q(16);
    RequestHandler handler(cfg, &reg, &q);

    HttpResponse resp = handler.Handle(
        MakeRequest("POST", {{"Content-Type", "application/json"}}, "{\"message_body\":\"Hello\"}"), "127.0.0.1");
    assert(resp.statusCode() == HttpResponse::k200Ok);
    std::vector<Event> events = Drain(&q);
    assert(events.size() == 1);
    assert(events[0].getString("message_body") == "Hello");
    assert(events[0].getString("host") == "127.0.0.1");

    resp = handler.Handle(MakeRequest("POST", {{"Content-Type", "application/json"}}, "{oops"), "127.0.0.1");
    assert(resp.statusCode() == HttpResponse::k400BadRequest);
    assert(resp.body().find("Invalid JSON") == 0);

    // A batch that fails halfway enqueues nothing.
    resp = handler.Handle(MakeRequest("POST", {{"Content-Type", "application/json"}}, "[{\"a\":1}, 7]"),
                          "127.0.0.1");
    assert(resp.statusCode() == HttpResponse::k400BadRequest);
    assert(q.Size() == 0);
    LOG_INFO << "Json and codec errors PASS";
}

void testResponseCodeAndHeaders() {
    ServerConfig cfg;
    cfg.responseCode = 204;
    cfg.responseHeaders["access-control-allow-origin"] = "*";
    CodecRegistry reg;
    BoundedEventQueue q(4);
    RequestHandler handler(cfg, &reg, &q);

    HttpResponse resp = handler.Handle(MakeRequest("POST", {}, "x"), "127.0.0.1");
    assert(resp.statusCode() == HttpResponse::k204NoContent);
    assert(resp.body().empty());
    assert(resp.getHeader("access-control-allow-origin") == "*");
    std::string wire = resp.toString();
    assert(wire.find("HTTP/1.1 204 No Content\r\n") == 0);
    assert(wire.find("content-length") == std::string::npos);

    cfg.responseCode = 201;
    RequestHandler created(cfg, &reg, &q);
    resp = created.Handle(MakeRequest("POST", {}, "y"), "127.0.0.1");
    assert(resp.statusCode() == HttpResponse::k201Created);
    assert(resp.body() == "ok");

    // Configured headers also apply to error responses, without clobbering allow.
    resp = created.Handle(MakeRequest("GET", {}, ""), "127.0.0.1");
    assert(resp.getHeader("access-control-allow-origin") == "*");
    assert(resp.getHeader("allow") == "POST, PUT");

    resp = created.MakeResponse(HttpResponse::k429TooManyRequests);
    assert(resp.statusCode() == HttpResponse::k429TooManyRequests);
    assert(resp.getHeader("access-control-allow-origin") == "*");
    LOG_INFO << "Response code and headers PASS";
}

void testClosedQueueAndFailures() {
    ServerConfig cfg;
    CodecRegistry reg;
    reg.Register("explode", &DecodeThrows);
    assert(reg.SetOverride("text/explode", "explode"));
    BoundedEventQueue q(4);
    RequestHandler handler(cfg, &reg, &q);

    HttpResponse resp = handler.Handle(MakeRequest("POST", {{"Content-Type", "text/explode"}}, "x"), "127.0.0.1");
    assert(resp.statusCode() == HttpResponse::k500InternalServerError);

    q.Close();
    resp = handler.Handle(MakeRequest("POST", {}, "late"), "127.0.0.1");
    assert(resp.statusCode() == HttpResponse::k503ServiceUnavailable);
    LOG_INFO << "Closed queue and failures PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::WARN);
    testPlainPost();
    testMethodNotAllowed();
    testAuth();
    testCompressedBodies();
    testDecompressedSizeLimit();
    testJsonAndCodecErrors();
    testResponseCodeAndHeaders();
    testClosedQueueAndFailures();
    Logger::Instance().SetLevel(LogLevel::INFO);
    LOG_INFO << "RequestHandler tests PASS";
    return 0;
}
