#include "ingest/pipeline/RequestHandler.h"
#include "ingest/pipeline/EventQueue.h"
#include "ingest/codec/CodecRegistry.h"
#include "ingest/common/Logger.h"
#include "ingest/protocol/Compression.h"

#include <exception>
#include <vector>

namespace ingest {
namespace pipeline {

using protocol::Compression;
using protocol::HttpRequest;
using protocol::HttpResponse;

namespace {

const char kDecompressFailed[] = "Failed to decompress body";

} // namespace

RequestHandler::RequestHandler(const common::ServerConfig& config,
                               const codec::CodecRegistry* registry,
                               EventQueue* queue)
    : registry_(registry),
      queue_(queue),
      auth_(config.user, config.password),
      successCode_(static_cast<HttpResponse::HttpStatusCode>(config.responseCode)),
      responseHeaders_(config.responseHeaders),
      maxContentLength_(config.maxContentLength) {
}

HttpResponse RequestHandler::MakeResponse(HttpResponse::HttpStatusCode code, const std::string& body) const {
    HttpResponse resp(code);
    resp.mergeHeaders(responseHeaders_);
    if (code != HttpResponse::k204NoContent) {
        resp.setBody(body);
    }
    return resp;
}

HttpResponse RequestHandler::Handle(const HttpRequest& request, const std::string& remoteIp) const {
    try {
        return Process(request, remoteIp);
    } catch (const std::exception& e) {
        LOG_ERROR << "request from " << remoteIp << " failed: " << e.what();
        return MakeResponse(HttpResponse::k500InternalServerError, "Internal Server Error");
    }
}

HttpResponse RequestHandler::Process(const HttpRequest& request, const std::string& remoteIp) const {
    const HttpRequest::Method method = request.getMethod();
    if (method != HttpRequest::kPost && method != HttpRequest::kPut) {
        LOG_DEBUG << "method " << request.methodString() << " not allowed from " << remoteIp;
        HttpResponse resp = MakeResponse(HttpResponse::k405MethodNotAllowed);
        resp.addHeader("allow", "POST, PUT");
        return resp;
    }

    if (!auth_.Check(request.getHeader("authorization"))) {
        LOG_INFO << "authentication failed for " << remoteIp;
        HttpResponse resp = MakeResponse(HttpResponse::k401Unauthorized);
        resp.addHeader("www-authenticate", "Basic realm=\"ingest\"");
        return resp;
    }

    const Compression::Encoding enc = Compression::ParseContentEncoding(request.getHeader("content-encoding"));
    std::string decompressed;
    const std::string* body = &request.body();
    if (enc != Compression::Encoding::kIdentity) {
        const Compression::Status st = Compression::Decompress(enc, request.body(), &decompressed, maxContentLength_);
        if (st == Compression::Status::kTooLarge) {
            LOG_INFO << "decompressed body from " << remoteIp << " exceeds " << maxContentLength_ << " bytes";
            return MakeResponse(HttpResponse::k413PayloadTooLarge, "Payload Too Large");
        }
        if (st != Compression::Status::kOk) {
            LOG_INFO << "failed to decompress " << Compression::EncodingName(enc) << " body from " << remoteIp;
            return MakeResponse(HttpResponse::k400BadRequest, kDecompressFailed);
        }
        body = &decompressed;
    }

    const codec::Codec* codec = registry_->Resolve(request.getHeader("content-type"));
    if (!codec) {
        return MakeResponse(HttpResponse::k500InternalServerError, "No codec available");
    }
    std::vector<codec::Event> events;
    std::string error;
    if (!registry_->Decode(*codec, *body, &events, &error)) {
        LOG_INFO << "codec " << codec->name << " rejected body from " << remoteIp << ": " << error;
        return MakeResponse(HttpResponse::k400BadRequest, error);
    }

    size_t pushed = 0;
    for (auto& ev : events) {
        if (!queue_->Push(std::move(ev).WithField("host", remoteIp))) {
            LOG_WARN << "queue closed after " << pushed << " of " << events.size()
                     << " events from " << remoteIp;
            return MakeResponse(HttpResponse::k503ServiceUnavailable, "Service Unavailable");
        }
        ++pushed;
    }
    LOG_DEBUG << "enqueued " << pushed << " events from " << remoteIp << " codec=" << codec->name;

    return MakeResponse(successCode_, "ok");
}

} // namespace pipeline
} // namespace ingest
