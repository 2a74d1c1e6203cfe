#pragma once

#include "ingest/common/ServerConfig.h"
#include "ingest/protocol/BasicAuth.h"
#include "ingest/protocol/HttpRequest.h"
#include "ingest/protocol/HttpResponse.h"

#include <map>
#include <string>

namespace ingest {
namespace codec {
class CodecRegistry;
}

namespace pipeline {

class EventQueue;

// The per-request pipeline run inside a worker slot:
// method -> auth -> decompress -> decode -> enqueue -> response.
class RequestHandler {
public:
    RequestHandler(const common::ServerConfig& config,
                   const codec::CodecRegistry* registry,
                   EventQueue* queue);

    // Never throws; an unexpected exception becomes a 500.
    protocol::HttpResponse Handle(const protocol::HttpRequest& request, const std::string& remoteIp) const;

    // Response with the configured headers merged in, for statuses produced
    // outside Handle (parse errors, admission rejection).
    protocol::HttpResponse MakeResponse(protocol::HttpResponse::HttpStatusCode code,
                                        const std::string& body = std::string()) const;

private:
    protocol::HttpResponse Process(const protocol::HttpRequest& request, const std::string& remoteIp) const;

    const codec::CodecRegistry* registry_;
    EventQueue* queue_;
    protocol::BasicAuth auth_;
    protocol::HttpResponse::HttpStatusCode successCode_;
    std::map<std::string, std::string> responseHeaders_;
    size_t maxContentLength_;
};

} // namespace pipeline
} // namespace ingest
