#pragma once

#include "ingest/protocol/HttpRequest.h"
#include "ingest/network/Buffer.h"

#include <cstddef>
#include <limits>

namespace ingest {
namespace protocol {

// Incremental HTTP/1.x request parser fed from a Buffer. Handles Content-Length
// and chunked bodies and refuses bodies above maxBodySize.
class HttpContext {
public:
    enum HttpRequestParseState {
        kExpectRequestLine,
        kExpectHeaders,
        kExpectBody,
        kGotAll,
    };

    static constexpr size_t kMaxHeaderBytes = 64 * 1024;

    explicit HttpContext(size_t maxBodySize = std::numeric_limits<size_t>::max())
        : state_(kExpectRequestLine),
          maxBodySize_(maxBodySize) {}

    // return false if some error; bodyTooLarge() tells an oversized body apart
    bool parseRequest(ingest::network::Buffer* buf);

    bool gotAll() const { return state_ == kGotAll; }
    bool expectingBody() const { return state_ == kExpectBody; }
    bool bodyTooLarge() const { return bodyTooLarge_; }

    void reset() {
        state_ = kExpectRequestLine;
        HttpRequest dummy;
        request_.swap(dummy);
        chunked_ = false;
        contentLength_ = 0;
        bodyRemaining_ = 0;
        chunkSize_ = 0;
        expectingChunkSize_ = true;
        inTrailers_ = false;
        headerBytes_ = 0;
        bodyTooLarge_ = false;
    }

    const HttpRequest& request() const { return request_; }
    HttpRequest& request() { return request_; }

private:
    bool processRequestLine(const char* begin, const char* end);
    bool processHeadersDone();
    bool processChunkedBody(ingest::network::Buffer* buf, bool* hasMore);

    HttpRequestParseState state_;
    HttpRequest request_;
    size_t maxBodySize_;
    size_t headerBytes_{0};
    bool bodyTooLarge_{false};

    // Body parsing state
    bool chunked_{false};
    size_t contentLength_{0};
    size_t bodyRemaining_{0};
    size_t chunkSize_{0};
    bool expectingChunkSize_{true};
    bool inTrailers_{false};
};

} // namespace protocol
} // namespace ingest
