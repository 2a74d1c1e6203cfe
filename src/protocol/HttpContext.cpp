#include "ingest/network/Buffer.h"
#include "ingest/protocol/HttpContext.h"
#include "ingest/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace ingest {
namespace protocol {

namespace {

const char kCRLF[] = "\r\n";

std::string ToLowerCopy(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string TrimCopy(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

const char* FindCRLF(const ingest::network::Buffer* buf) {
    return std::search(buf->Peek(), buf->BeginWrite(), kCRLF, kCRLF + 2);
}

} // namespace

bool HttpContext::processRequestLine(const char* begin, const char* end) {
    bool succeed = false;
    const char* start = begin;
    const char* space = std::find(start, end, ' ');
    if (space != end && request_.setMethod(start, space)) {
        start = space + 1;
        space = std::find(start, end, ' ');
        if (space != end && space != start) {
            const char* question = std::find(start, space, '?');
            if (question != space) {
                request_.setPath(start, question);
                request_.setQuery(question, space);
            } else {
                request_.setPath(start, space);
            }
            start = space + 1;
            succeed = end - start == 8 && std::equal(start, end - 1, "HTTP/1.");
            if (succeed) {
                if (*(end - 1) == '1') {
                    request_.setVersion(HttpRequest::kHttp11);
                } else if (*(end - 1) == '0') {
                    request_.setVersion(HttpRequest::kHttp10);
                } else {
                    succeed = false;
                }
            }
        }
    }
    return succeed;
}

bool HttpContext::processHeadersDone() {
    chunked_ = false;
    contentLength_ = 0;
    bodyRemaining_ = 0;
    chunkSize_ = 0;
    expectingChunkSize_ = true;
    inTrailers_ = false;

    const std::string te = request_.getHeader("Transfer-Encoding");
    if (!te.empty() && ToLowerCopy(te).find("chunked") != std::string::npos) {
        chunked_ = true;
    } else if (request_.hasHeader("Content-Length")) {
        const std::string cl = TrimCopy(request_.getHeader("Content-Length"));
        if (cl.empty() || !std::all_of(cl.begin(), cl.end(), [](char c) { return c >= '0' && c <= '9'; })) {
            return false;
        }
        errno = 0;
        const unsigned long long v = std::strtoull(cl.c_str(), nullptr, 10);
        if (errno == ERANGE || v > maxBodySize_) {
            bodyTooLarge_ = true;
            return false;
        }
        contentLength_ = static_cast<size_t>(v);
        bodyRemaining_ = contentLength_;
    }

    state_ = (chunked_ || bodyRemaining_ > 0) ? kExpectBody : kGotAll;
    return true;
}

bool HttpContext::processChunkedBody(ingest::network::Buffer* buf, bool* hasMore) {
    while (true) {
        if (inTrailers_) {
            // Trailer fields are read and dropped until the empty line.
            const char* crlf = FindCRLF(buf);
            if (crlf >= buf->BeginWrite()) {
                *hasMore = false;
                return buf->ReadableBytes() <= kMaxHeaderBytes;
            }
            const bool last = crlf == buf->Peek();
            buf->Retrieve(crlf + 2 - buf->Peek());
            if (last) {
                state_ = kGotAll;
                *hasMore = false;
                return true;
            }
            continue;
        }

        if (expectingChunkSize_) {
            const char* crlf = FindCRLF(buf);
            if (crlf >= buf->BeginWrite()) {
                *hasMore = false;
                return buf->ReadableBytes() <= kMaxHeaderBytes;
            }
            std::string line(buf->Peek(), crlf);
            buf->Retrieve(crlf + 2 - buf->Peek());

            // Strip chunk extensions.
            auto semi = line.find(';');
            if (semi != std::string::npos) line = line.substr(0, semi);
            line = TrimCopy(line);
            if (line.empty() || !std::all_of(line.begin(), line.end(),
                                             [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; })) {
                *hasMore = false;
                return false;
            }
            errno = 0;
            const unsigned long long sz = std::strtoull(line.c_str(), nullptr, 16);
            if (errno == ERANGE || sz > maxBodySize_ - request_.body().size()) {
                bodyTooLarge_ = true;
                *hasMore = false;
                return false;
            }
            chunkSize_ = static_cast<size_t>(sz);
            expectingChunkSize_ = false;
            if (chunkSize_ == 0) {
                inTrailers_ = true;
                continue;
            }
        }

        // Need chunkSize_ bytes + CRLF; chunkSize_ may be close to SIZE_MAX.
        if (buf->ReadableBytes() < 2 || buf->ReadableBytes() - 2 < chunkSize_) {
            *hasMore = false;
            return true;
        }
        const char* p = buf->Peek();
        if (p[chunkSize_] != '\r' || p[chunkSize_ + 1] != '\n') {
            *hasMore = false;
            return false;
        }
        request_.appendBody(p, chunkSize_);
        buf->Retrieve(chunkSize_ + 2);
        expectingChunkSize_ = true;
    }
}

// return false if any error
bool HttpContext::parseRequest(ingest::network::Buffer* buf) {
    bool ok = true;
    bool hasMore = true;
    while (hasMore && ok) {
        if (state_ == kExpectRequestLine || state_ == kExpectHeaders) {
            const char* crlf = FindCRLF(buf);
            if (crlf >= buf->BeginWrite()) {
                if (headerBytes_ + buf->ReadableBytes() > kMaxHeaderBytes) {
                    LOG_DEBUG << "HttpContext: header section exceeds " << kMaxHeaderBytes << " bytes";
                    ok = false;
                }
                hasMore = false;
                continue;
            }
            const size_t lineBytes = static_cast<size_t>(crlf + 2 - buf->Peek());
            headerBytes_ += lineBytes;
            if (headerBytes_ > kMaxHeaderBytes) {
                ok = false;
                continue;
            }

            if (state_ == kExpectRequestLine) {
                // Stray CRLFs before the request line are ignored.
                if (crlf != buf->Peek()) {
                    ok = processRequestLine(buf->Peek(), crlf);
                    if (ok) state_ = kExpectHeaders;
                }
                buf->Retrieve(lineBytes);
            } else if (crlf == buf->Peek()) {
                // empty line, end of headers
                buf->Retrieve(lineBytes);
                ok = processHeadersDone();
                hasMore = ok && state_ != kGotAll;
            } else {
                const char* colon = std::find(buf->Peek(), crlf, ':');
                if (colon == crlf || colon == buf->Peek()) {
                    ok = false;
                    continue;
                }
                request_.addHeader(buf->Peek(), colon, crlf);
                buf->Retrieve(lineBytes);
            }
        } else if (state_ == kExpectBody) {
            if (chunked_) {
                ok = processChunkedBody(buf, &hasMore);
            } else {
                const size_t n = std::min(bodyRemaining_, buf->ReadableBytes());
                if (n > 0) {
                    request_.appendBody(buf->Peek(), n);
                    buf->Retrieve(n);
                    bodyRemaining_ -= n;
                }
                if (bodyRemaining_ == 0) {
                    state_ = kGotAll;
                }
                hasMore = false;
            }
        } else {
            hasMore = false;
        }
    }
    return ok;
}

} // namespace protocol
} // namespace ingest
