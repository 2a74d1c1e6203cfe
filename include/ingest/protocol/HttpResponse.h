#pragma once

#include <cctype>
#include <cstdio>
#include <cstring>
#include <map>
#include <string>

#include "ingest/network/Buffer.h"

namespace ingest {
namespace protocol {

// Every response closes the connection; all but 204 carry content-length.
class HttpResponse {
public:
    enum HttpStatusCode {
        kUnknown,
        k200Ok = 200,
        k201Created = 201,
        k202Accepted = 202,
        k204NoContent = 204,
        k400BadRequest = 400,
        k401Unauthorized = 401,
        k405MethodNotAllowed = 405,
        k413PayloadTooLarge = 413,
        k429TooManyRequests = 429,
        k500InternalServerError = 500,
        k503ServiceUnavailable = 503,
    };

    HttpResponse() : statusCode_(kUnknown) {}
    explicit HttpResponse(HttpStatusCode code)
        : statusCode_(code), statusMessage_(ReasonPhrase(code)) {}

    static const char* ReasonPhrase(int code) {
        switch (code) {
            case 200: return "OK";
            case 201: return "Created";
            case 202: return "Accepted";
            case 204: return "No Content";
            case 400: return "Bad Request";
            case 401: return "Unauthorized";
            case 405: return "Method Not Allowed";
            case 413: return "Payload Too Large";
            case 429: return "Too Many Requests";
            case 500: return "Internal Server Error";
            case 503: return "Service Unavailable";
            default: return "Unknown";
        }
    }

    void setStatusCode(HttpStatusCode code) {
        statusCode_ = code;
        statusMessage_ = ReasonPhrase(code);
    }
    HttpStatusCode statusCode() const { return statusCode_; }
    const std::string& statusMessage() const { return statusMessage_; }
    void setContentType(const std::string& contentType) { addHeader("content-type", contentType); }

    // Names are lowercased; a later addHeader for the same name wins.
    void addHeader(const std::string& key, const std::string& value) {
        headers_[ToLower(key)] = value;
    }
    // Adds fields that are not already set on this response.
    void mergeHeaders(const std::map<std::string, std::string>& extra) {
        for (const auto& kv : extra) {
            headers_.insert(std::make_pair(ToLower(kv.first), kv.second));
        }
    }
    std::string getHeader(const std::string& key) const {
        auto it = headers_.find(ToLower(key));
        return it == headers_.end() ? std::string() : it->second;
    }
    const std::map<std::string, std::string>& headers() const { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    const std::string& body() const { return body_; }

    void appendToBuffer(ingest::network::Buffer* output) const {
        char buf[32];
        snprintf(buf, sizeof buf, "HTTP/1.1 %d ", static_cast<int>(statusCode_));
        output->Append(buf, strlen(buf));
        output->Append(statusMessage_);
        output->Append("\r\n");

        if (statusCode_ != k204NoContent) {
            snprintf(buf, sizeof buf, "content-length: %zu\r\n", body_.size());
            output->Append(buf, strlen(buf));
        }
        output->Append("connection: close\r\n");

        for (const auto& header : headers_) {
            if (header.first == "content-length" || header.first == "connection") continue;
            output->Append(header.first);
            output->Append(": ");
            output->Append(header.second);
            output->Append("\r\n");
        }

        output->Append("\r\n");
        output->Append(body_);
    }

    std::string toString() const {
        ingest::network::Buffer out;
        appendToBuffer(&out);
        return out.RetrieveAllAsString();
    }

private:
    static std::string ToLower(const std::string& s) {
        std::string out(s);
        for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return out;
    }

    HttpStatusCode statusCode_;
    std::string statusMessage_;
    std::map<std::string, std::string> headers_;
    std::string body_;
};

} // namespace protocol
} // namespace ingest
