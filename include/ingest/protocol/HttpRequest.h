#pragma once

#include <cctype>
#include <cstddef>
#include <map>
#include <string>

namespace ingest {
namespace protocol {

class HttpRequest {
public:
    enum Method {
        kInvalid, kGet, kPost, kHead, kPut, kDelete, kOptions, kPatch, kOther
    };

    enum Version {
        kUnknown, kHttp10, kHttp11
    };

    HttpRequest() : method_(kInvalid), version_(kUnknown) {}

    void setVersion(Version v) { version_ = v; }
    Version getVersion() const { return version_; }

    // Any RFC 7230 token is accepted; only the dispatch decides what is allowed.
    bool setMethod(const char* start, const char* end) {
        std::string m(start, end);
        if (m.empty()) {
            method_ = kInvalid;
            return false;
        }
        for (char c : m) {
            if (!isTokenChar(c)) {
                method_ = kInvalid;
                return false;
            }
        }
        methodString_ = m;
        if (m == "GET") method_ = kGet;
        else if (m == "POST") method_ = kPost;
        else if (m == "HEAD") method_ = kHead;
        else if (m == "PUT") method_ = kPut;
        else if (m == "DELETE") method_ = kDelete;
        else if (m == "OPTIONS") method_ = kOptions;
        else if (m == "PATCH") method_ = kPatch;
        else method_ = kOther;
        return true;
    }

    Method getMethod() const { return method_; }
    const std::string& methodString() const { return methodString_; }

    void setPath(const char* start, const char* end) {
        path_.assign(start, end);
    }
    const std::string& path() const { return path_; }

    void setQuery(const char* start, const char* end) {
        query_.assign(start, end);
    }
    const std::string& query() const { return query_; }

    // Field names are stored lowercased, so lookups are case-insensitive.
    void addHeader(const char* start, const char* colon, const char* end) {
        std::string field = toLower(std::string(start, colon));
        ++colon;
        while (colon < end && isspace(static_cast<unsigned char>(*colon))) {
            ++colon;
        }
        std::string value(colon, end);
        while (!value.empty() && isspace(static_cast<unsigned char>(value[value.size()-1]))) {
            value.resize(value.size()-1);
        }
        headers_[field] = value;
    }

    std::string getHeader(const std::string& field) const {
        std::string result;
        auto it = headers_.find(toLower(field));
        if (it != headers_.end()) {
            result = it->second;
        }
        return result;
    }

    bool hasHeader(const std::string& field) const {
        return headers_.count(toLower(field)) != 0;
    }

    void setHeader(const std::string& field, const std::string& value) {
        headers_[toLower(field)] = value;
    }

    const std::map<std::string, std::string>& headers() const { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    void appendBody(const char* data, size_t len) { body_.append(data, len); }
    const std::string& body() const { return body_; }

    void swap(HttpRequest& that) {
        std::swap(method_, that.method_);
        std::swap(version_, that.version_);
        methodString_.swap(that.methodString_);
        path_.swap(that.path_);
        query_.swap(that.query_);
        headers_.swap(that.headers_);
        body_.swap(that.body_);
    }

private:
    static std::string toLower(const std::string& s) {
        std::string out(s);
        for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return out;
    }

    static bool isTokenChar(char c) {
        if (std::isalnum(static_cast<unsigned char>(c))) return true;
        switch (c) {
            case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
            case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
                return true;
            default:
                return false;
        }
    }

    Method method_;
    Version version_;
    std::string methodString_;
    std::string path_;
    std::string query_;
    std::map<std::string, std::string> headers_;
    std::string body_;
};

} // namespace protocol
} // namespace ingest
