#include "ingest/common/ServerConfig.h"
#include "ingest/common/Config.h"
#include "ingest/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <limits>

namespace ingest {
namespace common {

namespace {

std::string ToLowerCopy(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

} // namespace

void ServerConfig::Validate() const {
    if (ssl) {
        if (keystore.empty() || keystorePassword.empty()) {
            throw ConfigurationError("ssl is enabled but keystore and keystore_password are not both set");
        }
    }
    if (user.empty() != password.empty()) {
        throw ConfigurationError("user and password must be configured together");
    }
    if (threads < 1) {
        throw ConfigurationError("threads must be at least 1, got " + std::to_string(threads));
    }
    if (responseCode != 200 && responseCode != 201 && responseCode != 202 && responseCode != 204) {
        throw ConfigurationError("response_code must be one of 200, 201, 202, 204, got " +
                                 std::to_string(responseCode));
    }
    if (maxContentLength == 0) {
        throw ConfigurationError("max_content_length must be positive");
    }
    if (readTimeoutMs < 0) {
        throw ConfigurationError("read_timeout_ms must not be negative");
    }
    if (codec.empty()) {
        throw ConfigurationError("codec must not be empty");
    }
}

ServerConfig ServerConfig::FromIni(const IniConfig& ini) {
    ServerConfig cfg;

    cfg.host = ini.GetString("server", "host", cfg.host);
    const int port = ini.GetInt("server", "port", cfg.port);
    if (port < 0 || port > std::numeric_limits<uint16_t>::max()) {
        throw ConfigurationError("port out of range: " + std::to_string(port));
    }
    cfg.port = static_cast<uint16_t>(port);
    cfg.threads = ini.GetInt("server", "threads", cfg.threads);
    cfg.codec = ini.GetString("server", "codec", cfg.codec);
    cfg.responseCode = ini.GetInt("server", "response_code", cfg.responseCode);
    const long long maxLen = ini.GetInt64("server", "max_content_length",
                                          static_cast<long long>(cfg.maxContentLength));
    cfg.maxContentLength = maxLen > 0 ? static_cast<size_t>(maxLen) : 0;
    cfg.readTimeoutMs = ini.GetInt("server", "read_timeout_ms", cfg.readTimeoutMs);

    cfg.ssl = ini.GetBool("tls", "ssl", cfg.ssl);
    cfg.keystore = ini.GetString("tls", "keystore", "");
    cfg.keystorePassword = ini.GetString("tls", "keystore_password", "");

    cfg.user = ini.GetString("auth", "user", "");
    cfg.password = ini.GetString("auth", "password", "");

    for (const auto& kv : ini.GetSection("additional_codecs")) {
        cfg.additionalCodecs[ToLowerCopy(kv.first)] = kv.second;
    }

    const IniConfig::Section headers = ini.GetSection("response_headers");
    if (!headers.empty()) {
        cfg.responseHeaders.clear();
        for (const auto& kv : headers) {
            cfg.responseHeaders[ToLowerCopy(kv.first)] = kv.second;
        }
    }

    cfg.logLevel = ini.GetString("log", "level", cfg.logLevel);
    return cfg;
}

} // namespace common
} // namespace ingest
