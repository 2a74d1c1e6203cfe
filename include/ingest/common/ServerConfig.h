#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

namespace ingest {
namespace common {

class IniConfig;

// Raised at startup only; the listener is never bound when this escapes.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

struct ServerConfig {
    static constexpr uint16_t kDefaultPort = 8080;
    static constexpr int kDefaultThreads = 4;
    static constexpr size_t kDefaultMaxContentLength = 100 * 1024 * 1024;
    static constexpr int kDefaultReadTimeoutMs = 30000;

    std::string host{"0.0.0.0"};
    uint16_t port{kDefaultPort};
    int threads{kDefaultThreads};

    bool ssl{false};
    std::string keystore;
    std::string keystorePassword;

    std::string user;
    std::string password;

    // Global default codec, used when neither an override nor the built-in mapping matches.
    std::string codec{"plain"};
    // content-type -> codec name; replaces the built-in mapping for that type.
    std::map<std::string, std::string> additionalCodecs;
    std::map<std::string, std::string> responseHeaders{{"content-type", "text/plain"}};

    int responseCode{200};
    size_t maxContentLength{kDefaultMaxContentLength};
    int readTimeoutMs{kDefaultReadTimeoutMs};

    std::string logLevel{"INFO"};

    bool authEnabled() const { return !user.empty() || !password.empty(); }

    // Structural checks: TLS material, credential pair, thread count, response code.
    // Codec names are checked against the registry by IngestServer.
    void Validate() const;

    // Missing keys keep their defaults. Sections: server, tls, auth, additional_codecs,
    // response_headers, log.
    static ServerConfig FromIni(const IniConfig& ini);
};

} // namespace common
} // namespace ingest
