#pragma once

#include <string>

namespace ingest {
namespace protocol {

// HTTP Basic credential check against a single user/password pair.
class BasicAuth {
public:
    BasicAuth() = default;
    BasicAuth(const std::string& user, const std::string& password)
        : user_(user), password_(password), enabled_(!user.empty() || !password.empty()) {}

    bool enabled() const { return enabled_; }

    // True when disabled, or when the authorization header carries exactly the
    // configured pair. Missing, malformed and wrong credentials are not told apart.
    bool Check(const std::string& authorization) const;

    // "Basic <base64(user:pass)>", scheme case-insensitive.
    static bool ParseHeader(const std::string& authorization, std::string* user, std::string* password);
    // Strict base64 with padding; false on any invalid input.
    static bool DecodeBase64(const std::string& in, std::string* out);
    static std::string EncodeBase64(const std::string& in);

private:
    std::string user_;
    std::string password_;
    bool enabled_{false};
};

} // namespace protocol
} // namespace ingest
