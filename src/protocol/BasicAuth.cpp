#include "ingest/protocol/BasicAuth.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <cctype>
#include <climits>

namespace ingest {
namespace protocol {

namespace {

// Contents are compared in constant time; a length mismatch returns early.
bool ConstantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    if (a.empty()) return true;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace

bool BasicAuth::DecodeBase64(const std::string& in, std::string* out) {
    if (in.empty() || in.size() % 4 != 0 || in.size() > static_cast<size_t>(INT_MAX)) return false;

    size_t padding = 0;
    if (in[in.size() - 1] == '=') ++padding;
    if (in[in.size() - 2] == '=') ++padding;
    // '=' is only allowed as trailing padding.
    if (in.find('=') < in.size() - padding) return false;

    std::string decoded(in.size() / 4 * 3, '\0');
    const int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&decoded[0]),
                                  reinterpret_cast<const unsigned char*>(in.data()),
                                  static_cast<int>(in.size()));
    if (n < 0 || static_cast<size_t>(n) < padding) return false;
    // EVP_DecodeBlock keeps the zero bytes produced by padding.
    decoded.resize(static_cast<size_t>(n) - padding);
    out->swap(decoded);
    return true;
}

std::string BasicAuth::EncodeBase64(const std::string& in) {
    std::string encoded((in.size() + 2) / 3 * 4 + 1, '\0');
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]),
                                  reinterpret_cast<const unsigned char*>(in.data()),
                                  static_cast<int>(in.size()));
    encoded.resize(n > 0 ? static_cast<size_t>(n) : 0);
    return encoded;
}

bool BasicAuth::ParseHeader(const std::string& authorization, std::string* user, std::string* password) {
    size_t i = 0;
    while (i < authorization.size() && authorization[i] == ' ') ++i;

    static const char kScheme[] = "basic";
    const size_t schemeLen = sizeof(kScheme) - 1;
    if (authorization.size() < i + schemeLen + 1) return false;
    for (size_t k = 0; k < schemeLen; ++k) {
        if (std::tolower(static_cast<unsigned char>(authorization[i + k])) != kScheme[k]) return false;
    }
    i += schemeLen;
    if (authorization[i] != ' ') return false;
    while (i < authorization.size() && authorization[i] == ' ') ++i;

    size_t end = authorization.size();
    while (end > i && authorization[end - 1] == ' ') --end;

    std::string decoded;
    if (!DecodeBase64(authorization.substr(i, end - i), &decoded)) return false;

    const size_t colon = decoded.find(':');
    if (colon == std::string::npos) return false;
    *user = decoded.substr(0, colon);
    *password = decoded.substr(colon + 1);
    return true;
}

bool BasicAuth::Check(const std::string& authorization) const {
    if (!enabled_) return true;
    std::string user;
    std::string password;
    if (!ParseHeader(authorization, &user, &password)) return false;
    // Both comparisons always run.
    const bool userOk = ConstantTimeEquals(user, user_);
    const bool passwordOk = ConstantTimeEquals(password, password_);
    return userOk && passwordOk;
}

} // namespace protocol
} // namespace ingest
