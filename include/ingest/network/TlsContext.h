#pragma once

#include "ingest/common/noncopyable.h"

#include <string>

struct ssl_ctx_st;

namespace ingest {
namespace network {

// Server-side SSL_CTX built from a password-protected PKCS#12 keystore.
class TlsContext : ingest::common::noncopyable {
public:
    TlsContext();
    ~TlsContext();

    // On failure returns false and *error (if given) names the step that failed.
    bool InitServerFromPkcs12(const std::string& keystorePath, const std::string& password,
                              std::string* error = nullptr);
    ssl_ctx_st* ctx() const { return ctx_; }

private:
    ssl_ctx_st* ctx_{nullptr};
};

} // namespace network
} // namespace ingest
