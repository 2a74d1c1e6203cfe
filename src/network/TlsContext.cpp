#include "ingest/network/TlsContext.h"
#include "ingest/common/Logger.h"

#include <openssl/err.h>
#include <openssl/pkcs12.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <atomic>
#include <cstdio>
#include <memory>

namespace ingest {
namespace network {

namespace {

std::string LastOpenSslError() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof buf);
    ERR_clear_error();
    return buf;
}

bool Fail(std::string* error, const std::string& what) {
    const std::string msg = what + ": " + LastOpenSslError();
    LOG_ERROR << "TLS: " << msg;
    if (error) *error = msg;
    return false;
}

} // namespace

TlsContext::TlsContext() {
    static std::atomic<bool> inited{false};
    bool expected = false;
    if (inited.compare_exchange_strong(expected, true)) {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
    }
}

TlsContext::~TlsContext() {
    if (ctx_) {
        SSL_CTX_free(reinterpret_cast<SSL_CTX*>(ctx_));
        ctx_ = nullptr;
    }
}

bool TlsContext::InitServerFromPkcs12(const std::string& keystorePath, const std::string& password,
                                      std::string* error) {
    if (keystorePath.empty()) {
        if (error) *error = "keystore path is empty";
        return false;
    }
    if (ctx_) {
        SSL_CTX_free(reinterpret_cast<SSL_CTX*>(ctx_));
        ctx_ = nullptr;
    }

    std::unique_ptr<FILE, decltype(&std::fclose)> fp(std::fopen(keystorePath.c_str(), "rb"), &std::fclose);
    if (!fp) {
        if (error) *error = "cannot open keystore " + keystorePath;
        LOG_ERROR << "TLS: cannot open keystore " << keystorePath;
        return false;
    }

    std::unique_ptr<PKCS12, decltype(&PKCS12_free)> p12(d2i_PKCS12_fp(fp.get(), nullptr), &PKCS12_free);
    if (!p12) {
        return Fail(error, "keystore is not a PKCS#12 file: " + keystorePath);
    }

    EVP_PKEY* rawKey = nullptr;
    X509* rawCert = nullptr;
    STACK_OF(X509)* rawChain = nullptr;
    if (PKCS12_parse(p12.get(), password.c_str(), &rawKey, &rawCert, &rawChain) != 1) {
        return Fail(error, "cannot decrypt keystore (wrong password?)");
    }
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(rawKey, &EVP_PKEY_free);
    std::unique_ptr<X509, decltype(&X509_free)> cert(rawCert, &X509_free);
    auto freeChain = [](STACK_OF(X509)* s) { sk_X509_pop_free(s, X509_free); };
    std::unique_ptr<STACK_OF(X509), decltype(freeChain)> chain(rawChain, freeChain);

    if (!key || !cert) {
        if (error) *error = "keystore holds no private key and certificate";
        LOG_ERROR << "TLS: keystore holds no private key and certificate";
        return false;
    }

    std::unique_ptr<SSL_CTX, decltype(&SSL_CTX_free)> c(SSL_CTX_new(TLS_server_method()), &SSL_CTX_free);
    if (!c) {
        return Fail(error, "SSL_CTX_new failed");
    }

    SSL_CTX_set_min_proto_version(c.get(), TLS1_2_VERSION);
    SSL_CTX_set_options(c.get(), SSL_OP_NO_COMPRESSION);

    if (SSL_CTX_use_certificate(c.get(), cert.get()) != 1) {
        return Fail(error, "load certificate failed");
    }
    if (SSL_CTX_use_PrivateKey(c.get(), key.get()) != 1) {
        return Fail(error, "load private key failed");
    }
    if (SSL_CTX_check_private_key(c.get()) != 1) {
        return Fail(error, "key does not match certificate");
    }
    if (chain) {
        for (int i = 0; i < sk_X509_num(chain.get()); ++i) {
            X509* extra = sk_X509_value(chain.get(), i);
            // SSL_CTX_add1_chain_cert takes its own reference.
            if (SSL_CTX_add1_chain_cert(c.get(), extra) != 1) {
                return Fail(error, "add chain certificate failed");
            }
        }
    }

    ctx_ = reinterpret_cast<ssl_ctx_st*>(c.release());
    LOG_INFO << "TLS: loaded keystore " << keystorePath;
    return true;
}

} // namespace network
} // namespace ingest
