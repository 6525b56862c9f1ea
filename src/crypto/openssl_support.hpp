#pragma once

#include "otkit/core/constants.hpp"

#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <memory>
#include <string>

namespace otkit::protocol::crypto::detail {

struct EVP_PKEY_Deleter {
    void operator()(EVP_PKEY* key) const {
        if (key) {
            EVP_PKEY_free(key);
        }
    }
};
struct EVP_PKEY_CTX_Deleter {
    void operator()(EVP_PKEY_CTX* ctx) const {
        if (ctx) {
            EVP_PKEY_CTX_free(ctx);
        }
    }
};
struct EVP_CIPHER_CTX_Deleter {
    void operator()(EVP_CIPHER_CTX* ctx) const {
        if (ctx) {
            EVP_CIPHER_CTX_free(ctx);
        }
    }
};
struct EVP_KDF_CTX_Deleter {
    void operator()(EVP_KDF_CTX* ctx) const {
        if (ctx) {
            EVP_KDF_CTX_free(ctx);
        }
    }
};
struct BIGNUM_Deleter {
    void operator()(BIGNUM* bn) const {
        if (bn) {
            BN_free(bn);
        }
    }
};
using EVP_PKEY_ptr = std::unique_ptr<EVP_PKEY, EVP_PKEY_Deleter>;
using EVP_PKEY_CTX_ptr = std::unique_ptr<EVP_PKEY_CTX, EVP_PKEY_CTX_Deleter>;
using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;
using EVP_KDF_CTX_ptr = std::unique_ptr<EVP_KDF_CTX, EVP_KDF_CTX_Deleter>;
using BIGNUM_ptr = std::unique_ptr<BIGNUM, BIGNUM_Deleter>;

/// Pops the oldest queued OpenSSL error and discards the rest of the queue.
inline std::string GetOpenSSLError() {
    const unsigned long err = ERR_get_error();
    if (err == OpenSSLConstants::NO_ERROR) {
        return std::string(OpenSSLConstants::UNKNOWN_ERROR_MESSAGE);
    }
    char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
    ERR_error_string_n(err, buffer, sizeof(buffer));
    ERR_clear_error();
    return std::string(buffer);
}

} // namespace otkit::protocol::crypto::detail
