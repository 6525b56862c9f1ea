#include "otkit/crypto/hkdf.hpp"
#include "otkit/core/constants.hpp"
#include "otkit/core/format.hpp"
#include "openssl_support.hpp"

#include <openssl/core_names.h>
#include <openssl/params.h>

namespace otkit::protocol::crypto {
using detail::EVP_KDF_CTX_ptr;
using detail::GetOpenSSLError;

Result<Unit, CipherFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, CipherFailure>::Err(
            CipherFailure::Backend(
                compat::format("HKDF output size must be in 1..{}, got {}", MAX_OUTPUT_LEN, output.size())));
    }
    if (ikm.empty()) {
        return Result<Unit, CipherFailure>::Err(
            CipherFailure::Backend("HKDF input key material cannot be empty"));
    }

    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, "HKDF", nullptr);
    if (!kdf) {
        return Result<Unit, CipherFailure>::Err(
            CipherFailure::Backend(
                compat::format("Failed to fetch HKDF algorithm: {}", GetOpenSSLError())));
    }
    EVP_KDF_CTX_ptr kctx(EVP_KDF_CTX_new(kdf));
    EVP_KDF_free(kdf);
    if (!kctx) {
        return Result<Unit, CipherFailure>::Err(
            CipherFailure::Backend(
                compat::format("Failed to create HKDF context: {}", GetOpenSSLError())));
    }

    OSSL_PARAM params[5];
    int param_idx = 0;
    params[param_idx++] = OSSL_PARAM_construct_utf8_string(
        OSSL_KDF_PARAM_DIGEST, const_cast<char*>("SHA256"), 0);
    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        OSSL_KDF_PARAM_KEY, const_cast<uint8_t*>(ikm.data()), ikm.size());
    if (!salt.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_SALT, const_cast<uint8_t*>(salt.data()), salt.size());
    }
    if (!info.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_INFO, const_cast<uint8_t*>(info.data()), info.size());
    }
    params[param_idx] = OSSL_PARAM_construct_end();

    if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != OpenSSLConstants::SUCCESS) {
        return Result<Unit, CipherFailure>::Err(
            CipherFailure::Backend(
                compat::format("HKDF key derivation failed: {}", GetOpenSSLError())));
    }
    return Result<Unit, CipherFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, CipherFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    size_t output_size,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    std::vector<uint8_t> output(output_size);
    auto result = DeriveKey(ikm, output, salt, info);
    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, CipherFailure>::Err(std::move(result).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, CipherFailure>::Ok(std::move(output));
}

} // namespace otkit::protocol::crypto
