#include "otkit/crypto/rsa_interop.hpp"
#include "otkit/crypto/sodium_interop.hpp"
#include "otkit/core/constants.hpp"
#include "otkit/core/format.hpp"
#include "openssl_support.hpp"

#include <openssl/core_names.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

namespace otkit::protocol::crypto {
using detail::BIGNUM_ptr;
using detail::EVP_PKEY_ptr;
using detail::EVP_PKEY_CTX_ptr;
using detail::GetOpenSSLError;
using OpenSSL = OpenSSLConstants;

namespace {
    using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, CipherFailure>;

    Result<EVP_PKEY_ptr, CipherFailure> ParsePublicKey(std::span<const uint8_t> public_key_der) {
        if (public_key_der.empty()) {
            return Result<EVP_PKEY_ptr, CipherFailure>::Err(
                CipherFailure::InvalidKey("RSA public key is empty"));
        }
        const unsigned char* cursor = public_key_der.data();
        EVP_PKEY_ptr key(d2i_PUBKEY(nullptr, &cursor, static_cast<long>(public_key_der.size())));
        if (!key) {
            return Result<EVP_PKEY_ptr, CipherFailure>::Err(
                CipherFailure::InvalidKey(
                    compat::format("Failed to parse RSA public key: {}", GetOpenSSLError())));
        }
        if (cursor != public_key_der.data() + public_key_der.size()) {
            return Result<EVP_PKEY_ptr, CipherFailure>::Err(
                CipherFailure::InvalidKey("Trailing bytes after RSA public key"));
        }
        if (EVP_PKEY_is_a(key.get(), "RSA") != OpenSSL::SUCCESS) {
            return Result<EVP_PKEY_ptr, CipherFailure>::Err(
                CipherFailure::InvalidKey("Public key is not an RSA key"));
        }
        return Result<EVP_PKEY_ptr, CipherFailure>::Ok(std::move(key));
    }

    Result<Unit, CipherFailure> ConfigureOaep(EVP_PKEY_CTX* ctx) {
        if (EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_OAEP_PADDING) <= 0 ||
            EVP_PKEY_CTX_set_rsa_oaep_md(ctx, EVP_sha256()) <= 0 ||
            EVP_PKEY_CTX_set_rsa_mgf1_md(ctx, EVP_sha256()) <= 0) {
            return Result<Unit, CipherFailure>::Err(
                CipherFailure::Backend(
                    compat::format("Failed to configure RSA-OAEP: {}", GetOpenSSLError())));
        }
        return Result<Unit, CipherFailure>::Ok(unit);
    }
}

bool RsaInterop::IsValidModulusBits(const uint32_t modulus_bits) noexcept {
    return modulus_bits >= RsaConstants::MIN_MODULUS_BITS &&
           modulus_bits <= RsaConstants::MAX_MODULUS_BITS &&
           modulus_bits % 8 == 0;
}

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, CipherFailure>
RsaInterop::GenerateKeyPair(const uint32_t modulus_bits) {
    if (!IsValidModulusBits(modulus_bits)) {
        return KeyPairResult::Err(
            CipherFailure::KeyGeneration(
                compat::format("Unsupported RSA modulus size: {} bits (allowed {}..{}, multiple of 8)",
                    modulus_bits, RsaConstants::MIN_MODULUS_BITS, RsaConstants::MAX_MODULUS_BITS)));
    }

    EVP_PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr));
    if (!ctx) {
        return KeyPairResult::Err(
            CipherFailure::KeyGeneration(
                compat::format("Failed to create RSA key generation context: {}", GetOpenSSLError())));
    }
    BIGNUM_ptr exponent(BN_new());
    if (!exponent || BN_set_word(exponent.get(), RsaConstants::PUBLIC_EXPONENT) != OpenSSL::SUCCESS) {
        return KeyPairResult::Err(
            CipherFailure::KeyGeneration(
                compat::format("Failed to set RSA public exponent: {}", GetOpenSSLError())));
    }
    if (EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), static_cast<int>(modulus_bits)) <= 0 ||
        EVP_PKEY_CTX_set1_rsa_keygen_pubexp(ctx.get(), exponent.get()) <= 0) {
        return KeyPairResult::Err(
            CipherFailure::KeyGeneration(
                compat::format("Failed to initialize RSA key generation: {}", GetOpenSSLError())));
    }

    EVP_PKEY* raw_key = nullptr;
    if (EVP_PKEY_generate(ctx.get(), &raw_key) <= 0) {
        return KeyPairResult::Err(
            CipherFailure::KeyGeneration(
                compat::format("RSA key generation failed: {}", GetOpenSSLError())));
    }
    EVP_PKEY_ptr key(raw_key);

    const int public_len = i2d_PUBKEY(key.get(), nullptr);
    if (public_len <= 0) {
        return KeyPairResult::Err(
            CipherFailure::KeyGeneration(
                compat::format("Failed to encode RSA public key: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> public_der(static_cast<size_t>(public_len));
    unsigned char* public_cursor = public_der.data();
    if (i2d_PUBKEY(key.get(), &public_cursor) != public_len) {
        return KeyPairResult::Err(
            CipherFailure::KeyGeneration("RSA public key encoding length mismatch"));
    }

    const int private_len = i2d_PrivateKey(key.get(), nullptr);
    if (private_len <= 0) {
        return KeyPairResult::Err(
            CipherFailure::KeyGeneration(
                compat::format("Failed to encode RSA private key: {}", GetOpenSSLError())));
    }
    auto handle_result = SecureMemoryHandle::Allocate(static_cast<size_t>(private_len));
    if (handle_result.IsErr()) {
        return KeyPairResult::Err(CipherFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    auto private_handle = std::move(handle_result).Unwrap();

    // Encode directly into guarded memory so the DER never sits in the heap
    auto encode_result = private_handle.WithWriteAccess([&](std::span<uint8_t> secure) {
        unsigned char* cursor = secure.data();
        return i2d_PrivateKey(key.get(), &cursor);
    });
    if (encode_result.IsErr()) {
        return KeyPairResult::Err(CipherFailure::FromSodiumFailure(encode_result.UnwrapErr()));
    }
    if (encode_result.Unwrap() != private_len) {
        return KeyPairResult::Err(
            CipherFailure::KeyGeneration("RSA private key encoding length mismatch"));
    }

    return KeyPairResult::Ok(std::make_pair(std::move(private_handle), std::move(public_der)));
}

Result<std::vector<uint8_t>, CipherFailure>
RsaInterop::EncryptOaep(std::span<const uint8_t> public_key_der, std::span<const uint8_t> plaintext) {
    auto key_result = ParsePublicKey(public_key_der);
    if (key_result.IsErr()) {
        return Result<std::vector<uint8_t>, CipherFailure>::Err(key_result.UnwrapErr());
    }
    auto key = std::move(key_result).Unwrap();

    const int modulus_bytes = EVP_PKEY_get_size(key.get());
    if (modulus_bytes <= static_cast<int>(RsaConstants::OAEP_SHA256_OVERHEAD)) {
        return Result<std::vector<uint8_t>, CipherFailure>::Err(
            CipherFailure::InvalidKey("RSA modulus too small for OAEP-SHA256"));
    }
    const size_t max_plaintext = static_cast<size_t>(modulus_bytes) - RsaConstants::OAEP_SHA256_OVERHEAD;
    if (plaintext.size() > max_plaintext) {
        return Result<std::vector<uint8_t>, CipherFailure>::Err(
            CipherFailure::Encoding(
                compat::format("Message of {} bytes exceeds RSA-OAEP limit of {} bytes for a {}-bit key",
                    plaintext.size(), max_plaintext, EVP_PKEY_get_bits(key.get()))));
    }

    EVP_PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new_from_pkey(nullptr, key.get(), nullptr));
    if (!ctx || EVP_PKEY_encrypt_init(ctx.get()) <= 0) {
        return Result<std::vector<uint8_t>, CipherFailure>::Err(
            CipherFailure::Backend(
                compat::format("Failed to initialize RSA encryption: {}", GetOpenSSLError())));
    }
    auto oaep_result = ConfigureOaep(ctx.get());
    if (oaep_result.IsErr()) {
        return Result<std::vector<uint8_t>, CipherFailure>::Err(oaep_result.UnwrapErr());
    }

    size_t out_len = 0;
    if (EVP_PKEY_encrypt(ctx.get(), nullptr, &out_len, plaintext.data(), plaintext.size()) <= 0) {
        return Result<std::vector<uint8_t>, CipherFailure>::Err(
            CipherFailure::Encoding(
                compat::format("RSA-OAEP size query failed: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> ciphertext(out_len);
    if (EVP_PKEY_encrypt(ctx.get(), ciphertext.data(), &out_len, plaintext.data(), plaintext.size()) <= 0) {
        return Result<std::vector<uint8_t>, CipherFailure>::Err(
            CipherFailure::Encoding(
                compat::format("RSA-OAEP encryption failed: {}", GetOpenSSLError())));
    }
    ciphertext.resize(out_len);
    return Result<std::vector<uint8_t>, CipherFailure>::Ok(std::move(ciphertext));
}

Result<std::vector<uint8_t>, CipherFailure>
RsaInterop::DecryptOaep(const SecureMemoryHandle& private_key_der, std::span<const uint8_t> ciphertext) {
    if (ciphertext.empty()) {
        return Result<std::vector<uint8_t>, CipherFailure>::Err(
            CipherFailure::Decryption("RSA ciphertext is empty"));
    }

    auto parse_result = private_key_der.WithReadAccess([](std::span<const uint8_t> der) {
        const unsigned char* cursor = der.data();
        return EVP_PKEY_ptr(d2i_PrivateKey(EVP_PKEY_RSA, nullptr, &cursor, static_cast<long>(der.size())));
    });
    if (parse_result.IsErr()) {
        return Result<std::vector<uint8_t>, CipherFailure>::Err(
            CipherFailure::FromSodiumFailure(parse_result.UnwrapErr()));
    }
    auto key = std::move(parse_result).Unwrap();
    if (!key) {
        return Result<std::vector<uint8_t>, CipherFailure>::Err(
            CipherFailure::InvalidKey(
                compat::format("Failed to load RSA private key: {}", GetOpenSSLError())));
    }

    const int modulus_bytes = EVP_PKEY_get_size(key.get());
    if (ciphertext.size() != static_cast<size_t>(modulus_bytes)) {
        return Result<std::vector<uint8_t>, CipherFailure>::Err(
            CipherFailure::Decryption(
                compat::format("RSA ciphertext must be {} bytes, got {}", modulus_bytes, ciphertext.size())));
    }

    EVP_PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new_from_pkey(nullptr, key.get(), nullptr));
    if (!ctx || EVP_PKEY_decrypt_init(ctx.get()) <= 0) {
        return Result<std::vector<uint8_t>, CipherFailure>::Err(
            CipherFailure::Backend(
                compat::format("Failed to initialize RSA decryption: {}", GetOpenSSLError())));
    }
    auto oaep_result = ConfigureOaep(ctx.get());
    if (oaep_result.IsErr()) {
        return Result<std::vector<uint8_t>, CipherFailure>::Err(oaep_result.UnwrapErr());
    }

    size_t out_len = 0;
    if (EVP_PKEY_decrypt(ctx.get(), nullptr, &out_len, ciphertext.data(), ciphertext.size()) <= 0) {
        return Result<std::vector<uint8_t>, CipherFailure>::Err(
            CipherFailure::Decryption(
                compat::format("RSA-OAEP size query failed: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> plaintext(out_len);
    if (EVP_PKEY_decrypt(ctx.get(), plaintext.data(), &out_len, ciphertext.data(), ciphertext.size()) <= 0) {
        SodiumInterop::SecureWipe(std::span(plaintext));
        return Result<std::vector<uint8_t>, CipherFailure>::Err(
            CipherFailure::Decryption(
                compat::format("RSA-OAEP decryption failed: {}", GetOpenSSLError())));
    }
    plaintext.resize(out_len);
    return Result<std::vector<uint8_t>, CipherFailure>::Ok(std::move(plaintext));
}

Result<size_t, CipherFailure> RsaInterop::MaxPlaintextSize(std::span<const uint8_t> public_key_der) {
    auto key_result = ParsePublicKey(public_key_der);
    if (key_result.IsErr()) {
        return Result<size_t, CipherFailure>::Err(key_result.UnwrapErr());
    }
    const int modulus_bytes = EVP_PKEY_get_size(key_result.Unwrap().get());
    if (modulus_bytes <= static_cast<int>(RsaConstants::OAEP_SHA256_OVERHEAD)) {
        return Result<size_t, CipherFailure>::Ok(0);
    }
    return Result<size_t, CipherFailure>::Ok(
        static_cast<size_t>(modulus_bytes) - RsaConstants::OAEP_SHA256_OVERHEAD);
}

Result<uint32_t, CipherFailure> RsaInterop::ModulusBits(std::span<const uint8_t> public_key_der) {
    auto key_result = ParsePublicKey(public_key_der);
    if (key_result.IsErr()) {
        return Result<uint32_t, CipherFailure>::Err(key_result.UnwrapErr());
    }
    return Result<uint32_t, CipherFailure>::Ok(
        static_cast<uint32_t>(EVP_PKEY_get_bits(key_result.Unwrap().get())));
}

Result<uint64_t, CipherFailure> RsaInterop::PublicExponent(std::span<const uint8_t> public_key_der) {
    auto key_result = ParsePublicKey(public_key_der);
    if (key_result.IsErr()) {
        return Result<uint64_t, CipherFailure>::Err(key_result.UnwrapErr());
    }
    BIGNUM* raw_exponent = nullptr;
    if (EVP_PKEY_get_bn_param(key_result.Unwrap().get(), OSSL_PKEY_PARAM_RSA_E, &raw_exponent) != OpenSSL::SUCCESS) {
        return Result<uint64_t, CipherFailure>::Err(
            CipherFailure::InvalidKey(
                compat::format("Failed to read RSA public exponent: {}", GetOpenSSLError())));
    }
    BIGNUM_ptr exponent(raw_exponent);
    return Result<uint64_t, CipherFailure>::Ok(static_cast<uint64_t>(BN_get_word(exponent.get())));
}

} // namespace otkit::protocol::crypto
