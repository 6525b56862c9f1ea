#pragma once

#include "otkit/core/result.hpp"
#include "otkit/core/failures.hpp"
#include "otkit/crypto/sodium_secure_memory_handle.hpp"

#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace otkit::protocol::crypto {

/**
 * @brief RSA key generation and RSA-OAEP over OpenSSL 3 EVP
 *
 * Encodings:
 * - public keys are DER SubjectPublicKeyInfo
 * - private keys are DER RSAPrivateKey (PKCS#1), written straight into a
 *   SecureMemoryHandle
 *
 * Padding is OAEP with SHA-256 for both the label hash and MGF1. With OAEP a
 * ciphertext produced under another key fails the padding check, which the
 * transfer relies on; PKCS#1 v1.5 under OpenSSL 3 implicit rejection would
 * return random bytes instead.
 */
class RsaInterop {
public:
    /**
     * @brief Generate an RSA key pair with e = RsaConstants::PUBLIC_EXPONENT
     *
     * Randomness comes from the OpenSSL DRBG.
     *
     * @param modulus_bits Must be within [MIN_MODULUS_BITS, MAX_MODULUS_BITS]
     *        and a multiple of 8
     * @return (private key handle, public key DER)
     */
    [[nodiscard]] static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, CipherFailure>
    GenerateKeyPair(uint32_t modulus_bits);

    [[nodiscard]] static Result<std::vector<uint8_t>, CipherFailure>
    EncryptOaep(std::span<const uint8_t> public_key_der, std::span<const uint8_t> plaintext);

    [[nodiscard]] static Result<std::vector<uint8_t>, CipherFailure>
    DecryptOaep(const SecureMemoryHandle& private_key_der, std::span<const uint8_t> ciphertext);

    /// Modulus length in bytes minus the OAEP-SHA256 overhead.
    [[nodiscard]] static Result<size_t, CipherFailure>
    MaxPlaintextSize(std::span<const uint8_t> public_key_der);

    [[nodiscard]] static Result<uint32_t, CipherFailure>
    ModulusBits(std::span<const uint8_t> public_key_der);

    [[nodiscard]] static Result<uint64_t, CipherFailure>
    PublicExponent(std::span<const uint8_t> public_key_der);

    [[nodiscard]] static bool IsValidModulusBits(uint32_t modulus_bits) noexcept;

private:
    RsaInterop() = delete;
};

} // namespace otkit::protocol::crypto
