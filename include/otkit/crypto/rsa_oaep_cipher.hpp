#pragma once

#include "otkit/interfaces/i_asymmetric_cipher.hpp"

namespace otkit::protocol::crypto {

/**
 * @brief IAsymmetricCipher over RSA-OAEP (SHA-256, MGF1-SHA-256)
 *
 * key_bits is the RSA modulus size. Stateless; one instance may serve any
 * number of sessions concurrently.
 */
class RsaOaepCipher final : public interfaces::IAsymmetricCipher {
public:
    [[nodiscard]] enums::CipherSuite GetSuite() const noexcept override {
        return enums::CipherSuite::RsaOaepSha256;
    }

    [[nodiscard]] Result<models::AsymmetricKeyPair, CipherFailure> GenerateKeyPair(uint32_t key_bits) override;

    [[nodiscard]] Result<std::vector<uint8_t>, CipherFailure> Encrypt(
        const models::PublicKey& public_key,
        std::span<const uint8_t> plaintext) override;

    [[nodiscard]] Result<std::vector<uint8_t>, CipherFailure> Decrypt(
        const models::PrivateKey& private_key,
        std::span<const uint8_t> ciphertext) override;

    [[nodiscard]] Result<size_t, CipherFailure> MaxPlaintextSize(const models::PublicKey& public_key) override;
};

} // namespace otkit::protocol::crypto
