#pragma once

#include "otkit/interfaces/i_asymmetric_cipher.hpp"
#include "otkit/crypto/kyber_interop.hpp"
#include "otkit/core/constants.hpp"

namespace otkit::protocol::crypto {

static_assert(KemDemConstants::KYBER_768_CIPHERTEXT_SIZE == KyberInterop::KYBER_768_CIPHERTEXT_SIZE);
static_assert(2 * (KemDemConstants::MAX_PLAINTEXT_SIZE + KemDemConstants::CIPHERTEXT_OVERHEAD)
              < TransferConstants::MAX_WIRE_MESSAGE_SIZE);

/**
 * @brief Post-quantum IAsymmetricCipher: Kyber-768 KEM + AES-256-GCM DEM
 *
 * Encrypt:
 *   (kem_ct, ss) = Kyber768.Encaps(pk)
 *   key          = HKDF-SHA256(ss, salt, info)
 *   ct           = kem_ct || nonce || AES-256-GCM(key, nonce, m, aad = kem_ct)
 *
 * Kyber decapsulation never fails on a foreign ciphertext (implicit
 * rejection), so the GCM tag is what makes decryption under the wrong private
 * key fail.
 */
class KyberAesGcmCipher final : public interfaces::IAsymmetricCipher {
public:
    static constexpr size_t CIPHERTEXT_OVERHEAD = KemDemConstants::CIPHERTEXT_OVERHEAD;
    static constexpr size_t MAX_PLAINTEXT_SIZE = KemDemConstants::MAX_PLAINTEXT_SIZE;

    [[nodiscard]] enums::CipherSuite GetSuite() const noexcept override {
        return enums::CipherSuite::Kyber768AesGcm;
    }

    /// key_bits must be KemDemConstants::KYBER_768_KEY_BITS.
    [[nodiscard]] Result<models::AsymmetricKeyPair, CipherFailure> GenerateKeyPair(uint32_t key_bits) override;

    [[nodiscard]] Result<std::vector<uint8_t>, CipherFailure> Encrypt(
        const models::PublicKey& public_key,
        std::span<const uint8_t> plaintext) override;

    [[nodiscard]] Result<std::vector<uint8_t>, CipherFailure> Decrypt(
        const models::PrivateKey& private_key,
        std::span<const uint8_t> ciphertext) override;

    [[nodiscard]] Result<size_t, CipherFailure> MaxPlaintextSize(const models::PublicKey& public_key) override;

private:
    [[nodiscard]] static Result<SecureMemoryHandle, CipherFailure> DeriveMessageKey(
        const SecureMemoryHandle& shared_secret);
};

} // namespace otkit::protocol::crypto
