#include "otkit/crypto/kyber_aes_gcm_cipher.hpp"
#include "otkit/crypto/aes_gcm.hpp"
#include "otkit/crypto/hkdf.hpp"
#include "otkit/crypto/sodium_interop.hpp"
#include "otkit/core/format.hpp"

#include <algorithm>

namespace otkit::protocol::crypto {
using enums::CipherSuite;
using models::AsymmetricKeyPair;
using models::PrivateKey;
using models::PublicKey;

namespace {
    std::span<const uint8_t> AsBytes(const std::string_view text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

    Result<Unit, CipherFailure> CheckSuite(const CipherSuite actual, const char* what) {
        if (actual != CipherSuite::Kyber768AesGcm) {
            return Result<Unit, CipherFailure>::Err(
                CipherFailure::InvalidKey(
                    compat::format("{} belongs to suite {}, expected {}",
                        what, enums::ToString(actual), enums::ToString(CipherSuite::Kyber768AesGcm))));
        }
        return Result<Unit, CipherFailure>::Ok(unit);
    }
}

Result<SecureMemoryHandle, CipherFailure> KyberAesGcmCipher::DeriveMessageKey(
    const SecureMemoryHandle& shared_secret) {
    auto key_result = SecureMemoryHandle::Allocate(Constants::AES_KEY_SIZE);
    if (key_result.IsErr()) {
        return Result<SecureMemoryHandle, CipherFailure>::Err(
            CipherFailure::FromSodiumFailure(key_result.UnwrapErr()));
    }
    auto key_handle = std::move(key_result).Unwrap();

    auto derive_result = shared_secret.WithReadAccess([&](std::span<const uint8_t> ss) {
        return key_handle.WithWriteAccess([&](std::span<uint8_t> key) {
            return Hkdf::DeriveKey(
                ss, key,
                AsBytes(KemDemConstants::KEY_DERIVATION_SALT),
                AsBytes(KemDemConstants::KEY_DERIVATION_INFO));
        });
    });
    if (derive_result.IsErr()) {
        return Result<SecureMemoryHandle, CipherFailure>::Err(
            CipherFailure::FromSodiumFailure(derive_result.UnwrapErr()));
    }
    auto write_result = std::move(derive_result).Unwrap();
    if (write_result.IsErr()) {
        return Result<SecureMemoryHandle, CipherFailure>::Err(
            CipherFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }
    auto hkdf_result = std::move(write_result).Unwrap();
    if (hkdf_result.IsErr()) {
        return Result<SecureMemoryHandle, CipherFailure>::Err(hkdf_result.UnwrapErr());
    }
    return Result<SecureMemoryHandle, CipherFailure>::Ok(std::move(key_handle));
}

Result<AsymmetricKeyPair, CipherFailure> KyberAesGcmCipher::GenerateKeyPair(const uint32_t key_bits) {
    if (key_bits != KemDemConstants::KYBER_768_KEY_BITS) {
        return Result<AsymmetricKeyPair, CipherFailure>::Err(
            CipherFailure::KeyGeneration(
                compat::format("Kyber backend supports only {}-bit parameters, got {}",
                    KemDemConstants::KYBER_768_KEY_BITS, key_bits)));
    }
    auto generated = KyberInterop::GenerateKeyPair();
    if (generated.IsErr()) {
        return Result<AsymmetricKeyPair, CipherFailure>::Err(
            CipherFailure::KeyGeneration(generated.UnwrapErr().message));
    }
    auto [secret_handle, public_bytes] = std::move(generated).Unwrap();
    return Result<AsymmetricKeyPair, CipherFailure>::Ok(
        AsymmetricKeyPair(
            PublicKey(CipherSuite::Kyber768AesGcm, std::move(public_bytes)),
            PrivateKey(CipherSuite::Kyber768AesGcm, std::move(secret_handle))));
}

Result<std::vector<uint8_t>, CipherFailure> KyberAesGcmCipher::Encrypt(
    const PublicKey& public_key,
    std::span<const uint8_t> plaintext) {
    using BytesResult = Result<std::vector<uint8_t>, CipherFailure>;

    auto suite_check = CheckSuite(public_key.GetSuite(), "Public key");
    if (suite_check.IsErr()) {
        return BytesResult::Err(suite_check.UnwrapErr());
    }
    if (plaintext.size() > MAX_PLAINTEXT_SIZE) {
        return BytesResult::Err(
            CipherFailure::Encoding(
                compat::format("Message of {} bytes exceeds KEM-DEM limit of {} bytes",
                    plaintext.size(), MAX_PLAINTEXT_SIZE)));
    }

    auto encapsulated = KyberInterop::Encapsulate(public_key.GetBytes());
    if (encapsulated.IsErr()) {
        return BytesResult::Err(CipherFailure::InvalidKey(encapsulated.UnwrapErr().message));
    }
    auto encapsulation = std::move(encapsulated).Unwrap();
    const std::vector<uint8_t>& kem_ciphertext = encapsulation.first;

    auto key_result = DeriveMessageKey(encapsulation.second);
    if (key_result.IsErr()) {
        return BytesResult::Err(key_result.UnwrapErr());
    }
    auto message_key = std::move(key_result).Unwrap();

    const auto nonce = SodiumInterop::GetRandomBytes(Constants::AES_GCM_NONCE_SIZE);
    auto sealed = message_key.WithReadAccess([&](std::span<const uint8_t> key) {
        return AesGcm::Encrypt(key, nonce, plaintext, kem_ciphertext);
    });
    if (sealed.IsErr()) {
        return BytesResult::Err(CipherFailure::FromSodiumFailure(sealed.UnwrapErr()));
    }
    auto aead_result = std::move(sealed).Unwrap();
    if (aead_result.IsErr()) {
        return BytesResult::Err(aead_result.UnwrapErr());
    }
    const auto aead_ciphertext = std::move(aead_result).Unwrap();

    std::vector<uint8_t> output;
    output.reserve(kem_ciphertext.size() + nonce.size() + aead_ciphertext.size());
    output.insert(output.end(), kem_ciphertext.begin(), kem_ciphertext.end());
    output.insert(output.end(), nonce.begin(), nonce.end());
    output.insert(output.end(), aead_ciphertext.begin(), aead_ciphertext.end());
    return BytesResult::Ok(std::move(output));
}

Result<std::vector<uint8_t>, CipherFailure> KyberAesGcmCipher::Decrypt(
    const PrivateKey& private_key,
    std::span<const uint8_t> ciphertext) {
    using BytesResult = Result<std::vector<uint8_t>, CipherFailure>;

    auto suite_check = CheckSuite(private_key.GetSuite(), "Private key");
    if (suite_check.IsErr()) {
        return BytesResult::Err(suite_check.UnwrapErr());
    }
    if (private_key.IsDestroyed()) {
        return BytesResult::Err(CipherFailure::InvalidKey("Private key has been destroyed"));
    }
    if (ciphertext.size() < CIPHERTEXT_OVERHEAD) {
        return BytesResult::Err(
            CipherFailure::Decryption(
                compat::format("KEM-DEM ciphertext too short: {} bytes (minimum {})",
                    ciphertext.size(), CIPHERTEXT_OVERHEAD)));
    }

    const auto kem_ciphertext = ciphertext.subspan(0, KyberInterop::KYBER_768_CIPHERTEXT_SIZE);
    const auto nonce = ciphertext.subspan(KyberInterop::KYBER_768_CIPHERTEXT_SIZE, Constants::AES_GCM_NONCE_SIZE);
    const auto aead_ciphertext = ciphertext.subspan(
        KyberInterop::KYBER_768_CIPHERTEXT_SIZE + Constants::AES_GCM_NONCE_SIZE);

    auto decapsulated = KyberInterop::Decapsulate(kem_ciphertext, private_key.GetSecretKeyHandle());
    if (decapsulated.IsErr()) {
        return BytesResult::Err(CipherFailure::Decryption(decapsulated.UnwrapErr().message));
    }
    auto shared_secret = std::move(decapsulated).Unwrap();

    auto key_result = DeriveMessageKey(shared_secret);
    if (key_result.IsErr()) {
        return BytesResult::Err(key_result.UnwrapErr());
    }
    auto message_key = std::move(key_result).Unwrap();

    auto opened = message_key.WithReadAccess([&](std::span<const uint8_t> key) {
        return AesGcm::Decrypt(key, nonce, aead_ciphertext, kem_ciphertext);
    });
    if (opened.IsErr()) {
        return BytesResult::Err(CipherFailure::FromSodiumFailure(opened.UnwrapErr()));
    }
    return std::move(opened).Unwrap();
}

Result<size_t, CipherFailure> KyberAesGcmCipher::MaxPlaintextSize(const PublicKey& public_key) {
    auto suite_check = CheckSuite(public_key.GetSuite(), "Public key");
    if (suite_check.IsErr()) {
        return Result<size_t, CipherFailure>::Err(suite_check.UnwrapErr());
    }
    return Result<size_t, CipherFailure>::Ok(MAX_PLAINTEXT_SIZE);
}

} // namespace otkit::protocol::crypto
