#pragma once
#include "otkit/interfaces/i_asymmetric_cipher.hpp"
#include "otkit/crypto/sodium_interop.hpp"
#include "otkit/crypto/sodium_secure_memory_handle.hpp"
#include "otkit/core/result.hpp"
#include "otkit/core/failures.hpp"
#include <algorithm>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace otkit::protocol::test_helpers {

using protocol::Result;
using protocol::CipherFailure;
using crypto::SecureMemoryHandle;
using crypto::SodiumInterop;
using enums::CipherSuite;
using interfaces::IAsymmetricCipher;
using models::AsymmetricKeyPair;
using models::PrivateKey;
using models::PublicKey;

/// Toy cipher with observable key material.
///
/// A key pair is a random 16-byte id: the public key is "MOCKPK" || id and
/// the private key holds the id. Ciphertext is id || (message XOR id), so
/// Decrypt fails unless the private key is the one the ciphertext names.
class MockAsymmetricCipher : public IAsymmetricCipher {
public:
    static constexpr size_t KEY_ID_SIZE = 16;
    static constexpr uint8_t PUBLIC_PREFIX[] = {'M', 'O', 'C', 'K', 'P', 'K'};

    explicit MockAsymmetricCipher(const CipherSuite suite = CipherSuite::RsaOaepSha256)
        : suite_(suite) {}

    [[nodiscard]] CipherSuite GetSuite() const noexcept override {
        return suite_;
    }

    [[nodiscard]] Result<AsymmetricKeyPair, CipherFailure> GenerateKeyPair(uint32_t) override {
        std::lock_guard lock(mutex_);
        ++generate_calls_;
        if (fail_generate_on_call_.has_value() && *fail_generate_on_call_ == generate_calls_) {
            return Result<AsymmetricKeyPair, CipherFailure>::Err(
                CipherFailure::KeyGeneration("Mock: injected key generation failure"));
        }

        auto id = SodiumInterop::GetRandomBytes(KEY_ID_SIZE);
        auto handle_result = SecureMemoryHandle::AllocateFrom(id);
        if (handle_result.IsErr()) {
            return Result<AsymmetricKeyPair, CipherFailure>::Err(
                CipherFailure::FromSodiumFailure(handle_result.UnwrapErr()));
        }

        std::vector<uint8_t> public_bytes(std::begin(PUBLIC_PREFIX), std::end(PUBLIC_PREFIX));
        public_bytes.insert(public_bytes.end(), id.begin(), id.end());
        PublicKey public_key(suite_, public_bytes);
        issued_public_keys_.push_back(public_key);

        return Result<AsymmetricKeyPair, CipherFailure>::Ok(
            AsymmetricKeyPair(std::move(public_key), PrivateKey(suite_, std::move(handle_result).Unwrap())));
    }

    [[nodiscard]] Result<std::vector<uint8_t>, CipherFailure> Encrypt(
        const PublicKey& public_key,
        std::span<const uint8_t> plaintext) override {
        std::lock_guard lock(mutex_);
        encrypt_attempts_.push_back(public_key);
        if (public_key.GetSuite() != suite_) {
            return Result<std::vector<uint8_t>, CipherFailure>::Err(
                CipherFailure::InvalidKey("Mock: suite mismatch"));
        }
        if (public_key.Size() != sizeof(PUBLIC_PREFIX) + KEY_ID_SIZE) {
            return Result<std::vector<uint8_t>, CipherFailure>::Err(
                CipherFailure::InvalidKey("Mock: malformed public key"));
        }
        if (fail_encrypt_for_.has_value() && *fail_encrypt_for_ == public_key) {
            return Result<std::vector<uint8_t>, CipherFailure>::Err(
                CipherFailure::InvalidKey("Mock: injected encryption failure"));
        }
        if (max_plaintext_.has_value() && plaintext.size() > *max_plaintext_) {
            return Result<std::vector<uint8_t>, CipherFailure>::Err(
                CipherFailure::Encoding("Mock: plaintext too large"));
        }
        ++encrypt_calls_;
        const auto id = public_key.GetBytes().subspan(sizeof(PUBLIC_PREFIX));
        std::vector<uint8_t> ciphertext(id.begin(), id.end());
        for (size_t i = 0; i < plaintext.size(); ++i) {
            ciphertext.push_back(static_cast<uint8_t>(plaintext[i] ^ id[i % KEY_ID_SIZE]));
        }
        return Result<std::vector<uint8_t>, CipherFailure>::Ok(std::move(ciphertext));
    }

    [[nodiscard]] Result<std::vector<uint8_t>, CipherFailure> Decrypt(
        const PrivateKey& private_key,
        std::span<const uint8_t> ciphertext) override {
        std::lock_guard lock(mutex_);
        decrypted_ciphertexts_.emplace_back(ciphertext.begin(), ciphertext.end());
        if (private_key.IsDestroyed()) {
            return Result<std::vector<uint8_t>, CipherFailure>::Err(
                CipherFailure::InvalidKey("Mock: private key destroyed"));
        }
        if (ciphertext.size() < KEY_ID_SIZE) {
            return Result<std::vector<uint8_t>, CipherFailure>::Err(
                CipherFailure::Decryption("Mock: ciphertext too short"));
        }

        auto id_result = private_key.GetSecretKeyHandle().ReadBytes(KEY_ID_SIZE);
        if (id_result.IsErr()) {
            return Result<std::vector<uint8_t>, CipherFailure>::Err(
                CipherFailure::FromSodiumFailure(id_result.UnwrapErr()));
        }
        const auto id = std::move(id_result).Unwrap();
        if (!std::equal(id.begin(), id.end(), ciphertext.begin())) {
            return Result<std::vector<uint8_t>, CipherFailure>::Err(
                CipherFailure::Decryption("Mock: ciphertext was made for another key"));
        }

        std::vector<uint8_t> plaintext;
        plaintext.reserve(ciphertext.size() - KEY_ID_SIZE);
        for (size_t i = KEY_ID_SIZE; i < ciphertext.size(); ++i) {
            plaintext.push_back(static_cast<uint8_t>(ciphertext[i] ^ id[(i - KEY_ID_SIZE) % KEY_ID_SIZE]));
        }
        return Result<std::vector<uint8_t>, CipherFailure>::Ok(std::move(plaintext));
    }

    [[nodiscard]] Result<size_t, CipherFailure> MaxPlaintextSize(const PublicKey&) override {
        std::lock_guard lock(mutex_);
        return Result<size_t, CipherFailure>::Ok(max_plaintext_.value_or(SIZE_MAX));
    }

    /// The nth GenerateKeyPair call (1-based) fails.
    void FailKeyGenerationOnCall(const size_t call) {
        std::lock_guard lock(mutex_);
        fail_generate_on_call_ = call;
    }

    void FailEncryptionFor(const PublicKey& public_key) {
        std::lock_guard lock(mutex_);
        fail_encrypt_for_ = public_key;
    }

    void SetMaxPlaintext(const size_t max_plaintext) {
        std::lock_guard lock(mutex_);
        max_plaintext_ = max_plaintext;
    }

    [[nodiscard]] size_t GenerateCallCount() const {
        std::lock_guard lock(mutex_);
        return generate_calls_;
    }

    [[nodiscard]] size_t GeneratedKeyCount() const {
        std::lock_guard lock(mutex_);
        return issued_public_keys_.size();
    }

    [[nodiscard]] size_t EncryptCallCount() const {
        std::lock_guard lock(mutex_);
        return encrypt_calls_;
    }

    /// Every key passed to Encrypt, in call order, including rejected ones.
    [[nodiscard]] std::vector<PublicKey> EncryptAttempts() const {
        std::lock_guard lock(mutex_);
        return encrypt_attempts_;
    }

    [[nodiscard]] std::vector<PublicKey> IssuedPublicKeys() const {
        std::lock_guard lock(mutex_);
        return issued_public_keys_;
    }

    [[nodiscard]] std::vector<std::vector<uint8_t>> DecryptedCiphertexts() const {
        std::lock_guard lock(mutex_);
        return decrypted_ciphertexts_;
    }

    ~MockAsymmetricCipher() override = default;

private:
    CipherSuite suite_;
    mutable std::mutex mutex_;
    size_t generate_calls_ = 0;
    size_t encrypt_calls_ = 0;
    std::optional<size_t> fail_generate_on_call_;
    std::optional<PublicKey> fail_encrypt_for_;
    std::optional<size_t> max_plaintext_;
    std::vector<PublicKey> issued_public_keys_;
    std::vector<PublicKey> encrypt_attempts_;
    std::vector<std::vector<uint8_t>> decrypted_ciphertexts_;
};

}
