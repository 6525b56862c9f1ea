#include "otkit/crypto/kyber_interop.hpp"
#include "otkit/crypto/sodium_interop.hpp"

#include <sodium.h>
#include <oqs/oqs.h>
#include <oqs/rand.h>
#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>

namespace otkit::protocol::crypto {

namespace {
    struct OqsKemDeleter {
        void operator()(OQS_KEM* kem) const {
            if (kem != nullptr) {
                OQS_KEM_free(kem);
            }
        }
    };
    using OqsKemPtr = std::unique_ptr<OQS_KEM, OqsKemDeleter>;

    Result<OqsKemPtr, SodiumFailure> CreateKyber768Instance() {
        auto init_result = KyberInterop::Initialize();
        if (init_result.IsErr()) {
            return Result<OqsKemPtr, SodiumFailure>::Err(init_result.UnwrapErr());
        }

        OqsKemPtr kem(OQS_KEM_new(OQS_KEM_alg_kyber_768));
        if (!kem) {
            return Result<OqsKemPtr, SodiumFailure>::Err(
                SodiumFailure::InitializationFailed("Failed to create Kyber-768 KEM instance (liboqs)"));
        }

        if (kem->length_public_key != KyberInterop::KYBER_768_PUBLIC_KEY_SIZE ||
            kem->length_secret_key != KyberInterop::KYBER_768_SECRET_KEY_SIZE ||
            kem->length_ciphertext != KyberInterop::KYBER_768_CIPHERTEXT_SIZE ||
            kem->length_shared_secret != KyberInterop::KYBER_768_SHARED_SECRET_SIZE) {
            return Result<OqsKemPtr, SodiumFailure>::Err(
                SodiumFailure::InitializationFailed("Kyber-768 parameter sizes do not match liboqs"));
        }

        return Result<OqsKemPtr, SodiumFailure>::Ok(std::move(kem));
    }

    bool IsAllZeros(std::span<const uint8_t> data) {
        return std::all_of(data.begin(), data.end(), [](const uint8_t b) { return b == 0; });
    }
}

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, SodiumFailure>
KyberInterop::GenerateKeyPair() {
    using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, SodiumFailure>;

    auto kem_result = CreateKyber768Instance();
    if (kem_result.IsErr()) {
        return KeyPairResult::Err(kem_result.UnwrapErr());
    }
    auto kem = std::move(kem_result).Unwrap();

    auto sk_handle_result = SecureMemoryHandle::Allocate(KYBER_768_SECRET_KEY_SIZE);
    if (sk_handle_result.IsErr()) {
        return KeyPairResult::Err(sk_handle_result.UnwrapErr());
    }
    auto sk_handle = std::move(sk_handle_result).Unwrap();

    std::vector<uint8_t> pk(KYBER_768_PUBLIC_KEY_SIZE);
    auto keypair_result = sk_handle.WithWriteAccess([&](std::span<uint8_t> sk_span) {
        return OQS_KEM_keypair(kem.get(), pk.data(), sk_span.data());
    });
    if (keypair_result.IsErr()) {
        return KeyPairResult::Err(keypair_result.UnwrapErr());
    }
    if (keypair_result.Unwrap() != OQS_SUCCESS) {
        return KeyPairResult::Err(
            SodiumFailure::InitializationFailed("Kyber-768 key generation failed"));
    }

    auto self_test = SelfTestKeyPair(pk, sk_handle);
    if (self_test.IsErr()) {
        return KeyPairResult::Err(self_test.UnwrapErr());
    }

    return KeyPairResult::Ok(std::make_pair(std::move(sk_handle), std::move(pk)));
}

Result<std::pair<std::vector<uint8_t>, SecureMemoryHandle>, SodiumFailure>
KyberInterop::Encapsulate(std::span<const uint8_t> public_key) {
    using EncapsulateResult = Result<std::pair<std::vector<uint8_t>, SecureMemoryHandle>, SodiumFailure>;

    auto validation_result = ValidatePublicKey(public_key);
    if (validation_result.IsErr()) {
        return EncapsulateResult::Err(validation_result.UnwrapErr());
    }

    auto kem_result = CreateKyber768Instance();
    if (kem_result.IsErr()) {
        return EncapsulateResult::Err(kem_result.UnwrapErr());
    }
    auto kem = std::move(kem_result).Unwrap();

    auto ss_handle_result = SecureMemoryHandle::Allocate(KYBER_768_SHARED_SECRET_SIZE);
    if (ss_handle_result.IsErr()) {
        return EncapsulateResult::Err(ss_handle_result.UnwrapErr());
    }
    auto ss_handle = std::move(ss_handle_result).Unwrap();

    std::vector<uint8_t> ciphertext(KYBER_768_CIPHERTEXT_SIZE);
    auto encaps_result = ss_handle.WithWriteAccess([&](std::span<uint8_t> ss_span) {
        return OQS_KEM_encaps(kem.get(), ciphertext.data(), ss_span.data(), public_key.data());
    });
    if (encaps_result.IsErr()) {
        return EncapsulateResult::Err(encaps_result.UnwrapErr());
    }
    if (encaps_result.Unwrap() != OQS_SUCCESS) {
        return EncapsulateResult::Err(
            SodiumFailure::InvalidOperation("Kyber-768 encapsulation failed"));
    }

    return EncapsulateResult::Ok(std::make_pair(std::move(ciphertext), std::move(ss_handle)));
}

Result<SecureMemoryHandle, SodiumFailure>
KyberInterop::Decapsulate(
    std::span<const uint8_t> ciphertext,
    const SecureMemoryHandle& secret_key_handle
) {
    auto ct_validation = ValidateCiphertext(ciphertext);
    if (ct_validation.IsErr()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(ct_validation.UnwrapErr());
    }
    auto sk_validation = ValidateSecretKey(secret_key_handle);
    if (sk_validation.IsErr()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(sk_validation.UnwrapErr());
    }

    auto kem_result = CreateKyber768Instance();
    if (kem_result.IsErr()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(kem_result.UnwrapErr());
    }
    auto kem = std::move(kem_result).Unwrap();

    auto ss_handle_result = SecureMemoryHandle::Allocate(KYBER_768_SHARED_SECRET_SIZE);
    if (ss_handle_result.IsErr()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(ss_handle_result.UnwrapErr());
    }
    auto ss_handle = std::move(ss_handle_result).Unwrap();

    // Both the secret key and the shared secret stay in guarded memory
    auto decaps_result = secret_key_handle.WithReadAccess([&](std::span<const uint8_t> sk_span) {
        return ss_handle.WithWriteAccess([&](std::span<uint8_t> ss_span) {
            return OQS_KEM_decaps(kem.get(), ss_span.data(), ciphertext.data(), sk_span.data());
        });
    });
    if (decaps_result.IsErr()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(decaps_result.UnwrapErr());
    }
    auto inner_result = std::move(decaps_result).Unwrap();
    if (inner_result.IsErr()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(inner_result.UnwrapErr());
    }
    if (inner_result.Unwrap() != OQS_SUCCESS) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("Kyber-768 decapsulation failed"));
    }

    return Result<SecureMemoryHandle, SodiumFailure>::Ok(std::move(ss_handle));
}

Result<Unit, SodiumFailure>
KyberInterop::ValidatePublicKey(std::span<const uint8_t> public_key) {
    if (public_key.size() != KYBER_768_PUBLIC_KEY_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall("Invalid Kyber-768 public key size (expected 1184 bytes)"));
    }
    if (IsAllZeros(public_key)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("Invalid Kyber-768 public key (all zeros)"));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure>
KyberInterop::ValidateCiphertext(std::span<const uint8_t> ciphertext) {
    if (ciphertext.size() != KYBER_768_CIPHERTEXT_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall("Invalid Kyber-768 ciphertext size (expected 1088 bytes)"));
    }
    if (IsAllZeros(ciphertext)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("Invalid Kyber-768 ciphertext (all zeros)"));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure>
KyberInterop::ValidateSecretKey(const SecureMemoryHandle& secret_key_handle) {
    if (secret_key_handle.Size() != KYBER_768_SECRET_KEY_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall("Invalid Kyber-768 secret key size (expected 2400 bytes)"));
    }
    auto zero_check = secret_key_handle.WithReadAccess([](std::span<const uint8_t> sk_span) {
        return IsAllZeros(sk_span);
    });
    if (zero_check.IsErr()) {
        return Result<Unit, SodiumFailure>::Err(zero_check.UnwrapErr());
    }
    if (zero_check.Unwrap()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("Invalid Kyber-768 secret key (all zeros)"));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure>
KyberInterop::SelfTestKeyPair(std::span<const uint8_t> public_key, const SecureMemoryHandle& secret_key_handle) {
    auto enc_result = Encapsulate(public_key);
    if (enc_result.IsErr()) {
        return Result<Unit, SodiumFailure>::Err(enc_result.UnwrapErr());
    }
    auto [ct, ss_sender] = std::move(enc_result).Unwrap();

    auto dec_result = Decapsulate(ct, secret_key_handle);
    if (dec_result.IsErr()) {
        return Result<Unit, SodiumFailure>::Err(dec_result.UnwrapErr());
    }
    auto ss_receiver = std::move(dec_result).Unwrap();

    auto cmp_result = ss_sender.WithReadAccess([&](std::span<const uint8_t> sent) {
        return ss_receiver.WithReadAccess([&](std::span<const uint8_t> received) {
            return SodiumInterop::ConstantTimeEquals(sent, received);
        });
    });
    if (cmp_result.IsErr()) {
        return Result<Unit, SodiumFailure>::Err(cmp_result.UnwrapErr());
    }
    auto inner_read = std::move(cmp_result).Unwrap();
    if (inner_read.IsErr()) {
        return Result<Unit, SodiumFailure>::Err(inner_read.UnwrapErr());
    }
    auto equal = std::move(inner_read).Unwrap();
    if (equal.IsErr() || !equal.Unwrap()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("Kyber self-test failed (encap/decap mismatch)"));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> KyberInterop::Initialize() {
    static std::once_flag rng_init_flag;
    static std::atomic<bool> initialized{false};

    std::call_once(rng_init_flag, [] {
        if (SodiumInterop::Initialize().IsErr()) {
            return;
        }
        OQS_randombytes_custom_algorithm(
            [](uint8_t* buf, size_t len) { randombytes_buf(buf, len); });
        initialized.store(true, std::memory_order_release);
    });

    if (!initialized.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed("KyberInterop initialization failed"));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

} // namespace otkit::protocol::crypto
