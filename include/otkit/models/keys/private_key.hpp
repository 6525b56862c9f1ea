#pragma once
#include "otkit/crypto/sodium_secure_memory_handle.hpp"
#include "otkit/enums/cipher_suite.hpp"
namespace otkit::protocol::models {
using enums::CipherSuite;
/**
 * Private key held in guarded memory.
 *
 * Move-only. There is no accessor that copies the key out; backends read it
 * through GetSecretKeyHandle().WithReadAccess. Destroying the object (or
 * calling Destroy) zeroes and frees the key.
 */
class PrivateKey {
public:
    PrivateKey(CipherSuite suite, crypto::SecureMemoryHandle secret_key_handle);
    PrivateKey(PrivateKey&&) noexcept = default;
    PrivateKey& operator=(PrivateKey&&) noexcept = default;
    PrivateKey(const PrivateKey&) = delete;
    PrivateKey& operator=(const PrivateKey&) = delete;
    [[nodiscard]] CipherSuite GetSuite() const noexcept {
        return suite_;
    }
    [[nodiscard]] const crypto::SecureMemoryHandle& GetSecretKeyHandle() const noexcept {
        return secret_key_handle_;
    }
    [[nodiscard]] bool IsDestroyed() const noexcept {
        return secret_key_handle_.IsInvalid();
    }
    void Destroy() noexcept {
        secret_key_handle_.Dispose();
    }
private:
    CipherSuite suite_;
    crypto::SecureMemoryHandle secret_key_handle_;
};
}
