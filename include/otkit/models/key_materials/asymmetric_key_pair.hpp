#pragma once
#include "otkit/models/keys/public_key.hpp"
#include "otkit/models/keys/private_key.hpp"
namespace otkit::protocol::models {
class AsymmetricKeyPair {
public:
    AsymmetricKeyPair(PublicKey public_key, PrivateKey private_key);
    AsymmetricKeyPair(AsymmetricKeyPair&&) noexcept = default;
    AsymmetricKeyPair& operator=(AsymmetricKeyPair&&) noexcept = default;
    AsymmetricKeyPair(const AsymmetricKeyPair&) = delete;
    AsymmetricKeyPair& operator=(const AsymmetricKeyPair&) = delete;
    [[nodiscard]] const PublicKey& GetPublicKey() const noexcept {
        return public_key_;
    }
    [[nodiscard]] const PrivateKey& GetPrivateKey() const noexcept {
        return private_key_;
    }
    [[nodiscard]] PrivateKey TakePrivateKey() && {
        return std::move(private_key_);
    }
    /**
     * Consume the pair, destroying the private half before returning.
     *
     * The private key is wiped here rather than when the moved-from pair
     * goes out of scope in the caller.
     */
    [[nodiscard]] PublicKey DiscardPrivateKey() &&;
private:
    PublicKey public_key_;
    PrivateKey private_key_;
};
}
