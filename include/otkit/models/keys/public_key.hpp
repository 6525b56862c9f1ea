#pragma once
#include "otkit/enums/cipher_suite.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace otkit::protocol::models {
using enums::CipherSuite;
/// Encoded public key tagged with the suite that produced it.
class PublicKey {
public:
    PublicKey(CipherSuite suite, std::vector<uint8_t> key_bytes);
    [[nodiscard]] CipherSuite GetSuite() const noexcept {
        return suite_;
    }
    [[nodiscard]] std::span<const uint8_t> GetBytes() const noexcept {
        return key_bytes_;
    }
    [[nodiscard]] std::vector<uint8_t> GetBytesCopy() const {
        return key_bytes_;
    }
    [[nodiscard]] size_t Size() const noexcept {
        return key_bytes_.size();
    }
    [[nodiscard]] bool IsEmpty() const noexcept {
        return key_bytes_.empty();
    }
    bool operator==(const PublicKey& other) const {
        return suite_ == other.suite_ && key_bytes_ == other.key_bytes_;
    }
    bool operator!=(const PublicKey& other) const {
        return !(*this == other);
    }
private:
    CipherSuite suite_;
    std::vector<uint8_t> key_bytes_;
};
}
