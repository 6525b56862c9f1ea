#pragma once
#include "otkit/enums/choice.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <vector>
namespace otkit::protocol::models {
using enums::Choice;
/// Ciphertexts sent from sender to receiver, ciphertext i = Encrypt(slot i, message i).
class SenderResponse {
public:
    SenderResponse(std::vector<uint8_t> ciphertext0, std::vector<uint8_t> ciphertext1);
    [[nodiscard]] std::span<const uint8_t> Ciphertext0() const noexcept {
        return ciphertexts_[0];
    }
    [[nodiscard]] std::span<const uint8_t> Ciphertext1() const noexcept {
        return ciphertexts_[1];
    }
    [[nodiscard]] std::span<const uint8_t> At(const Choice slot) const noexcept {
        return ciphertexts_[enums::ChoiceToBit(slot)];
    }
private:
    std::array<std::vector<uint8_t>, 2> ciphertexts_;
};
}
