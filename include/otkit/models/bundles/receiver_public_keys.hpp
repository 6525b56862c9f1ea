#pragma once
#include "otkit/models/keys/public_key.hpp"
#include "otkit/enums/choice.hpp"
#include <array>
namespace otkit::protocol::models {
using enums::Choice;
/**
 * Public-key offer sent from receiver to sender.
 *
 * Slot i is the key message i gets encrypted under. One slot holds the
 * receiver's real key, the other a decoy; nothing in this object records
 * which is which.
 */
class ReceiverPublicKeys {
public:
    ReceiverPublicKeys(PublicKey slot0, PublicKey slot1);
    [[nodiscard]] const PublicKey& Slot0() const noexcept {
        return slots_[0];
    }
    [[nodiscard]] const PublicKey& Slot1() const noexcept {
        return slots_[1];
    }
    [[nodiscard]] const PublicKey& At(const Choice slot) const noexcept {
        return slots_[enums::ChoiceToBit(slot)];
    }
private:
    std::array<PublicKey, 2> slots_;
};
}
