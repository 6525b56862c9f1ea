#pragma once

#include "otkit/core/result.hpp"
#include "otkit/core/failures.hpp"

#include <cstdint>

namespace otkit::protocol::enums {

/**
 * @brief Receiver's selector in a 1-out-of-2 transfer
 *
 * The underlying value doubles as the slot index: the receiver's real public
 * key goes into slot ChoiceToBit(choice) and the decoy into the other one.
 */
enum class Choice : uint8_t {
    Zero = 0,
    One = 1
};

/**
 * @brief Validated construction from an external bit
 *
 * Takes a wide integer so that callers passing e.g. 256 are rejected instead
 * of silently wrapping to Zero.
 *
 * @return Ok(Choice) for 0 or 1, Err(InvalidChoice) otherwise
 */
[[nodiscard]] Result<Choice, OtFailure> ChoiceFromBit(uint64_t bit);

[[nodiscard]] constexpr uint8_t ChoiceToBit(const Choice choice) noexcept {
    return choice == Choice::Zero ? 0 : 1;
}

/// The slot that receives the decoy key.
[[nodiscard]] constexpr Choice Opposite(const Choice choice) noexcept {
    return choice == Choice::Zero ? Choice::One : Choice::Zero;
}

constexpr const char* ToString(const Choice choice) noexcept {
    switch (choice) {
        case Choice::Zero:
            return "ZERO";
        case Choice::One:
            return "ONE";
        default:
            return "UNKNOWN";
    }
}

} // namespace otkit::protocol::enums
