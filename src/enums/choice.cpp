#include "otkit/enums/choice.hpp"
#include "otkit/core/format.hpp"

namespace otkit::protocol::enums {

Result<Choice, OtFailure> ChoiceFromBit(const uint64_t bit) {
    switch (bit) {
        case 0:
            return Result<Choice, OtFailure>::Ok(Choice::Zero);
        case 1:
            return Result<Choice, OtFailure>::Ok(Choice::One);
        default:
            return Result<Choice, OtFailure>::Err(
                OtFailure::InvalidChoice(compat::format("Invalid choice bit: {}", bit)));
    }
}

} // namespace otkit::protocol::enums
