#pragma once

#include "otkit/interfaces/i_asymmetric_cipher.hpp"

#include <memory>

namespace otkit::protocol::crypto {

/// Backend for suite. Unknown suite values are rejected with Backend.
[[nodiscard]] Result<std::shared_ptr<interfaces::IAsymmetricCipher>, CipherFailure>
CreateAsymmetricCipher(enums::CipherSuite suite);

} // namespace otkit::protocol::crypto
