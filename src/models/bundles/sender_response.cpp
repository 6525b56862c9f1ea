#include "otkit/models/bundles/sender_response.hpp"
namespace otkit::protocol::models {
SenderResponse::SenderResponse(std::vector<uint8_t> ciphertext0, std::vector<uint8_t> ciphertext1)
    : ciphertexts_{std::move(ciphertext0), std::move(ciphertext1)} {
}
}
