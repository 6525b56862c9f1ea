#include "otkit/models/keys/public_key.hpp"
namespace otkit::protocol::models {
PublicKey::PublicKey(const CipherSuite suite, std::vector<uint8_t> key_bytes)
    : suite_(suite)
    , key_bytes_(std::move(key_bytes)) {
}
}
