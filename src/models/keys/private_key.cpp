#include "otkit/models/keys/private_key.hpp"
namespace otkit::protocol::models {
PrivateKey::PrivateKey(const CipherSuite suite, crypto::SecureMemoryHandle secret_key_handle)
    : suite_(suite)
    , secret_key_handle_(std::move(secret_key_handle)) {
}
}
