#include "otkit/models/bundles/receiver_public_keys.hpp"
namespace otkit::protocol::models {
ReceiverPublicKeys::ReceiverPublicKeys(PublicKey slot0, PublicKey slot1)
    : slots_{std::move(slot0), std::move(slot1)} {
}
}
