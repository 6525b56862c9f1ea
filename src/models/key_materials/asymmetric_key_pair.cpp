#include "otkit/models/key_materials/asymmetric_key_pair.hpp"
namespace otkit::protocol::models {
AsymmetricKeyPair::AsymmetricKeyPair(PublicKey public_key, PrivateKey private_key)
    : public_key_(std::move(public_key))
    , private_key_(std::move(private_key)) {
}
PublicKey AsymmetricKeyPair::DiscardPrivateKey() && {
    {
        PrivateKey doomed = std::move(private_key_);
        doomed.Destroy();
    }
    return std::move(public_key_);
}
}
