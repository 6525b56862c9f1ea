#include "otkit/crypto/asymmetric_cipher_factory.hpp"
#include "otkit/crypto/rsa_oaep_cipher.hpp"
#include "otkit/crypto/kyber_aes_gcm_cipher.hpp"
#include "otkit/core/format.hpp"

namespace otkit::protocol::crypto {

Result<std::shared_ptr<interfaces::IAsymmetricCipher>, CipherFailure>
CreateAsymmetricCipher(const enums::CipherSuite suite) {
    using FactoryResult = Result<std::shared_ptr<interfaces::IAsymmetricCipher>, CipherFailure>;
    switch (suite) {
        case enums::CipherSuite::RsaOaepSha256:
            return FactoryResult::Ok(std::make_shared<RsaOaepCipher>());
        case enums::CipherSuite::Kyber768AesGcm:
            return FactoryResult::Ok(std::make_shared<KyberAesGcmCipher>());
    }
    return FactoryResult::Err(
        CipherFailure::Backend(
            compat::format("Unsupported cipher suite: {}", static_cast<int>(suite))));
}

} // namespace otkit::protocol::crypto
