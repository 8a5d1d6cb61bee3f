#ifndef ED25519_REQUEST_SIGNER_HPP
#define ED25519_REQUEST_SIGNER_HPP

#include "request_signer.hpp"

namespace MarketDesk {
namespace API {

/**
 * Asymmetric scheme.
 * timestamp: Unix seconds
 * message:   api_key + timestamp + path + method + body
 * signature: base64(Ed25519 detached signature), key from a base64 32-byte seed
 */
class Ed25519RequestSigner : public RequestSigner {
public:
    explicit Ed25519RequestSigner(const Config::CredentialConfig& credential_config);

    RequestSignature sign_context(const SigningContext& context) const override;
    std::string build_message(const SigningContext& context) const override;
    std::string current_timestamp() const override;
    std::vector<std::string> build_auth_headers(const RequestSignature& request_signature) const override;
    Config::SigningScheme get_scheme() const override;

    static std::vector<unsigned char> decode_seed(const std::string& seed_base64);
    static std::vector<unsigned char> derive_public_key(const std::vector<unsigned char>& seed);
    static std::vector<unsigned char> sign_message(const std::vector<unsigned char>& seed, const std::string& message);
};

} // namespace API
} // namespace MarketDesk

#endif // ED25519_REQUEST_SIGNER_HPP
