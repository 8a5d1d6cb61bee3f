#ifndef HMAC_REQUEST_SIGNER_HPP
#define HMAC_REQUEST_SIGNER_HPP

#include "request_signer.hpp"

namespace MarketDesk {
namespace API {

/**
 * Shared-secret scheme.
 * timestamp: Unix milliseconds
 * message:   timestamp + METHOD + path + body
 * signature: base64(HMAC-SHA256(secret, message))
 */
class HmacRequestSigner : public RequestSigner {
public:
    explicit HmacRequestSigner(const Config::CredentialConfig& credential_config);

    RequestSignature sign_context(const SigningContext& context) const override;
    std::string build_message(const SigningContext& context) const override;
    std::string current_timestamp() const override;
    std::vector<std::string> build_auth_headers(const RequestSignature& request_signature) const override;
    Config::SigningScheme get_scheme() const override;

    static std::string compute_hmac_sha256_base64(const std::string& secret, const std::string& message);
};

} // namespace API
} // namespace MarketDesk

#endif // HMAC_REQUEST_SIGNER_HPP
