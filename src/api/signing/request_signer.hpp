#ifndef REQUEST_SIGNER_HPP
#define REQUEST_SIGNER_HPP

#include "configs/api_config.hpp"
#include <string>
#include <vector>
#include <memory>

namespace MarketDesk {
namespace API {

// One pending request. Built fresh per call; never cached or reused.
struct SigningContext {
    std::string method;
    std::string path;
    std::string body;
    std::string timestamp;
    const Config::CredentialConfig& credentials;

    SigningContext(const std::string& method_value, const std::string& path_value, const std::string& body_value,
                   const std::string& timestamp_value, const Config::CredentialConfig& credential_config)
        : method(method_value), path(path_value), body(body_value), timestamp(timestamp_value),
          credentials(credential_config) {}
};

struct RequestSignature {
    std::string timestamp;
    std::string signature;
};

/**
 * Signing strategy: message layout, key algorithm and auth headers.
 *
 * The message layout is a byte-exact contract with the upstream verifier.
 * Each implementation owns its own layout; they must never be mixed.
 */
class RequestSigner {
protected:
    const Config::CredentialConfig& credentials;

public:
    explicit RequestSigner(const Config::CredentialConfig& credential_config) : credentials(credential_config) {}
    virtual ~RequestSigner() = default;

    // Signs with a timestamp taken now.
    RequestSignature sign(const std::string& method, const std::string& path, const std::string& body) const;

    // Deterministic for a fixed context.
    virtual RequestSignature sign_context(const SigningContext& context) const = 0;

    virtual std::string build_message(const SigningContext& context) const = 0;
    virtual std::string current_timestamp() const = 0;
    virtual std::vector<std::string> build_auth_headers(const RequestSignature& request_signature) const = 0;
    virtual Config::SigningScheme get_scheme() const = 0;

    // Auth headers plus the JSON content negotiation headers.
    std::vector<std::string> build_signed_headers(const RequestSignature& request_signature) const;
};

using RequestSignerPtr = std::unique_ptr<RequestSigner>;

} // namespace API
} // namespace MarketDesk

#endif // REQUEST_SIGNER_HPP
