#include "hmac_request_signer.hpp"
#include "core/errors.hpp"
#include "utils/base64_utils.hpp"
#include "utils/time_utils.hpp"
#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>

namespace MarketDesk {
namespace API {

HmacRequestSigner::HmacRequestSigner(const Config::CredentialConfig& credential_config)
    : RequestSigner(credential_config) {}

RequestSignature HmacRequestSigner::sign_context(const SigningContext& context) const {
    if (context.credentials.api_secret.empty()) {
        throw Core::ConfigurationError("HMAC signing requires a shared secret (api.api_secret / RH_SHARED_SECRET)");
    }
    if (context.credentials.api_key.empty()) {
        throw Core::ConfigurationError("HMAC signing requires an API key (api.api_key / RH_API_KEY)");
    }

    RequestSignature request_signature;
    request_signature.timestamp = context.timestamp;
    request_signature.signature = compute_hmac_sha256_base64(context.credentials.api_secret, build_message(context));
    return request_signature;
}

std::string HmacRequestSigner::build_message(const SigningContext& context) const {
    std::string upper_method = context.method;
    std::transform(upper_method.begin(), upper_method.end(), upper_method.begin(),
                   [](unsigned char character) { return static_cast<char>(std::toupper(character)); });
    return context.timestamp + upper_method + context.path + context.body;
}

std::string HmacRequestSigner::current_timestamp() const {
    return std::to_string(TimeUtils::get_current_epoch_milliseconds());
}

std::vector<std::string> HmacRequestSigner::build_auth_headers(const RequestSignature& request_signature) const {
    std::vector<std::string> headers;
    headers.push_back("X-Robinhood-API-Key: " + credentials.api_key);
    if (!credentials.client_id.empty()) {
        headers.push_back("X-Robinhood-Client-Id: " + credentials.client_id);
    }
    headers.push_back("X-Robinhood-Signature: " + request_signature.signature);
    headers.push_back("X-Robinhood-Timestamp: " + request_signature.timestamp);
    return headers;
}

Config::SigningScheme HmacRequestSigner::get_scheme() const {
    return Config::SigningScheme::HMAC_SHA256;
}

std::string HmacRequestSigner::compute_hmac_sha256_base64(const std::string& secret, const std::string& message) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;

    unsigned char* hmac_result = HMAC(EVP_sha256(),
                                      secret.data(), static_cast<int>(secret.size()),
                                      reinterpret_cast<const unsigned char*>(message.data()), message.size(),
                                      digest, &digest_length);
    if (!hmac_result) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }

    return Utils::base64_encode(digest, digest_length);
}

} // namespace API
} // namespace MarketDesk
