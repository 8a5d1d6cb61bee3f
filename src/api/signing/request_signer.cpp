#include "request_signer.hpp"

namespace MarketDesk {
namespace API {

RequestSignature RequestSigner::sign(const std::string& method, const std::string& path, const std::string& body) const {
    SigningContext signing_context(method, path, body, current_timestamp(), credentials);
    return sign_context(signing_context);
}

std::vector<std::string> RequestSigner::build_signed_headers(const RequestSignature& request_signature) const {
    std::vector<std::string> headers = build_auth_headers(request_signature);
    headers.push_back("Content-Type: application/json; charset=utf-8");
    headers.push_back("Accept: application/json");
    return headers;
}

} // namespace API
} // namespace MarketDesk
