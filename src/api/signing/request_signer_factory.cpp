#include "request_signer_factory.hpp"
#include "hmac_request_signer.hpp"
#include "ed25519_request_signer.hpp"
#include <stdexcept>

namespace MarketDesk {
namespace API {

RequestSignerPtr create_request_signer(const Config::SystemConfig& config) {
    switch (config.credentials.signing_scheme) {
        case Config::SigningScheme::HMAC_SHA256:
            return std::make_unique<HmacRequestSigner>(config.credentials);
        case Config::SigningScheme::ED25519:
            return std::make_unique<Ed25519RequestSigner>(config.credentials);
    }
    throw std::runtime_error("Unsupported signing scheme");
}

} // namespace API
} // namespace MarketDesk
