#ifndef REQUEST_SIGNER_FACTORY_HPP
#define REQUEST_SIGNER_FACTORY_HPP

#include "request_signer.hpp"
#include "configs/system_config.hpp"

namespace MarketDesk {
namespace API {

// Picks the signer named by auth.signing_scheme. The signer keeps a reference to config.credentials.
RequestSignerPtr create_request_signer(const Config::SystemConfig& config);

} // namespace API
} // namespace MarketDesk

#endif // REQUEST_SIGNER_FACTORY_HPP
