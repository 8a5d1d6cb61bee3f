#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include "api_config.hpp"
#include "orders_config.hpp"
#include "display_config.hpp"
#include "logging_config.hpp"

namespace MarketDesk {
namespace Config {

/**
 * Complete client configuration.
 * Built once by ConfigLoader and passed by const reference into each component.
 */
struct SystemConfig {
    CredentialConfig credentials;      // Keys, URLs, live flag, signing scheme
    HttpConfig http;                   // Transport settings
    EndpointsConfig endpoints;         // Path templates per upstream endpoint
    OrdersConfig orders;               // Order listing limits and mock policy
    DisplayConfig display;             // Depth chart geometry
    LoggingConfig logging;             // Log file and console echo
};

} // namespace Config
} // namespace MarketDesk

#endif // SYSTEM_CONFIG_HPP
