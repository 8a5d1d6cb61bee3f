#ifndef API_CONFIG_HPP
#define API_CONFIG_HPP

#include <string>

namespace MarketDesk {
namespace Config {

enum class SigningScheme {
    ED25519,
    HMAC_SHA256
};

/**
 * Credential snapshot shared read-only by every component.
 * Loaded once at startup; nothing mutates it afterwards.
 */
struct CredentialConfig {
    // Authentication
    std::string api_key;
    std::string api_secret;              // HMAC shared secret
    std::string private_key_seed;        // base64 Ed25519 seed (32 bytes decoded)
    std::string client_id;
    std::string account_number;

    // Base URLs
    std::string base_url;                // Signed trading/crypto API root
    std::string market_data_url;         // Public quote/options API root

    bool live;
    SigningScheme signing_scheme;

    CredentialConfig() : live(false), signing_scheme(SigningScheme::ED25519) {}

    // Key material required by the configured scheme is present.
    bool has_credentials() const {
        if (api_key.empty()) {
            return false;
        }
        if (signing_scheme == SigningScheme::HMAC_SHA256) {
            return !api_secret.empty();
        }
        return !private_key_seed.empty();
    }
};

struct HttpConfig {
    int timeout_seconds;
    bool enable_ssl_verification;

    HttpConfig() : timeout_seconds(15), enable_ssl_verification(true) {}
};

struct EndpointsConfig {
    // Public market data (unsigned)
    std::string quote;
    std::string options_chain;

    // Crypto trading API (signed)
    std::string trading_pairs;
    std::string best_bid_ask;
    std::string order_book;
    std::string orders;

    EndpointsConfig()
        : quote("/v7/finance/quote?symbols={symbol}"),
          options_chain("/v7/finance/options/{symbol}?date={date}"),
          trading_pairs("/api/v1/crypto/trading/trading_pairs/?symbol={symbol}"),
          best_bid_ask("/api/v1/crypto/marketdata/best_bid_ask/?symbol={symbol}"),
          order_book("/api/v1/crypto/marketdata/order_book/?symbol={symbol}"),
          orders("/api/v1/crypto/trading/orders/?limit={limit}") {}
};

SigningScheme parse_signing_scheme(const std::string& scheme_name);
std::string signing_scheme_to_string(SigningScheme scheme);

} // namespace Config
} // namespace MarketDesk

#endif // API_CONFIG_HPP
