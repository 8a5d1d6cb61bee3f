#ifndef TEST_CONFIGS_HPP
#define TEST_CONFIGS_HPP

#include "configs/system_config.hpp"
#include <string>
#include <vector>

namespace MarketDesk {
namespace Testing {

// RFC 8032 test vector 1 secret key, base64.
inline const std::string ED25519_TEST_SEED_BASE64 = "nWGxne/9WmC6hEr0kuwsxERJxWl7MmkZcDusAxyuf2A=";

inline Config::SystemConfig make_mock_config() {
    Config::SystemConfig config;
    config.credentials.base_url = "https://trading.example.com";
    config.credentials.market_data_url = "https://data.example.com";
    return config;
}

inline Config::SystemConfig make_live_ed25519_config() {
    Config::SystemConfig config = make_mock_config();
    config.credentials.api_key = "test-key";
    config.credentials.private_key_seed = ED25519_TEST_SEED_BASE64;
    config.credentials.signing_scheme = Config::SigningScheme::ED25519;
    config.credentials.live = true;
    return config;
}

inline Config::SystemConfig make_live_hmac_config() {
    Config::SystemConfig config = make_mock_config();
    config.credentials.api_key = "test-key";
    config.credentials.api_secret = "test-secret";
    config.credentials.client_id = "client-7";
    config.credentials.signing_scheme = Config::SigningScheme::HMAC_SHA256;
    config.credentials.live = true;
    return config;
}

inline bool has_header(const std::vector<std::string>& headers, const std::string& header_prefix) {
    for (const std::string& header_line : headers) {
        if (header_line.compare(0, header_prefix.size(), header_prefix) == 0) {
            return true;
        }
    }
    return false;
}

} // namespace Testing
} // namespace MarketDesk

#endif // TEST_CONFIGS_HPP
