#include "config_loader.hpp"
#include "core/errors.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace MarketDesk {
namespace Config {

SigningScheme parse_signing_scheme(const std::string& scheme_name) {
    std::string lower_name = scheme_name;
    std::transform(lower_name.begin(), lower_name.end(), lower_name.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });

    if (lower_name == "ed25519") {
        return SigningScheme::ED25519;
    } else if (lower_name == "hmac" || lower_name == "hmac_sha256") {
        return SigningScheme::HMAC_SHA256;
    }
    throw Core::ConfigurationError("Unknown signing scheme: " + scheme_name);
}

std::string signing_scheme_to_string(SigningScheme scheme) {
    switch (scheme) {
        case SigningScheme::ED25519:
            return "ed25519";
        case SigningScheme::HMAC_SHA256:
            return "hmac";
    }
    return "unknown";
}

MockOrderPolicy parse_mock_order_policy(const std::string& policy_name) {
    std::string lower_name = policy_name;
    std::transform(lower_name.begin(), lower_name.end(), lower_name.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });

    if (lower_name == "synthetic") {
        return MockOrderPolicy::SYNTHETIC;
    } else if (lower_name == "empty") {
        return MockOrderPolicy::EMPTY;
    }
    throw Core::ConfigurationError("Unknown mock order policy: " + policy_name);
}

} // namespace Config

namespace Core {

Config::SystemConfig ConfigLoader::load_from_csv(const std::string& csv_path) {
    if (csv_path.empty()) {
        throw ConfigurationError("CSV path is required but not provided");
    }
    
    std::ifstream file(csv_path);
    if (!file.is_open()) {
        throw ConfigurationError("Failed to open configuration file: " + csv_path);
    }
    
    Config::SystemConfig config;
    std::string line;
    
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }
        
        std::stringstream ss(line);
        std::string key, value;
        
        if (!std::getline(ss, key, ',')) {
            continue;
        }
        
        // Empty values are allowed (credentials left for the environment)
        std::getline(ss, value);
        
        key = trim(key);
        value = trim(value);
        
        if (key.empty()) {
            continue;
        }
        
        apply_setting(key, value, config);
    }
    
    return config;
}

void ConfigLoader::apply_setting(const std::string& key, const std::string& value, Config::SystemConfig& config) {
    // Credentials
    if (key == "api.api_key") config.credentials.api_key = value;
    else if (key == "api.api_secret") config.credentials.api_secret = value;
    else if (key == "api.private_key_seed") config.credentials.private_key_seed = value;
    else if (key == "api.client_id") config.credentials.client_id = value;
    else if (key == "api.account_number") config.credentials.account_number = value;
    else if (key == "api.base_url") config.credentials.base_url = strip_trailing_slashes(value);
    else if (key == "api.market_data_url") config.credentials.market_data_url = strip_trailing_slashes(value);
    else if (key == "api.live") config.credentials.live = to_bool(value);
    else if (key == "auth.signing_scheme") config.credentials.signing_scheme = Config::parse_signing_scheme(value);

    // HTTP
    else if (key == "http.timeout_seconds") config.http.timeout_seconds = to_int(key, value);
    else if (key == "http.enable_ssl_verification") config.http.enable_ssl_verification = to_bool(value);

    // Orders
    else if (key == "orders.mock_policy") config.orders.mock_policy = Config::parse_mock_order_policy(value);
    else if (key == "orders.max_limit") config.orders.max_limit = to_int(key, value);
    else if (key == "orders.default_limit") config.orders.default_limit = to_int(key, value);

    // Display
    else if (key == "display.depth_width") config.display.depth_width = to_int(key, value);
    else if (key == "display.depth_levels") config.display.depth_levels = to_int(key, value);

    // Endpoints
    else if (key == "endpoints.quote") config.endpoints.quote = value;
    else if (key == "endpoints.options_chain") config.endpoints.options_chain = value;
    else if (key == "endpoints.trading_pairs") config.endpoints.trading_pairs = value;
    else if (key == "endpoints.best_bid_ask") config.endpoints.best_bid_ask = value;
    else if (key == "endpoints.order_book") config.endpoints.order_book = value;
    else if (key == "endpoints.orders") config.endpoints.orders = value;

    // Logging
    else if (key == "logging.log_file") config.logging.log_file = value;
    else if (key == "logging.console_output") config.logging.console_output = to_bool(value);
    else if (key == "logging.poll_interval_ms") config.logging.logging_poll_interval_ms = to_int(key, value);
}

void ConfigLoader::apply_environment_overrides(Config::SystemConfig& config) {
    const char* env_value = std::getenv("RH_API_KEY");
    if (env_value && *env_value) {
        config.credentials.api_key = env_value;
    }

    env_value = std::getenv("RH_SHARED_SECRET");
    if (env_value && *env_value) {
        config.credentials.api_secret = env_value;
    }

    env_value = std::getenv("RH_PRIVATE_KEY");
    if (env_value && *env_value) {
        config.credentials.private_key_seed = env_value;
    }

    env_value = std::getenv("RH_CLIENT_ID");
    if (env_value && *env_value) {
        config.credentials.client_id = env_value;
    }

    env_value = std::getenv("RH_ACCOUNT_NUMBER");
    if (env_value && *env_value) {
        config.credentials.account_number = env_value;
    }

    env_value = std::getenv("RH_BASE_URL");
    if (env_value && *env_value) {
        config.credentials.base_url = strip_trailing_slashes(env_value);
    }

    // Only the literal "true" enables live mode from the environment
    env_value = std::getenv("LIVE");
    if (env_value) {
        config.credentials.live = std::string(env_value) == "true";
    }
}

void ConfigLoader::validate(const Config::SystemConfig& config) {
    if (config.credentials.base_url.empty()) {
        throw ConfigurationError("api.base_url is required");
    }
    if (config.credentials.market_data_url.empty()) {
        throw ConfigurationError("api.market_data_url is required");
    }
    if (config.http.timeout_seconds <= 0) {
        throw ConfigurationError("http.timeout_seconds must be > 0");
    }
    if (config.orders.max_limit <= 0) {
        throw ConfigurationError("orders.max_limit must be > 0");
    }
    if (config.orders.default_limit <= 0 || config.orders.default_limit > config.orders.max_limit) {
        throw ConfigurationError("orders.default_limit must be between 1 and orders.max_limit");
    }
    if (config.display.depth_width <= 0) {
        throw ConfigurationError("display.depth_width must be > 0");
    }
    if (config.display.depth_levels <= 0) {
        throw ConfigurationError("display.depth_levels must be > 0");
    }

    const Config::EndpointsConfig& endpoints = config.endpoints;
    for (const std::string* endpoint_path : {&endpoints.quote, &endpoints.options_chain, &endpoints.trading_pairs,
                                              &endpoints.best_bid_ask, &endpoints.order_book, &endpoints.orders}) {
        if (endpoint_path->empty() || (*endpoint_path)[0] != '/') {
            throw ConfigurationError("Endpoint paths must be absolute: '" + *endpoint_path + "'");
        }
    }
}

Config::SystemConfig ConfigLoader::load_system_config(const std::string& csv_path) {
    Config::SystemConfig config = load_from_csv(csv_path);
    apply_environment_overrides(config);
    validate(config);
    return config;
}

std::string ConfigLoader::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool ConfigLoader::to_bool(const std::string& str) {
    std::string lower_str = str;
    std::transform(lower_str.begin(), lower_str.end(), lower_str.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    
    if (lower_str == "true" || lower_str == "1" || lower_str == "yes") {
        return true;
    } else if (lower_str == "false" || lower_str == "0" || lower_str == "no") {
        return false;
    } else {
        throw ConfigurationError("Invalid boolean value: " + str);
    }
}

int ConfigLoader::to_int(const std::string& key, const std::string& value) {
    try {
        size_t parsed_chars = 0;
        int parsed_value = std::stoi(value, &parsed_chars);
        if (parsed_chars != value.size()) {
            throw ConfigurationError("Invalid integer for " + key + ": " + value);
        }
        return parsed_value;
    } catch (const std::logic_error&) {
        throw ConfigurationError("Invalid integer for " + key + ": " + value);
    }
}

std::string ConfigLoader::strip_trailing_slashes(const std::string& url) {
    std::string stripped_url = url;
    while (!stripped_url.empty() && stripped_url.back() == '/') {
        stripped_url.pop_back();
    }
    return stripped_url;
}

} // namespace Core
} // namespace MarketDesk
