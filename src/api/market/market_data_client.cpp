#include "api/market/market_data_client.hpp"
#include "api/normalizer/response_normalizer.hpp"
#include "core/errors.hpp"
#include "display/options_slice_formatter.hpp"
#include "logging/logs/api_request_logs.hpp"
#include "utils/http_utils.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace MarketDesk {
namespace API {

using MarketDesk::Logging::ApiRequestLogs;
using MarketDesk::Display::OptionsSliceFormatter;

namespace {

std::string upper_copy(const std::string& value) {
    std::string uppered = value;
    std::transform(uppered.begin(), uppered.end(), uppered.begin(),
                   [](unsigned char character) { return static_cast<char>(std::toupper(character)); });
    return uppered;
}

std::string build_symbol_path(const std::string& path_template, const std::string& symbol) {
    return Utils::replace_url_placeholder(path_template, "symbol", Utils::url_encode(symbol));
}

const nlohmann::json& require_json(const GatewayResponse& gateway_response, const std::string& path) {
    if (!gateway_response.is_json) {
        throw Core::DataError("Expected JSON from " + path + ", got content type '" + gateway_response.content_type + "'");
    }
    return gateway_response.json_body;
}

} // anonymous namespace

MarketDataClient::MarketDataClient(const Config::SystemConfig& config_ref, const HttpGateway& trading_gateway_ref,
                                   const HttpGateway& public_gateway_ref, RequestSignerPtr signer)
    : config(config_ref), trading_gateway(trading_gateway_ref), public_gateway(public_gateway_ref),
      request_signer(std::move(signer)) {
    if (!request_signer) {
        throw std::invalid_argument("MarketDataClient requires a request signer");
    }
}

GatewayResponse MarketDataClient::signed_get(const std::string& path) const {
    // Signature and timestamp are produced per call; upstream enforces a freshness window.
    RequestSignature request_signature = request_signer->sign("GET", path, "");
    return trading_gateway.execute("GET", path, request_signer->build_signed_headers(request_signature));
}

GatewayResponse MarketDataClient::public_get(const std::string& path) const {
    return public_gateway.execute("GET", path, std::vector<std::string>());
}

void MarketDataClient::require_credentials(const std::string& operation_name) const {
    if (!config.credentials.has_credentials()) {
        std::string secret_name = config.credentials.signing_scheme == Config::SigningScheme::HMAC_SHA256
                                      ? "RH_SHARED_SECRET" : "RH_PRIVATE_KEY";
        throw Core::ConfigurationError("Missing crypto API credentials for " + operation_name +
                                       " (RH_API_KEY, " + secret_name + ")");
    }
}

Core::Quote MarketDataClient::get_quote(const std::string& symbol) const {
    std::string path = build_symbol_path(config.endpoints.quote, upper_copy(symbol));
    GatewayResponse gateway_response = public_get(path);
    return ResponseNormalizer::normalize_public_quote(require_json(gateway_response, path));
}

std::string MarketDataClient::resolve_trading_pair(const std::string& base_symbol, const std::string& counter_symbol) const {
    std::string pair_symbol = upper_copy(base_symbol) + "-" + upper_copy(counter_symbol);
    std::string path = build_symbol_path(config.endpoints.trading_pairs, pair_symbol);
    GatewayResponse gateway_response = signed_get(path);

    if (!ResponseNormalizer::contains_trading_pair(require_json(gateway_response, path), pair_symbol)) {
        ApiRequestLogs::log_trading_pair_missing(pair_symbol);
        throw Core::ValidationError("Trading pair not found: " + pair_symbol);
    }
    return pair_symbol;
}

Core::Quote MarketDataClient::get_crypto_quote(const std::string& base_symbol, const std::string& counter_symbol) const {
    require_credentials("crypto quote");

    std::string pair_symbol = resolve_trading_pair(base_symbol, counter_symbol);
    std::string path = build_symbol_path(config.endpoints.best_bid_ask, pair_symbol);
    GatewayResponse gateway_response = signed_get(path);
    return ResponseNormalizer::normalize_crypto_quote(require_json(gateway_response, path));
}

Core::OrderBook MarketDataClient::get_crypto_order_book(const std::string& symbol) const {
    require_credentials("order book");

    std::string pair_symbol = upper_copy(symbol);
    std::string path = build_symbol_path(config.endpoints.order_book, pair_symbol);
    GatewayResponse gateway_response = signed_get(path);
    return ResponseNormalizer::normalize_order_book(require_json(gateway_response, path), pair_symbol);
}

Core::OptionChain MarketDataClient::fetch_option_chain(const std::string& ticker, Core::OptionType option_type,
                                                       const Core::ExpiryDate& expiry) const {
    std::string path = build_symbol_path(config.endpoints.options_chain, upper_copy(ticker));
    path = Utils::replace_url_placeholder(path, "date", std::to_string(expiry.to_epoch_seconds()));
    GatewayResponse gateway_response = public_get(path);
    return ResponseNormalizer::normalize_option_chain(require_json(gateway_response, path), upper_copy(ticker), option_type);
}

Core::OptionChain MarketDataClient::get_options_chain(const std::string& ticker, const std::string& option_type_text,
                                                      const std::string& expiry_text) const {
    Core::ExpiryDate expiry = OptionsSliceFormatter::parse_expiry(expiry_text);
    Core::OptionType option_type = OptionsSliceFormatter::parse_option_type(option_type_text);
    return fetch_option_chain(ticker, option_type, expiry);
}

std::string MarketDataClient::get_options_slice(const std::string& ticker, const std::string& option_type_text,
                                                const std::string& expiry_text) const {
    Core::ExpiryDate expiry = OptionsSliceFormatter::parse_expiry(expiry_text);
    Core::OptionType option_type = OptionsSliceFormatter::parse_option_type(option_type_text);
    Core::OptionChain chain = fetch_option_chain(ticker, option_type, expiry);
    return OptionsSliceFormatter::format_options_slice(ticker, option_type, expiry, chain);
}

std::vector<Core::Order> MarketDataClient::list_orders(int limit) const {
    if (limit < 1 || limit > config.orders.max_limit) {
        throw Core::ValidationError("Order limit must be between 1 and " + std::to_string(config.orders.max_limit) +
                                    ", got " + std::to_string(limit));
    }

    if (!is_live_mode()) {
        std::string fallback_reason = config.credentials.live ? "credentials missing" : "live disabled";
        std::vector<Core::Order> mock_orders;
        if (config.orders.mock_policy == Config::MockOrderPolicy::SYNTHETIC) {
            mock_orders = build_mock_orders(limit, TimeUtils::get_current_epoch_seconds());
        }
        ApiRequestLogs::log_mock_orders_fallback(fallback_reason, mock_orders.size());
        return mock_orders;
    }

    std::string path = Utils::replace_url_placeholder(config.endpoints.orders, "limit", std::to_string(limit));
    GatewayResponse gateway_response = signed_get(path);
    std::vector<Core::Order> orders = ResponseNormalizer::normalize_orders(require_json(gateway_response, path));
    if (orders.size() > static_cast<size_t>(limit)) {
        orders.resize(static_cast<size_t>(limit));
    }
    return orders;
}

bool MarketDataClient::is_live_mode() const {
    return config.credentials.live && config.credentials.has_credentials();
}

std::vector<Core::Order> MarketDataClient::build_mock_orders(int limit, long long reference_epoch_seconds) {
    std::vector<Core::Order> mock_orders;
    for (int order_index = 0; order_index < limit; ++order_index) {
        bool is_even_position = order_index % 2 == 0;

        std::ostringstream quantity_stream;
        quantity_stream << std::fixed << std::setprecision(6) << 0.001 * (order_index + 1);

        Core::Order mock_order;
        mock_order.id = "mock-" + std::to_string(order_index + 1);
        mock_order.timestamp = TimeUtils::format_epoch_seconds_iso_with_z(
            reference_epoch_seconds - static_cast<long long>(order_index) * TimeUtils::SECONDS_PER_HOUR);
        mock_order.side = is_even_position ? Core::OrderSide::BUY : Core::OrderSide::SELL;
        mock_order.symbol = is_even_position ? "BTC" : "ETH";
        mock_order.quantity = quantity_stream.str();
        mock_order.status = "filled";
        mock_orders.push_back(mock_order);
    }
    return mock_orders;
}

} // namespace API
} // namespace MarketDesk
