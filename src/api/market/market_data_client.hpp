#ifndef MARKET_DATA_CLIENT_HPP
#define MARKET_DATA_CLIENT_HPP

#include "api/gateway/http_gateway.hpp"
#include "api/signing/request_signer.hpp"
#include "configs/system_config.hpp"
#include "core/data_structures.hpp"
#include <string>
#include <vector>

namespace MarketDesk {
namespace API {

/**
 * Quote, order book, options and order operations.
 *
 * Public market data goes through public_gateway unsigned; crypto calls go
 * through trading_gateway with headers from the request signer. Every call
 * is independent; nothing is cached between calls.
 */
class MarketDataClient {
private:
    const Config::SystemConfig& config;
    const HttpGateway& trading_gateway;
    const HttpGateway& public_gateway;
    RequestSignerPtr request_signer;

    GatewayResponse signed_get(const std::string& path) const;
    GatewayResponse public_get(const std::string& path) const;
    void require_credentials(const std::string& operation_name) const;
    Core::OptionChain fetch_option_chain(const std::string& ticker, Core::OptionType option_type,
                                         const Core::ExpiryDate& expiry) const;

public:
    MarketDataClient(const Config::SystemConfig& config_ref, const HttpGateway& trading_gateway_ref,
                     const HttpGateway& public_gateway_ref, RequestSignerPtr signer);

    Core::Quote get_quote(const std::string& symbol) const;

    // Validates BASE-COUNTER against the trading pair listing first.
    Core::Quote get_crypto_quote(const std::string& base_symbol, const std::string& counter_symbol = "USD") const;
    std::string resolve_trading_pair(const std::string& base_symbol, const std::string& counter_symbol) const;

    Core::OrderBook get_crypto_order_book(const std::string& symbol) const;

    // Expiry and option type are validated before any request is sent.
    Core::OptionChain get_options_chain(const std::string& ticker, const std::string& option_type_text,
                                        const std::string& expiry_text) const;
    std::string get_options_slice(const std::string& ticker, const std::string& option_type_text,
                                  const std::string& expiry_text) const;

    std::vector<Core::Order> list_orders(int limit) const;

    bool is_live_mode() const;

    // ids mock-1..mock-N, one hour apart going back from reference_epoch_seconds.
    static std::vector<Core::Order> build_mock_orders(int limit, long long reference_epoch_seconds);
};

} // namespace API
} // namespace MarketDesk

#endif // MARKET_DATA_CLIENT_HPP
