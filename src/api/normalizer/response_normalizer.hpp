#ifndef RESPONSE_NORMALIZER_HPP
#define RESPONSE_NORMALIZER_HPP

#include "core/data_structures.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace MarketDesk {
namespace API {

/**
 * Maps the field-name variants upstream APIs use into canonical records.
 *
 * Order fields are resolved from ordered candidate lists; the first present
 * (non-null, non-empty) candidate wins:
 *   id        <- id, order_id
 *   timestamp <- created_at, timestamp
 *   side      <- side
 *   symbol    <- symbol, crypto_symbol
 *   quantity  <- quantity, notional
 *   status    <- status
 * A field with no candidate present stays empty.
 */
class ResponseNormalizer {
public:
    static const std::vector<std::string> ORDER_ID_CANDIDATES;
    static const std::vector<std::string> ORDER_TIMESTAMP_CANDIDATES;
    static const std::vector<std::string> ORDER_SIDE_CANDIDATES;
    static const std::vector<std::string> ORDER_SYMBOL_CANDIDATES;
    static const std::vector<std::string> ORDER_QUANTITY_CANDIDATES;
    static const std::vector<std::string> ORDER_STATUS_CANDIDATES;
    static const std::vector<std::string> QUOTE_TIME_CANDIDATES;

    static std::optional<std::string> first_present_text(const nlohmann::json& row,
                                                         const std::vector<std::string>& candidates);
    static std::optional<double> read_number(const nlohmann::json& row, const std::string& key);
    static std::optional<long long> read_integer(const nlohmann::json& row, const std::string& key);

    static Core::Order normalize_order(const nlohmann::json& row);
    // Rows come from "results" when present, else from a top-level array.
    static std::vector<Core::Order> normalize_orders(const nlohmann::json& payload);

    // quoteResponse.result[0]
    static Core::Quote normalize_public_quote(const nlohmann::json& payload);
    // results[0] of a best bid/ask payload
    static Core::Quote normalize_crypto_quote(const nlohmann::json& payload);
    static bool contains_trading_pair(const nlohmann::json& payload, const std::string& pair_symbol);

    static Core::OrderBook normalize_order_book(const nlohmann::json& payload, const std::string& symbol);
    static std::vector<Core::OrderBookLevel> normalize_book_levels(const nlohmann::json& levels);

    // optionChain.result[0]; contracts without a strike are dropped.
    static Core::OptionChain normalize_option_chain(const nlohmann::json& payload, const std::string& symbol,
                                                    Core::OptionType option_type);
};

} // namespace API
} // namespace MarketDesk

#endif // RESPONSE_NORMALIZER_HPP
