#include "response_normalizer.hpp"
#include "core/errors.hpp"
#include "logging/logs/api_request_logs.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace MarketDesk {
namespace API {

using MarketDesk::Logging::ApiRequestLogs;

const std::vector<std::string> ResponseNormalizer::ORDER_ID_CANDIDATES = {"id", "order_id"};
const std::vector<std::string> ResponseNormalizer::ORDER_TIMESTAMP_CANDIDATES = {"created_at", "timestamp"};
const std::vector<std::string> ResponseNormalizer::ORDER_SIDE_CANDIDATES = {"side"};
const std::vector<std::string> ResponseNormalizer::ORDER_SYMBOL_CANDIDATES = {"symbol", "crypto_symbol"};
const std::vector<std::string> ResponseNormalizer::ORDER_QUANTITY_CANDIDATES = {"quantity", "notional"};
const std::vector<std::string> ResponseNormalizer::ORDER_STATUS_CANDIDATES = {"status"};
const std::vector<std::string> ResponseNormalizer::QUOTE_TIME_CANDIDATES = {"as_of", "updated_at"};

namespace {

std::optional<double> parse_numeric_text(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    try {
        size_t parsed_chars = 0;
        double parsed_value = std::stod(text, &parsed_chars);
        if (parsed_chars != text.size()) {
            return std::nullopt;
        }
        return parsed_value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

// NaN and infinities ("nan", "inf", overflowing literals) count as absent.
std::optional<double> number_from_value(const json& value) {
    std::optional<double> numeric_value;
    if (value.is_number()) {
        numeric_value = value.get<double>();
    } else if (value.is_string()) {
        numeric_value = parse_numeric_text(value.get<std::string>());
    }
    if (numeric_value && !std::isfinite(*numeric_value)) {
        return std::nullopt;
    }
    return numeric_value;
}

// Accepts {"results": [row, ...]}, {"results": row} or a bare row.
const json* unwrap_first_result(const json& payload) {
    if (!payload.is_object()) {
        return nullptr;
    }
    if (payload.contains("results")) {
        const json& results = payload["results"];
        if (results.is_array()) {
            return results.empty() ? nullptr : &results[0];
        }
        return results.is_object() ? &results : nullptr;
    }
    return &payload;
}

} // anonymous namespace

std::optional<std::string> ResponseNormalizer::first_present_text(const json& row,
                                                                  const std::vector<std::string>& candidates) {
    if (!row.is_object()) {
        return std::nullopt;
    }
    for (const std::string& candidate_key : candidates) {
        json::const_iterator field_iterator = row.find(candidate_key);
        if (field_iterator == row.end() || field_iterator->is_null()) {
            continue;
        }
        if (field_iterator->is_string()) {
            std::string text_value = field_iterator->get<std::string>();
            if (!text_value.empty()) {
                return text_value;
            }
        } else if (field_iterator->is_number()) {
            return field_iterator->dump();
        }
    }
    return std::nullopt;
}

std::optional<double> ResponseNormalizer::read_number(const json& row, const std::string& key) {
    if (!row.is_object()) {
        return std::nullopt;
    }
    json::const_iterator field_iterator = row.find(key);
    if (field_iterator == row.end()) {
        return std::nullopt;
    }
    return number_from_value(*field_iterator);
}

std::optional<long long> ResponseNormalizer::read_integer(const json& row, const std::string& key) {
    std::optional<double> numeric_value = read_number(row, key);
    if (!numeric_value) {
        return std::nullopt;
    }
    // max() rounds up to 2^63 as a double, so the upper bound is exclusive.
    const double lower_bound = static_cast<double>(std::numeric_limits<long long>::min());
    const double upper_bound = static_cast<double>(std::numeric_limits<long long>::max());
    if (*numeric_value < lower_bound || *numeric_value >= upper_bound) {
        return std::nullopt;
    }
    return static_cast<long long>(*numeric_value);
}

Core::Order ResponseNormalizer::normalize_order(const json& row) {
    Core::Order order;
    order.id = first_present_text(row, ORDER_ID_CANDIDATES);
    order.timestamp = first_present_text(row, ORDER_TIMESTAMP_CANDIDATES);
    order.symbol = first_present_text(row, ORDER_SYMBOL_CANDIDATES);
    order.quantity = first_present_text(row, ORDER_QUANTITY_CANDIDATES);
    order.status = first_present_text(row, ORDER_STATUS_CANDIDATES);

    std::optional<std::string> side_text = first_present_text(row, ORDER_SIDE_CANDIDATES);
    if (side_text) {
        std::string lowered_side = *side_text;
        std::transform(lowered_side.begin(), lowered_side.end(), lowered_side.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
        if (lowered_side == "buy") {
            order.side = Core::OrderSide::BUY;
        } else if (lowered_side == "sell") {
            order.side = Core::OrderSide::SELL;
        }
    }
    return order;
}

std::vector<Core::Order> ResponseNormalizer::normalize_orders(const json& payload) {
    const json* rows = nullptr;
    if (payload.is_object() && payload.contains("results") && payload["results"].is_array()) {
        rows = &payload["results"];
    } else if (payload.is_array()) {
        rows = &payload;
    }

    std::vector<Core::Order> orders;
    if (!rows) {
        return orders;
    }

    size_t dropped_rows = 0;
    for (const json& row : *rows) {
        if (!row.is_object()) {
            ++dropped_rows;
            continue;
        }
        orders.push_back(normalize_order(row));
    }
    if (dropped_rows > 0) {
        ApiRequestLogs::log_dropped_rows("orders", dropped_rows);
    }
    return orders;
}

Core::Quote ResponseNormalizer::normalize_public_quote(const json& payload) {
    const json* quote_row = nullptr;
    if (payload.is_object() && payload.contains("quoteResponse")) {
        const json& quote_response = payload["quoteResponse"];
        if (quote_response.is_object() && quote_response.contains("result") &&
            quote_response["result"].is_array() && !quote_response["result"].empty()) {
            quote_row = &quote_response["result"][0];
        }
    }
    if (!quote_row || !quote_row->is_object()) {
        throw Core::DataError("No quote data");
    }

    Core::Quote quote;
    quote.price = read_number(*quote_row, "regularMarketPrice");
    quote.change = read_number(*quote_row, "regularMarketChange");
    quote.change_percent = read_number(*quote_row, "regularMarketChangePercent");
    quote.previous_close = read_number(*quote_row, "regularMarketPreviousClose");
    quote.open_price = read_number(*quote_row, "regularMarketOpen");
    quote.high_price = read_number(*quote_row, "regularMarketDayHigh");
    quote.low_price = read_number(*quote_row, "regularMarketDayLow");
    if (quote_row->contains("currency") && (*quote_row)["currency"].is_string()) {
        quote.currency = (*quote_row)["currency"].get<std::string>();
    }
    std::optional<long long> market_time = read_integer(*quote_row, "regularMarketTime");
    if (market_time && *market_time > 0) {
        quote.time = TimeUtils::format_epoch_seconds_iso_with_z(*market_time);
    }
    return quote;
}

Core::Quote ResponseNormalizer::normalize_crypto_quote(const json& payload) {
    const json* quote_row = nullptr;
    if (payload.is_object() && payload.contains("results")) {
        quote_row = unwrap_first_result(payload);
    }
    if (!quote_row) {
        throw Core::DataError("No market data returned");
    }

    Core::Quote quote;
    quote.price = read_number(*quote_row, "mid_price");
    quote.bid_price = read_number(*quote_row, "bid_price");
    quote.ask_price = read_number(*quote_row, "ask_price");
    quote.high_price = read_number(*quote_row, "high_price");
    quote.low_price = read_number(*quote_row, "low_price");
    quote.change = read_number(*quote_row, "change");
    quote.change_percent = read_number(*quote_row, "change_percent");
    quote.time = first_present_text(*quote_row, QUOTE_TIME_CANDIDATES);
    return quote;
}

bool ResponseNormalizer::contains_trading_pair(const json& payload, const std::string& pair_symbol) {
    if (!payload.is_object() || !payload.contains("results") || !payload["results"].is_array()) {
        return false;
    }
    for (const json& pair_row : payload["results"]) {
        if (pair_row.is_object() && pair_row.contains("symbol") && pair_row["symbol"].is_string() &&
            pair_row["symbol"].get<std::string>() == pair_symbol) {
            return true;
        }
    }
    return false;
}

std::vector<Core::OrderBookLevel> ResponseNormalizer::normalize_book_levels(const json& levels) {
    std::vector<Core::OrderBookLevel> book_levels;
    if (!levels.is_array()) {
        return book_levels;
    }

    size_t dropped_levels = 0;
    for (const json& level : levels) {
        std::optional<double> level_price;
        std::optional<double> level_size;
        if (level.is_array() && level.size() >= 2) {
            level_price = number_from_value(level[0]);
            level_size = number_from_value(level[1]);
        } else if (level.is_object()) {
            level_price = read_number(level, "price");
            level_size = read_number(level, "size");
            if (!level_size) {
                level_size = read_number(level, "quantity");
            }
        }

        if (!level_price || !level_size) {
            ++dropped_levels;
            continue;
        }
        book_levels.emplace_back(*level_price, *level_size);
    }
    if (dropped_levels > 0) {
        ApiRequestLogs::log_dropped_rows("order book levels", dropped_levels);
    }
    return book_levels;
}

Core::OrderBook ResponseNormalizer::normalize_order_book(const json& payload, const std::string& symbol) {
    const json* book_row = unwrap_first_result(payload);
    if (!book_row) {
        throw Core::DataError("No order book returned for " + symbol);
    }

    Core::OrderBook order_book;
    std::optional<std::string> upstream_symbol = first_present_text(*book_row, {"symbol"});
    order_book.symbol = upstream_symbol ? *upstream_symbol : symbol;
    if (book_row->contains("bids")) {
        order_book.bids = normalize_book_levels((*book_row)["bids"]);
    }
    if (book_row->contains("asks")) {
        order_book.asks = normalize_book_levels((*book_row)["asks"]);
    }

    order_book.mid_price = read_number(*book_row, "mid_price");
    if (!order_book.mid_price && !order_book.bids.empty() && !order_book.asks.empty()) {
        order_book.mid_price = (order_book.bids.front().price + order_book.asks.front().price) / 2.0;
    }
    return order_book;
}

Core::OptionChain ResponseNormalizer::normalize_option_chain(const json& payload, const std::string& symbol,
                                                             Core::OptionType option_type) {
    const json* chain_row = nullptr;
    if (payload.is_object() && payload.contains("optionChain")) {
        const json& option_chain = payload["optionChain"];
        if (option_chain.is_object() && option_chain.contains("result") &&
            option_chain["result"].is_array() && !option_chain["result"].empty()) {
            chain_row = &option_chain["result"][0];
        }
    }
    if (!chain_row || !chain_row->is_object()) {
        throw Core::DataError("No options data");
    }

    Core::OptionChain chain;
    chain.symbol = symbol;
    if (chain_row->contains("quote")) {
        chain.underlying_price = read_number((*chain_row)["quote"], "regularMarketPrice");
    }

    const std::string contracts_key = option_type == Core::OptionType::PUT ? "puts" : "calls";
    const json* contract_rows = nullptr;
    if (chain_row->contains("options") && (*chain_row)["options"].is_array() && !(*chain_row)["options"].empty()) {
        const json& first_expiry = (*chain_row)["options"][0];
        if (first_expiry.is_object() && first_expiry.contains(contracts_key) && first_expiry[contracts_key].is_array()) {
            contract_rows = &first_expiry[contracts_key];
        }
    }
    if (!contract_rows || contract_rows->empty()) {
        throw Core::DataError("No contracts found");
    }

    size_t dropped_contracts = 0;
    for (const json& contract_row : *contract_rows) {
        std::optional<double> strike = read_number(contract_row, "strike");
        if (!strike) {
            ++dropped_contracts;
            continue;
        }
        Core::OptionContract contract;
        contract.strike = *strike;
        contract.bid = read_number(contract_row, "bid");
        contract.ask = read_number(contract_row, "ask");
        contract.last = read_number(contract_row, "lastPrice");
        contract.implied_volatility = read_number(contract_row, "impliedVolatility");
        contract.open_interest = read_integer(contract_row, "openInterest");
        contract.volume = read_integer(contract_row, "volume");
        chain.contracts.push_back(contract);
    }
    if (dropped_contracts > 0) {
        ApiRequestLogs::log_dropped_rows("option contracts without strike", dropped_contracts);
    }
    if (chain.contracts.empty()) {
        throw Core::DataError("No contracts found");
    }
    return chain;
}

} // namespace API
} // namespace MarketDesk
