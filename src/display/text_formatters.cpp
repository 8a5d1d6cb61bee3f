#include "text_formatters.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace MarketDesk {
namespace Display {

const std::string PLACEHOLDER = "—";

namespace {

std::string upper_copy(const std::string& value) {
    std::string uppered = value;
    std::transform(uppered.begin(), uppered.end(), uppered.begin(),
                   [](unsigned char character) { return static_cast<char>(std::toupper(character)); });
    return uppered;
}

std::string text_or_placeholder(const std::optional<std::string>& value) {
    return value ? *value : PLACEHOLDER;
}

void append_pair_line(std::ostringstream& output_stream, const std::string& label,
                      const std::optional<double>& first_value, const std::optional<double>& second_value) {
    if (!first_value && !second_value) {
        return;
    }
    output_stream << "\n" << label << ": " << format_optional_decimal(first_value, 2, PLACEHOLDER)
                  << " / " << format_optional_decimal(second_value, 2, PLACEHOLDER);
}

} // anonymous namespace

std::string format_decimal(double value, int precision) {
    std::ostringstream value_stream;
    value_stream << std::fixed << std::setprecision(precision) << value;
    return value_stream.str();
}

std::string format_optional_decimal(const std::optional<double>& value, int precision, const std::string& missing_text) {
    return value ? format_decimal(*value, precision) : missing_text;
}

std::string format_signed_decimal(double value, int precision) {
    std::string formatted_value = format_decimal(value, precision);
    if (value >= 0.0) {
        return "+" + formatted_value;
    }
    return formatted_value;
}

std::string format_quote(const std::string& symbol, const Core::Quote& quote) {
    std::ostringstream quote_stream;
    quote_stream << upper_copy(symbol) << ": " << format_optional_decimal(quote.price, 2, PLACEHOLDER)
                 << " (" << (quote.change ? format_signed_decimal(*quote.change, 2) : PLACEHOLDER)
                 << ", " << (quote.change_percent ? format_signed_decimal(*quote.change_percent, 2) + "%" : PLACEHOLDER)
                 << ")";

    append_pair_line(quote_stream, "Bid/Ask", quote.bid_price, quote.ask_price);
    append_pair_line(quote_stream, "High/Low", quote.high_price, quote.low_price);
    append_pair_line(quote_stream, "Prev Close/Open", quote.previous_close, quote.open_price);
    if (!quote.currency.empty()) {
        quote_stream << "\nCurrency: " << quote.currency;
    }
    if (quote.time) {
        quote_stream << "\nAs of: " << *quote.time;
    }
    return quote_stream.str();
}

std::string format_order_line(const Core::Order& order) {
    std::string side_text = order.side ? upper_copy(Core::order_side_to_string(*order.side)) : PLACEHOLDER;
    return "• " + text_or_placeholder(order.timestamp) + " | " + side_text + " " +
           text_or_placeholder(order.quantity) + " " + text_or_placeholder(order.symbol) + " — " +
           text_or_placeholder(order.status);
}

std::string format_orders(const std::vector<Core::Order>& orders) {
    if (orders.empty()) {
        return "No Information: orders unavailable (LIVE disabled or not configured).";
    }

    std::ostringstream orders_stream;
    for (size_t order_index = 0; order_index < orders.size(); ++order_index) {
        if (order_index > 0) {
            orders_stream << "\n";
        }
        orders_stream << format_order_line(orders[order_index]);
    }
    return orders_stream.str();
}

} // namespace Display
} // namespace MarketDesk
