#ifndef TEXT_FORMATTERS_HPP
#define TEXT_FORMATTERS_HPP

#include "core/data_structures.hpp"
#include <optional>
#include <string>
#include <vector>

namespace MarketDesk {
namespace Display {

// Rendered in place of any absent field.
extern const std::string PLACEHOLDER;

std::string format_decimal(double value, int precision);
std::string format_optional_decimal(const std::optional<double>& value, int precision, const std::string& missing_text);
std::string format_signed_decimal(double value, int precision);

std::string format_quote(const std::string& symbol, const Core::Quote& quote);
std::string format_orders(const std::vector<Core::Order>& orders);
std::string format_order_line(const Core::Order& order);

} // namespace Display
} // namespace MarketDesk

#endif // TEXT_FORMATTERS_HPP
