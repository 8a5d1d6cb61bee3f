#ifndef DATA_STRUCTURES_HPP
#define DATA_STRUCTURES_HPP

#include <string>
#include <vector>
#include <optional>

namespace MarketDesk {
namespace Core {

struct Quote {
    std::optional<double> price;
    std::optional<double> change;
    std::optional<double> change_percent;
    std::optional<double> bid_price;
    std::optional<double> ask_price;
    std::optional<double> high_price;
    std::optional<double> low_price;
    std::optional<double> previous_close;
    std::optional<double> open_price;
    std::string currency;
    std::optional<std::string> time;
};

struct OrderBookLevel {
    double price;
    double size;

    OrderBookLevel() : price(0.0), size(0.0) {}
    OrderBookLevel(double price_value, double size_value) : price(price_value), size(size_value) {}
};

// Bids descending, asks ascending, exactly as received upstream.
struct OrderBook {
    std::string symbol;
    std::vector<OrderBookLevel> bids;
    std::vector<OrderBookLevel> asks;
    std::optional<double> mid_price;
};

enum class OptionType {
    CALL,
    PUT
};

struct OptionContract {
    double strike;
    std::optional<double> bid;
    std::optional<double> ask;
    std::optional<double> last;
    std::optional<double> implied_volatility;   // fraction, 0.25 == 25%
    std::optional<long long> open_interest;
    std::optional<long long> volume;

    OptionContract() : strike(0.0) {}
};

struct OptionChain {
    std::string symbol;
    std::optional<double> underlying_price;
    std::vector<OptionContract> contracts;
};

struct ExpiryDate {
    int year;
    int month;
    int day;

    ExpiryDate() : year(0), month(0), day(0) {}
    ExpiryDate(int year_value, int month_value, int day_value) : year(year_value), month(month_value), day(day_value) {}

    std::string to_iso_string() const;
    long long to_epoch_seconds() const;
};

enum class OrderSide {
    BUY,
    SELL
};

// Fields absent upstream stay empty; they are rendered as placeholders, never invented.
struct Order {
    std::optional<std::string> id;
    std::optional<std::string> timestamp;
    std::optional<OrderSide> side;
    std::optional<std::string> symbol;
    std::optional<std::string> quantity;
    std::optional<std::string> status;
};

std::string order_side_to_string(OrderSide side);
std::string option_type_to_string(OptionType option_type);

} // namespace Core
} // namespace MarketDesk

#endif // DATA_STRUCTURES_HPP
