#include "data_structures.hpp"
#include "utils/time_utils.hpp"
#include <sstream>
#include <iomanip>

namespace MarketDesk {
namespace Core {

std::string ExpiryDate::to_iso_string() const {
    std::ostringstream date_stream;
    date_stream << std::setfill('0') << std::setw(4) << year << "-"
                << std::setw(2) << month << "-"
                << std::setw(2) << day;
    return date_stream.str();
}

long long ExpiryDate::to_epoch_seconds() const {
    return TimeUtils::utc_midnight_epoch_seconds(year, month, day);
}

std::string order_side_to_string(OrderSide side) {
    switch (side) {
        case OrderSide::BUY:
            return "buy";
        case OrderSide::SELL:
            return "sell";
    }
    return "";
}

std::string option_type_to_string(OptionType option_type) {
    switch (option_type) {
        case OptionType::CALL:
            return "call";
        case OptionType::PUT:
            return "put";
    }
    return "";
}

} // namespace Core
} // namespace MarketDesk
