#ifndef OPTIONS_SLICE_FORMATTER_HPP
#define OPTIONS_SLICE_FORMATTER_HPP

#include "core/data_structures.hpp"
#include <optional>
#include <string>
#include <vector>

namespace MarketDesk {
namespace Display {

class OptionsSliceFormatter {
public:
    // Contracts kept on each side of the pivot strike.
    static constexpr size_t STRIKE_WINDOW_HALF_WIDTH = 5;

    // M/D/YY or MM/DD/YY. YY < 70 is 20YY, otherwise 19YY.
    static Core::ExpiryDate parse_expiry(const std::string& expiry_text);
    // call/calls/c or put/puts/p, any case.
    static Core::OptionType parse_option_type(const std::string& option_type_text);

    // First index with strike >= underlying in an ascending list; last index when none qualifies.
    static size_t find_pivot_index(const std::vector<Core::OptionContract>& sorted_contracts,
                                   const std::optional<double>& underlying_price);

    // Sorts by strike and keeps [pivot - 5, pivot + 5], clamped.
    static std::vector<Core::OptionContract> select_strike_window(const std::vector<Core::OptionContract>& contracts,
                                                                  const std::optional<double>& underlying_price);

    static std::string format_contract_row(const Core::OptionContract& contract);
    static std::string format_options_slice(const std::string& ticker, Core::OptionType option_type,
                                            const Core::ExpiryDate& expiry, const Core::OptionChain& chain);
};

} // namespace Display
} // namespace MarketDesk

#endif // OPTIONS_SLICE_FORMATTER_HPP
