#include "options_slice_formatter.hpp"
#include "display/text_formatters.hpp"
#include "core/errors.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace MarketDesk {
namespace Display {

Core::ExpiryDate OptionsSliceFormatter::parse_expiry(const std::string& expiry_text) {
    static const std::regex expiry_pattern("^(\\d{1,2})/(\\d{1,2})/(\\d{2})$");

    std::smatch expiry_match;
    if (!std::regex_match(expiry_text, expiry_match, expiry_pattern)) {
        throw Core::ValidationError("Expiry must be MM/DD/YY");
    }

    int month = std::stoi(expiry_match[1].str());
    int day = std::stoi(expiry_match[2].str());
    int two_digit_year = std::stoi(expiry_match[3].str());
    if (month < 1 || month > 12) {
        throw Core::ValidationError("Expiry month out of range: " + expiry_text);
    }
    int full_year = two_digit_year < 70 ? 2000 + two_digit_year : 1900 + two_digit_year;
    if (day < 1 || day > TimeUtils::days_in_month(full_year, month)) {
        throw Core::ValidationError("Expiry day out of range: " + expiry_text);
    }
    return Core::ExpiryDate(full_year, month, day);
}

Core::OptionType OptionsSliceFormatter::parse_option_type(const std::string& option_type_text) {
    std::string lowered_type = option_type_text;
    std::transform(lowered_type.begin(), lowered_type.end(), lowered_type.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });

    if (lowered_type == "call" || lowered_type == "calls" || lowered_type == "c") {
        return Core::OptionType::CALL;
    }
    if (lowered_type == "put" || lowered_type == "puts" || lowered_type == "p") {
        return Core::OptionType::PUT;
    }
    throw Core::ValidationError("Option type must be call or put, got: " + option_type_text);
}

size_t OptionsSliceFormatter::find_pivot_index(const std::vector<Core::OptionContract>& sorted_contracts,
                                               const std::optional<double>& underlying_price) {
    if (sorted_contracts.empty()) {
        return 0;
    }
    if (underlying_price) {
        for (size_t contract_index = 0; contract_index < sorted_contracts.size(); ++contract_index) {
            if (sorted_contracts[contract_index].strike >= *underlying_price) {
                return contract_index;
            }
        }
    }
    return sorted_contracts.size() - 1;
}

std::vector<Core::OptionContract> OptionsSliceFormatter::select_strike_window(
    const std::vector<Core::OptionContract>& contracts, const std::optional<double>& underlying_price) {
    std::vector<Core::OptionContract> sorted_contracts = contracts;
    std::stable_sort(sorted_contracts.begin(), sorted_contracts.end(),
                     [](const Core::OptionContract& left, const Core::OptionContract& right) {
                         return left.strike < right.strike;
                     });
    if (sorted_contracts.empty()) {
        return sorted_contracts;
    }

    size_t pivot_index = find_pivot_index(sorted_contracts, underlying_price);
    size_t window_start = pivot_index >= STRIKE_WINDOW_HALF_WIDTH ? pivot_index - STRIKE_WINDOW_HALF_WIDTH : 0;
    size_t window_end = std::min(sorted_contracts.size(), pivot_index + STRIKE_WINDOW_HALF_WIDTH + 1);

    return std::vector<Core::OptionContract>(sorted_contracts.begin() + window_start,
                                             sorted_contracts.begin() + window_end);
}

std::string OptionsSliceFormatter::format_contract_row(const Core::OptionContract& contract) {
    std::string implied_volatility_text;
    if (contract.implied_volatility) {
        implied_volatility_text = format_decimal(*contract.implied_volatility * 100.0, 1) + "%";
    }

    std::ostringstream row_stream;
    row_stream << format_decimal(contract.strike, 2) << " | "
               << format_optional_decimal(contract.bid, 2, "") << " | "
               << format_optional_decimal(contract.ask, 2, "") << " | "
               << format_optional_decimal(contract.last, 2, "") << " | "
               << implied_volatility_text << " | "
               << (contract.open_interest ? std::to_string(*contract.open_interest) : "") << " | "
               << (contract.volume ? std::to_string(*contract.volume) : "");
    return row_stream.str();
}

std::string OptionsSliceFormatter::format_options_slice(const std::string& ticker, Core::OptionType option_type,
                                                        const Core::ExpiryDate& expiry, const Core::OptionChain& chain) {
    std::string type_label = option_type == Core::OptionType::PUT ? "PUT" : "CALL";

    std::ostringstream table_stream;
    table_stream << ticker << " " << type_label << " " << expiry.to_iso_string()
                 << " | Underlying: " << format_optional_decimal(chain.underlying_price, 2, PLACEHOLDER)
                 << "\nStrike | Bid  Ask  Last  IV   OI   Volume";

    for (const Core::OptionContract& contract : select_strike_window(chain.contracts, chain.underlying_price)) {
        table_stream << "\n" << format_contract_row(contract);
    }
    return table_stream.str();
}

} // namespace Display
} // namespace MarketDesk
