// =============================================================================
// OptionsSliceFormatter Unit Tests
// Expiry parsing, option type parsing, strike windows and row rendering
// =============================================================================

#include <gtest/gtest.h>
#include "display/options_slice_formatter.hpp"
#include "core/errors.hpp"

using namespace MarketDesk;
using MarketDesk::Display::OptionsSliceFormatter;

namespace {

std::vector<Core::OptionContract> make_strike_ladder(double first_strike, double last_strike, double step) {
    std::vector<Core::OptionContract> contracts;
    for (double strike = last_strike; strike >= first_strike; strike -= step) {
        Core::OptionContract contract;
        contract.strike = strike;
        contracts.push_back(contract);
    }
    return contracts;
}

} // anonymous namespace

// -----------------------------------------------------------------------------
// ParseExpiry_TwoDigitYearPivotsAtSeventy
// -----------------------------------------------------------------------------
TEST(OptionsSliceFormatterTest, ParseExpiry_TwoDigitYearPivotsAtSeventy) {
    EXPECT_EQ(OptionsSliceFormatter::parse_expiry("01/15/25").to_iso_string(), "2025-01-15");
    EXPECT_EQ(OptionsSliceFormatter::parse_expiry("01/15/69").to_iso_string(), "2069-01-15");
    EXPECT_EQ(OptionsSliceFormatter::parse_expiry("01/15/70").to_iso_string(), "1970-01-15");
    EXPECT_EQ(OptionsSliceFormatter::parse_expiry("1/5/25").to_iso_string(), "2025-01-05");
}

// -----------------------------------------------------------------------------
// ParseExpiry_WrongShape_ThrowsValidationError
// -----------------------------------------------------------------------------
TEST(OptionsSliceFormatterTest, ParseExpiry_WrongShape_ThrowsValidationError) {
    EXPECT_THROW(OptionsSliceFormatter::parse_expiry("1/15/2025"), Core::ValidationError);
    EXPECT_THROW(OptionsSliceFormatter::parse_expiry("2025-01-15"), Core::ValidationError);
    EXPECT_THROW(OptionsSliceFormatter::parse_expiry(""), Core::ValidationError);
    EXPECT_THROW(OptionsSliceFormatter::parse_expiry("13/01/25"), Core::ValidationError);
    EXPECT_THROW(OptionsSliceFormatter::parse_expiry("01/32/25"), Core::ValidationError);
}

// -----------------------------------------------------------------------------
// ParseExpiry_EpochIsUtcMidnight
// -----------------------------------------------------------------------------
TEST(OptionsSliceFormatterTest, ParseExpiry_EpochIsUtcMidnight) {
    EXPECT_EQ(OptionsSliceFormatter::parse_expiry("01/17/25").to_epoch_seconds(), 1737072000LL);
}

// -----------------------------------------------------------------------------
// ParseExpiry_DayPastMonthLength_ThrowsValidationError
// -----------------------------------------------------------------------------
TEST(OptionsSliceFormatterTest, ParseExpiry_DayPastMonthLength_ThrowsValidationError) {
    EXPECT_THROW(OptionsSliceFormatter::parse_expiry("02/31/25"), Core::ValidationError);
    EXPECT_THROW(OptionsSliceFormatter::parse_expiry("02/29/25"), Core::ValidationError);
    EXPECT_THROW(OptionsSliceFormatter::parse_expiry("04/31/26"), Core::ValidationError);
    EXPECT_EQ(OptionsSliceFormatter::parse_expiry("02/29/28").to_iso_string(), "2028-02-29");
    EXPECT_EQ(OptionsSliceFormatter::parse_expiry("02/29/00").to_iso_string(), "2000-02-29");
    EXPECT_EQ(OptionsSliceFormatter::parse_expiry("12/31/25").to_iso_string(), "2025-12-31");
}

// -----------------------------------------------------------------------------
// ParseOptionType_NonAsciiInput_ThrowsValidationError
// -----------------------------------------------------------------------------
TEST(OptionsSliceFormatterTest, ParseOptionType_NonAsciiInput_ThrowsValidationError) {
    EXPECT_THROW(OptionsSliceFormatter::parse_option_type("c\xC3\xA0ll"), Core::ValidationError);
    EXPECT_THROW(OptionsSliceFormatter::parse_option_type("\xFF"), Core::ValidationError);
}

// -----------------------------------------------------------------------------
// ParseOptionType_AcceptsAliases
// -----------------------------------------------------------------------------
TEST(OptionsSliceFormatterTest, ParseOptionType_AcceptsAliases) {
    EXPECT_EQ(OptionsSliceFormatter::parse_option_type("CALL"), Core::OptionType::CALL);
    EXPECT_EQ(OptionsSliceFormatter::parse_option_type("calls"), Core::OptionType::CALL);
    EXPECT_EQ(OptionsSliceFormatter::parse_option_type("P"), Core::OptionType::PUT);
    EXPECT_THROW(OptionsSliceFormatter::parse_option_type("both"), Core::ValidationError);
}

// -----------------------------------------------------------------------------
// SelectStrikeWindow_CentersOnFirstStrikeAtOrAboveUnderlying
// -----------------------------------------------------------------------------
TEST(OptionsSliceFormatterTest, SelectStrikeWindow_CentersOnFirstStrikeAtOrAboveUnderlying) {
    std::vector<Core::OptionContract> contracts = make_strike_ladder(90, 150, 5);
    ASSERT_EQ(contracts.size(), 13u);

    std::vector<Core::OptionContract> window = OptionsSliceFormatter::select_strike_window(contracts, 112.0);

    ASSERT_EQ(window.size(), 11u);
    EXPECT_DOUBLE_EQ(window.front().strike, 90.0);
    EXPECT_DOUBLE_EQ(window.back().strike, 140.0);
    EXPECT_DOUBLE_EQ(window[5].strike, 115.0);
}

// -----------------------------------------------------------------------------
// SelectStrikeWindow_ClampsAtEitherEnd
// -----------------------------------------------------------------------------
TEST(OptionsSliceFormatterTest, SelectStrikeWindow_ClampsAtEitherEnd) {
    std::vector<Core::OptionContract> contracts = make_strike_ladder(90, 150, 5);

    std::vector<Core::OptionContract> low_window = OptionsSliceFormatter::select_strike_window(contracts, 50.0);
    ASSERT_EQ(low_window.size(), 6u);
    EXPECT_DOUBLE_EQ(low_window.front().strike, 90.0);

    std::vector<Core::OptionContract> high_window = OptionsSliceFormatter::select_strike_window(contracts, 500.0);
    ASSERT_EQ(high_window.size(), 6u);
    EXPECT_DOUBLE_EQ(high_window.back().strike, 150.0);

    std::vector<Core::OptionContract> no_underlying = OptionsSliceFormatter::select_strike_window(contracts, std::nullopt);
    EXPECT_DOUBLE_EQ(no_underlying.back().strike, 150.0);
}

// -----------------------------------------------------------------------------
// FormatContractRow_RendersPercentAndBlanks
// -----------------------------------------------------------------------------
TEST(OptionsSliceFormatterTest, FormatContractRow_RendersPercentAndBlanks) {
    Core::OptionContract contract;
    contract.strike = 115;
    contract.bid = 3.1;
    contract.ask = 3.35;
    contract.implied_volatility = 0.2534;
    contract.open_interest = 1200;

    EXPECT_EQ(OptionsSliceFormatter::format_contract_row(contract), "115.00 | 3.10 | 3.35 |  | 25.3% | 1200 | ");
}

// -----------------------------------------------------------------------------
// FormatOptionsSlice_HeaderAndColumns
// -----------------------------------------------------------------------------
TEST(OptionsSliceFormatterTest, FormatOptionsSlice_HeaderAndColumns) {
    Core::OptionChain chain;
    chain.symbol = "XYZ";
    chain.contracts = make_strike_ladder(100, 100, 5);

    std::string table = OptionsSliceFormatter::format_options_slice("XYZ", Core::OptionType::PUT,
                                                                    Core::ExpiryDate(2025, 1, 17), chain);
    EXPECT_EQ(table,
              "XYZ PUT 2025-01-17 | Underlying: —\n"
              "Strike | Bid  Ask  Last  IV   OI   Volume\n"
              "100.00 |  |  |  |  |  | ");
}
