#ifndef MAIN_HPP
#define MAIN_HPP

// =============================================================================
// MAIN.HPP - Command line front end
// =============================================================================

#include "configs/system_config.hpp"
#include "api/market/market_data_client.hpp"
#include <string>

namespace MarketDesk {

enum class CommandKind {
    QUOTE,
    CRYPTO_QUOTE,
    ORDER_BOOK,
    OPTIONS,
    ORDERS
};

// Parsed arguments for exactly one subcommand.
struct CommandLineOptions {
    std::string config_path = "config/market_desk.csv";
    CommandKind command = CommandKind::QUOTE;

    std::string symbol;
    std::string counter_symbol = "USD";
    std::string option_type;
    std::string expiry;
    int order_limit = 0;           // 0 selects orders.default_limit
};

// Runs the selected command and returns the text shown to the user.
std::string run_command(const CommandLineOptions& options, const Config::SystemConfig& config,
                        const API::MarketDataClient& client);

// User-facing text for an expected failure.
std::string describe_failure(CommandKind command, const std::string& error_message);

} // namespace MarketDesk

#endif // MAIN_HPP
