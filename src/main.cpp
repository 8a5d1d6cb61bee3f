// main.cpp
#include "main.hpp"
#include "api/gateway/http_gateway.hpp"
#include "api/signing/request_signer_factory.hpp"
#include "configs/config_loader.hpp"
#include "core/errors.hpp"
#include "display/depth_chart_renderer.hpp"
#include "display/text_formatters.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/startup_logs.hpp"
#include "threads/logging_thread.hpp"
#include "utils/http_utils.hpp"
#include <CLI/CLI.hpp>
#include <curl/curl.h>
#include <iostream>
#include <memory>

namespace MarketDesk {

std::string run_command(const CommandLineOptions& options, const Config::SystemConfig& config,
                        const API::MarketDataClient& client) {
    switch (options.command) {
        case CommandKind::QUOTE:
            return Display::format_quote(options.symbol, client.get_quote(options.symbol));
        case CommandKind::CRYPTO_QUOTE: {
            Core::Quote crypto_quote = client.get_crypto_quote(options.symbol, options.counter_symbol);
            return Display::format_quote(options.symbol + "-" + options.counter_symbol, crypto_quote);
        }
        case CommandKind::ORDER_BOOK: {
            Display::DepthChartRenderer depth_chart_renderer(config.display);
            return depth_chart_renderer.render_depth_chart(client.get_crypto_order_book(options.symbol));
        }
        case CommandKind::OPTIONS:
            return client.get_options_slice(options.symbol, options.option_type, options.expiry);
        case CommandKind::ORDERS: {
            int order_limit = options.order_limit > 0 ? options.order_limit : config.orders.default_limit;
            return Display::format_orders(client.list_orders(order_limit));
        }
    }
    return "";
}

std::string describe_failure(CommandKind command, const std::string& error_message) {
    switch (command) {
        case CommandKind::QUOTE:
            return "Error fetching quote: " + error_message;
        case CommandKind::CRYPTO_QUOTE:
            return "Error fetching crypto quote: " + error_message;
        case CommandKind::ORDER_BOOK:
            return "Error fetching order book: " + error_message;
        case CommandKind::OPTIONS:
            return "Error fetching options: " + error_message;
        case CommandKind::ORDERS:
            return "Error fetching orders. Check logs.";
    }
    return error_message;
}

} // namespace MarketDesk

using namespace MarketDesk;

namespace {

void register_subcommands(CLI::App& app, CommandLineOptions& options) {
    CLI::App* quote_command = app.add_subcommand("quote", "Public equity quote");
    quote_command->add_option("symbol", options.symbol, "Ticker, e.g. AAPL")->required();
    quote_command->callback([&options]() { options.command = CommandKind::QUOTE; });

    CLI::App* crypto_command = app.add_subcommand("crypto", "Crypto best bid/ask (signed)");
    crypto_command->add_option("base", options.symbol, "Base asset, e.g. BTC")->required();
    crypto_command->add_option("counter", options.counter_symbol, "Counter asset")->default_val("USD");
    crypto_command->callback([&options]() { options.command = CommandKind::CRYPTO_QUOTE; });

    CLI::App* book_command = app.add_subcommand("book", "Crypto order book depth chart (signed)");
    book_command->add_option("symbol", options.symbol, "Trading pair, e.g. BTC-USD")->required();
    book_command->callback([&options]() { options.command = CommandKind::ORDER_BOOK; });

    CLI::App* options_command = app.add_subcommand("options", "Option chain slice around the underlying price");
    options_command->add_option("ticker", options.symbol, "Underlying ticker")->required();
    options_command->add_option("type", options.option_type, "call or put")->required();
    options_command->add_option("expiry", options.expiry, "Expiry as MM/DD/YY")->required();
    options_command->callback([&options]() { options.command = CommandKind::OPTIONS; });

    CLI::App* orders_command = app.add_subcommand("orders", "Recent crypto orders (mock unless LIVE)");
    orders_command->add_option("-n,--limit", options.order_limit, "Number of orders");
    orders_command->callback([&options]() { options.command = CommandKind::ORDERS; });
}

int execute(const CommandLineOptions& options) {
    Config::SystemConfig config = Core::ConfigLoader::load_system_config(options.config_path);

    Logging::LoggingContext logging_context;
    Logging::set_logging_context(logging_context);
    std::shared_ptr<Logging::AsyncLogger> logger = Logging::initialize_application_logger(config.logging);
    Threads::ScopedLoggingThread logging_thread(logger, config.logging);

    int exit_code = 0;
    try {
        Logging::StartupLogs::log_application_header();
        Logging::StartupLogs::log_runtime_configuration(config);

        Utils::CurlHttpTransport transport;
        API::HttpGateway trading_gateway(config.credentials.base_url, config.http, transport);
        API::HttpGateway public_gateway(config.credentials.market_data_url, config.http, transport);
        API::MarketDataClient client(config, trading_gateway, public_gateway, API::create_request_signer(config));

        std::cout << run_command(options, config, client) << std::endl;
    } catch (const Core::MarketDeskError& market_desk_error) {
        Logging::log_message("ERROR: " + std::string(market_desk_error.what()), "");
        std::cerr << describe_failure(options.command, market_desk_error.what()) << std::endl;
        exit_code = 1;
    } catch (const std::exception& exception_error) {
        Logging::log_message("FATAL: " + std::string(exception_error.what()), "");
        std::cerr << "Fatal error: " << exception_error.what() << std::endl;
        exit_code = 1;
    }

    logging_thread.stop_and_join();
    Logging::clear_logging_context();
    return exit_code;
}

} // anonymous namespace

// =============================================================================
// MAIN APPLICATION ENTRY POINT
// =============================================================================

int main(int argc, char** argv) {
    CLI::App app{"market_desk - quotes, crypto order books, option chains and orders"};
    CommandLineOptions options;
    app.add_option("-c,--config", options.config_path, "Path to the key,value configuration CSV")
        ->default_val(options.config_path);
    register_subcommands(app, options);
    app.require_subcommand(1);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& parse_error) {
        return app.exit(parse_error);
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);
    int exit_code = 1;
    try {
        exit_code = execute(options);
    } catch (const std::exception& exception_error) {
        std::cerr << "Fatal error: " << exception_error.what() << std::endl;
    }
    curl_global_cleanup();
    return exit_code;
}
