// LoggingConfig.hpp
#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <string>

namespace MarketDesk {
namespace Config {

struct LoggingConfig {
    std::string log_file;
    bool console_output;
    int logging_poll_interval_ms;

    LoggingConfig() : log_file("market_desk.log"), console_output(false), logging_poll_interval_ms(200) {}
};

} // namespace Config
} // namespace MarketDesk

#endif // LOGGING_CONFIG_HPP
