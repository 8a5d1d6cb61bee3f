#ifndef STARTUP_LOGS_HPP
#define STARTUP_LOGS_HPP

#include "configs/system_config.hpp"
#include <string>

namespace MarketDesk {
namespace Logging {

/**
 * Startup banner and configuration summary.
 */
class StartupLogs {
public:
    static void log_application_header();
    static void log_runtime_configuration(const Config::SystemConfig& config);

    // First eight characters followed by an ellipsis; never the full key.
    static std::string mask_api_key(const std::string& api_key);
};

} // namespace Logging
} // namespace MarketDesk

#endif // STARTUP_LOGS_HPP
