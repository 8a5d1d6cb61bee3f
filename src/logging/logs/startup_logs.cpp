#include "startup_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"

namespace MarketDesk {
namespace Logging {

void StartupLogs::log_application_header() {
    log_message("", "");
    log_message("================================================================================", "");
    log_message("                                   MARKET DESK", "");
    log_message("                       Market data and crypto order viewer", "");
    log_message("================================================================================", "");
    log_message("", "");
}

void StartupLogs::log_runtime_configuration(const Config::SystemConfig& config) {
    const Config::CredentialConfig& credentials = config.credentials;

    LOG_THREAD_SECTION_HEADER("RUNTIME CONFIGURATION");
    TABLE_HEADER_30("Setting", "Value");
    TABLE_ROW_30("Mode", credentials.live ? "LIVE" : "MOCK");
    TABLE_ROW_30("Signing scheme", Config::signing_scheme_to_string(credentials.signing_scheme));
    TABLE_ROW_30("API key", mask_api_key(credentials.api_key));
    TABLE_ROW_30("Credentials", credentials.has_credentials() ? "present" : "missing");
    TABLE_ROW_30("Trading API", credentials.base_url);
    TABLE_ROW_30("Market data API", credentials.market_data_url);
    TABLE_ROW_30("Mock orders", config.orders.mock_policy == Config::MockOrderPolicy::SYNTHETIC ? "synthetic" : "empty");
    TABLE_ROW_30("HTTP timeout", std::to_string(config.http.timeout_seconds) + "s");
    TABLE_FOOTER_30();
    LOG_THREAD_SECTION_FOOTER();
}

std::string StartupLogs::mask_api_key(const std::string& api_key) {
    if (api_key.empty()) {
        return "(not set)";
    }
    return api_key.substr(0, 8) + "...";
}

} // namespace Logging
} // namespace MarketDesk
