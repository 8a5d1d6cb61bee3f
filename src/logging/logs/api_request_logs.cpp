#include "api_request_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include <sstream>

namespace MarketDesk {
namespace Logging {

namespace {
    // Upstream error pages can be large HTML documents
    constexpr size_t MAX_LOGGED_BODY_CHARS = 300;
}

void ApiRequestLogs::log_request_sent(const std::string& method, const std::string& url, bool is_signed) {
    log_message("|   " + method + " " + url + (is_signed ? " (signed)" : " (public)"), "");
}

void ApiRequestLogs::log_response_received(const std::string& method, const std::string& path, long status_code,
                                           const std::string& content_type, size_t body_size) {
    std::ostringstream oss;
    oss << "|   " << method << " " << path << " -> HTTP " << status_code
        << " [" << (content_type.empty() ? "no content-type" : content_type) << "] "
        << body_size << " bytes";
    log_message(oss.str(), "");
}

void ApiRequestLogs::log_upstream_failure(const std::string& method, const std::string& path, long status_code,
                                          const std::string& response_body) {
    std::string logged_body = response_body.substr(0, MAX_LOGGED_BODY_CHARS);
    if (response_body.size() > MAX_LOGGED_BODY_CHARS) {
        logged_body += "...";
    }
    log_message("|   ✗ " + method + " " + path + " failed (HTTP " + std::to_string(status_code) + "): " + logged_body, "");
}

void ApiRequestLogs::log_mock_orders_fallback(const std::string& reason, size_t order_count) {
    log_message("|   Orders served from mock policy (" + reason + "): " + std::to_string(order_count) + " rows", "");
}

void ApiRequestLogs::log_trading_pair_missing(const std::string& symbol) {
    log_message("|   ✗ Trading pair not listed upstream: " + symbol, "");
}

void ApiRequestLogs::log_dropped_rows(const std::string& context, size_t dropped_count) {
    log_message("|   Dropped " + std::to_string(dropped_count) + " unusable rows from " + context, "");
}

} // namespace Logging
} // namespace MarketDesk
