#ifndef API_REQUEST_LOGS_HPP
#define API_REQUEST_LOGS_HPP

#include <string>
#include <cstddef>

namespace MarketDesk {
namespace Logging {

/**
 * Request-level logging for the market data client.
 * Credentials never reach these helpers; keys are truncated by the caller.
 */
class ApiRequestLogs {
public:
    static void log_request_sent(const std::string& method, const std::string& url, bool is_signed);
    static void log_response_received(const std::string& method, const std::string& path, long status_code,
                                      const std::string& content_type, size_t body_size);
    static void log_upstream_failure(const std::string& method, const std::string& path, long status_code,
                                     const std::string& response_body);
    static void log_mock_orders_fallback(const std::string& reason, size_t order_count);
    static void log_trading_pair_missing(const std::string& symbol);
    static void log_dropped_rows(const std::string& context, size_t dropped_count);
};

} // namespace Logging
} // namespace MarketDesk

#endif // API_REQUEST_LOGS_HPP
