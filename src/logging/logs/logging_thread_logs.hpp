#ifndef LOGGING_THREAD_LOGS_HPP
#define LOGGING_THREAD_LOGS_HPP

#include <string>

namespace MarketDesk {
namespace Logging {

class LoggingThreadLogs {
public:
    static void log_thread_exception(const std::string& error_message);
    static void log_log_file_open_failure(const std::string& log_file_path);
};

} // namespace Logging
} // namespace MarketDesk

#endif // LOGGING_THREAD_LOGS_HPP
