#include "logging_thread_logs.hpp"
#include <iostream>

namespace MarketDesk {
namespace Logging {

// The writer thread cannot log through its own queue once it has stopped draining it.
void LoggingThreadLogs::log_thread_exception(const std::string& error_message) {
    std::cerr << "LoggingThread exception: " << error_message << std::endl;
}

void LoggingThreadLogs::log_log_file_open_failure(const std::string& log_file_path) {
    std::cerr << "LoggingThread failed to open log file: " << log_file_path << std::endl;
}

} // namespace Logging
} // namespace MarketDesk
