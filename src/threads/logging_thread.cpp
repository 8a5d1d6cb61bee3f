/**
 * Logging thread.
 * Handles asynchronous log file writes for the console front end.
 */
#include "logging_thread.hpp"
#include "logging/logs/logging_thread_logs.hpp"
#include <fstream>
#include <string>
#include <vector>

using namespace MarketDesk::Threads;
using namespace MarketDesk::Logging;

void LoggingThread::operator()() {
    try {
        execute_logging_processing_loop();
    } catch (const std::exception& exception) {
        LoggingThreadLogs::log_thread_exception(exception.what());
    }
}

void LoggingThread::execute_logging_processing_loop() {
    std::ofstream log_file(logger_ptr->get_file_path(), std::ios::app);
    if (!log_file.is_open()) {
        LoggingThreadLogs::log_log_file_open_failure(logger_ptr->get_file_path());
    }

    std::vector<std::string> message_buffer;

    while (logger_ptr->running.load()) {
        logger_ptr->wait_for_messages(config.logging_poll_interval_ms);
        logger_ptr->collect_all_available_messages(message_buffer);
        if (!message_buffer.empty()) {
            logger_ptr->flush_message_buffer(message_buffer, log_file);
        }
    }

    // Final flush of anything enqueued before stop()
    logger_ptr->collect_all_available_messages(message_buffer);
    if (!message_buffer.empty()) {
        logger_ptr->flush_message_buffer(message_buffer, log_file);
    }
}

ScopedLoggingThread::ScopedLoggingThread(std::shared_ptr<AsyncLogger> logger,
                                         const MarketDesk::Config::LoggingConfig& logging_config)
    : logger_ptr(logger), logging_thread_handle(LoggingThread(logger, logging_config)) {}

ScopedLoggingThread::~ScopedLoggingThread() {
    stop_and_join();
}

void ScopedLoggingThread::stop_and_join() {
    if (!logging_thread_handle.joinable()) {
        return;
    }
    shutdown_global_logger(*logger_ptr);
    logging_thread_handle.join();
}
