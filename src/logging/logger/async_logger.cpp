#include "async_logger.hpp"
#include "utils/time_utils.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <stdexcept>

namespace MarketDesk {
namespace Logging {

thread_local LoggingContext* thread_local_logging_context_pointer = nullptr;

namespace {
    void log_message_to_stderr(const std::string& error_message) {
        std::cerr << error_message << std::endl;
    }
}

LoggingContext* get_logging_context() {
    LoggingContext* thread_logging_context_ptr = thread_local_logging_context_pointer;
    if (!thread_logging_context_ptr) {
        throw std::runtime_error("Logging context not initialized for current thread");
    }
    return thread_logging_context_ptr;
}

bool has_logging_context() {
    return thread_local_logging_context_pointer != nullptr;
}

void set_logging_context(LoggingContext& context) {
    thread_local_logging_context_pointer = &context;
}

void clear_logging_context() {
    thread_local_logging_context_pointer = nullptr;
}

void set_log_thread_tag(const std::string& thread_tag_value) {
    LoggingContext* thread_logging_context_ptr = get_logging_context();
    thread_logging_context_ptr->set_thread_tag(thread_tag_value);
}

void log_message(const std::string& message, const std::string& log_file_path) {
    std::string timestamp_string = TimeUtils::get_current_human_readable_time();

    if (!has_logging_context()) {
        log_message_to_stderr(timestamp_string + " [LIB   ]   " + message);
        return;
    }

    LoggingContext* thread_logging_context_ptr = get_logging_context();
    std::string thread_tag_string = thread_logging_context_ptr->get_thread_tag();
    std::stringstream log_stream;
    log_stream << timestamp_string << " [" << thread_tag_string << "]   " << message << std::endl;
    std::string log_formatted_string = log_stream.str();

    if (thread_logging_context_ptr->async_logger) {
        thread_logging_context_ptr->async_logger->enqueue(log_formatted_string);
        return;
    }

    {
        std::lock_guard<std::mutex> console_guard(thread_logging_context_ptr->console_mutex);
        std::cerr << log_formatted_string << std::flush;
    }

    if (!log_file_path.empty()) {
        std::ofstream log_file_stream(log_file_path, std::ios::app);
        if (log_file_stream.is_open()) {
            log_file_stream << log_formatted_string;
        } else {
            log_message_to_stderr("ERROR: Failed to open log file: " + log_file_path);
        }
    }
}

std::string generate_timestamped_log_filename(const std::string& base_filename) {
    std::time_t now = std::time(nullptr);
    std::tm local_tm_buf;
    localtime_r(&now, &local_tm_buf);

    // Extract base name without extension
    std::string base_name = base_filename;
    std::string extension = "";

    size_t dot_pos = base_filename.find_last_of('.');
    size_t slash_pos = base_filename.find_last_of('/');
    if (dot_pos != std::string::npos && (slash_pos == std::string::npos || dot_pos > slash_pos)) {
        base_name = base_filename.substr(0, dot_pos);
        extension = base_filename.substr(dot_pos);
    }

    // base_name_DD-HH-MM.extension
    std::stringstream ss;
    ss << base_name << "_" << std::put_time(&local_tm_buf, TimeUtils::LOG_FILENAME) << extension;
    return ss.str();
}

std::shared_ptr<AsyncLogger> initialize_application_logger(const Config::LoggingConfig& logging_config) {
    if (logging_config.log_file.empty()) {
        throw std::runtime_error("Logging path is empty (provide logging.log_file)");
    }

    LoggingContext* thread_logging_context_ptr = get_logging_context();

    std::string timestamped_log_filename = generate_timestamped_log_filename(logging_config.log_file);
    auto logger_instance = std::make_shared<AsyncLogger>(timestamped_log_filename, logging_config.console_output);
    logger_instance->running.store(true);

    thread_logging_context_ptr->async_logger = logger_instance;
    set_log_thread_tag("MAIN  ");

    return logger_instance;
}

void shutdown_global_logger(AsyncLogger& logger) {
    logger.stop();
}

// AsyncLogger implementation
void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        running.store(false);
    }
    cv.notify_all();
}

void AsyncLogger::enqueue(const std::string& formatted_line) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        queue.push(formatted_line);
    }
    cv.notify_one();
}

void AsyncLogger::collect_all_available_messages(std::vector<std::string>& message_buffer) {
    std::unique_lock<std::mutex> lock(mtx);
    while (!queue.empty()) {
        message_buffer.push_back(std::move(queue.front()));
        queue.pop();
    }
}

void AsyncLogger::output_log_line_internal(const std::string& log_line, std::ofstream& log_file) {
    if (console_output) {
        std::cerr << log_line << std::flush;
    }
    
    if (log_file.is_open()) {
        log_file << log_line;
    }
}

void AsyncLogger::flush_message_buffer(std::vector<std::string>& message_buffer, std::ofstream& log_file) {
    for (const auto& log_line : message_buffer) {
        output_log_line_internal(log_line, log_file);
    }
    if (log_file.is_open()) {
        log_file.flush();
    }
    message_buffer.clear();
}

void AsyncLogger::wait_for_messages(int poll_interval_ms) {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait_for(lock, std::chrono::milliseconds(poll_interval_ms), [&]{ return !queue.empty() || !running.load(); });
}

} // namespace Logging
} // namespace MarketDesk
