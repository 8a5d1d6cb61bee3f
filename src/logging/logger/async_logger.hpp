#ifndef ASYNC_LOGGER_HPP
#define ASYNC_LOGGER_HPP

#include <string>
#include <mutex>
#include <condition_variable>
#include <queue>
#include <atomic>
#include <thread>
#include <memory>
#include <unordered_map>
#include <vector>
#include <fstream>
#include "configs/logging_config.hpp"

namespace MarketDesk {
namespace Logging {


// Named constants
constexpr int LOG_TAG_WIDTH = 6;
static_assert(LOG_TAG_WIDTH > 0, "LOG_TAG_WIDTH must be positive");

class AsyncLogger {
private:
    std::string file_path;
    bool console_output;

    void output_log_line_internal(const std::string& log_line, std::ofstream& log_file);

public:
    std::mutex mtx;
    std::condition_variable cv;
    std::queue<std::string> queue;
    std::atomic<bool> running{false};

    AsyncLogger(const std::string& log_file_path, bool echo_to_console)
        : file_path(log_file_path), console_output(echo_to_console) {}
    
    const std::string& get_file_path() const { return file_path; }
    void enqueue(const std::string& formatted_line);
    void stop();
    
    // Message processing methods (called by logging thread)
    void collect_all_available_messages(std::vector<std::string>& message_buffer);
    
    // Write messages to log and clear buffer
    void flush_message_buffer(std::vector<std::string>& message_buffer, std::ofstream& log_file);
    
    // Blocks until a message arrives, the logger stops, or the poll interval elapses
    void wait_for_messages(int poll_interval_ms);
};


struct LoggingContext {
    std::shared_ptr<AsyncLogger> async_logger;
    std::mutex console_mutex;
    mutable std::mutex thread_tag_mutex;
    std::unordered_map<std::thread::id, std::string> thread_tags;
    
    std::string get_thread_tag() const {
        std::lock_guard<std::mutex> thread_tag_lock(thread_tag_mutex);
        std::unordered_map<std::thread::id, std::string>::const_iterator thread_tag_map_iterator = thread_tags.find(std::this_thread::get_id());
        if (thread_tag_map_iterator != thread_tags.end()) {
            return thread_tag_map_iterator->second;
        }
        return "MAIN  ";
    }
    
    void set_thread_tag(const std::string& tag_value) {
        std::lock_guard<std::mutex> lock(thread_tag_mutex);
        std::string tag_string = tag_value;
        if (tag_string.size() < LOG_TAG_WIDTH) {
            tag_string.append(LOG_TAG_WIDTH - tag_string.size(), ' ');
        }
        if (tag_string.size() > LOG_TAG_WIDTH) {
            tag_string = tag_string.substr(0, LOG_TAG_WIDTH);
        }
        thread_tags[std::this_thread::get_id()] = tag_string;
    }
};

// Thread-local log tag (6 characters, padded/truncated) to appear in timestamp
void set_log_thread_tag(const std::string& thread_tag_value);

// Main logging function. Without a context on this thread the line goes to stderr.
void log_message(const std::string& message, const std::string& log_file_path);

std::string generate_timestamped_log_filename(const std::string& base_filename);

// Creates the logger for this run and installs it in the calling thread's context
std::shared_ptr<AsyncLogger> initialize_application_logger(const Config::LoggingConfig& logging_config);
void shutdown_global_logger(AsyncLogger& logger);

// Context access
LoggingContext* get_logging_context();
bool has_logging_context();
void set_logging_context(LoggingContext& context);
void clear_logging_context();

} // namespace Logging
} // namespace MarketDesk

#endif // ASYNC_LOGGER_HPP
