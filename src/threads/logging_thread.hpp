#ifndef LOGGING_THREAD_HPP
#define LOGGING_THREAD_HPP

#include <memory>
#include <thread>
#include "logging/logger/async_logger.hpp"
#include "configs/logging_config.hpp"

namespace MarketDesk {
namespace Threads {

/**
 * Drains the async logger queue into the log file until the logger stops.
 * Owned by the console front end; the client itself starts no threads.
 */
class LoggingThread {
public:
    LoggingThread(std::shared_ptr<MarketDesk::Logging::AsyncLogger> logger,
                  const MarketDesk::Config::LoggingConfig& logging_config)
        : logger_ptr(logger), config(logging_config) {}

    void operator()();

private:
    std::shared_ptr<MarketDesk::Logging::AsyncLogger> logger_ptr;
    const MarketDesk::Config::LoggingConfig& config;

    void execute_logging_processing_loop();
};

/**
 * Runs a LoggingThread for the lifetime of this object. The destructor stops
 * the logger and joins, so an exception unwinding past it never leaves a
 * joinable std::thread behind.
 */
class ScopedLoggingThread {
public:
    ScopedLoggingThread(std::shared_ptr<MarketDesk::Logging::AsyncLogger> logger,
                        const MarketDesk::Config::LoggingConfig& logging_config);
    ~ScopedLoggingThread();

    ScopedLoggingThread(const ScopedLoggingThread&) = delete;
    ScopedLoggingThread& operator=(const ScopedLoggingThread&) = delete;

    // Stops the logger and waits for the final flush. Safe to call twice.
    void stop_and_join();

private:
    std::shared_ptr<MarketDesk::Logging::AsyncLogger> logger_ptr;
    std::thread logging_thread_handle;
};

} // namespace Threads
} // namespace MarketDesk

#endif // LOGGING_THREAD_HPP
