#ifndef LOGGING_THREAD_HPP
#define LOGGING_THREAD_HPP

#include <memory>
#include <utility>
#include "logging/logger/async_logger.hpp"
#include "configs/logging_config.hpp"

namespace ConfluenceScalper {
namespace Threads {

/**
 * Logging thread.
 * Drains the async logger to console and the run log file until the logger is stopped,
 * then writes whatever is still queued.
 */
class LoggingThread {
public:
    LoggingThread(std::shared_ptr<Logging::AsyncLogger> logger, const Config::LoggingConfig& logging_config)
        : logger_ptr(std::move(logger)), poll_interval_milliseconds(logging_config.logging_poll_interval_ms) {}

    void operator()();

private:
    std::shared_ptr<Logging::AsyncLogger> logger_ptr;
    int poll_interval_milliseconds;

    void run_drain_loop(std::ofstream& log_file);
};

} // namespace Threads
} // namespace ConfluenceScalper

#endif // LOGGING_THREAD_HPP
