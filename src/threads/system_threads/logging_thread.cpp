#include "logging_thread.hpp"
#include "logging/logs/logging_thread_logs.hpp"
#include <fstream>

namespace ConfluenceScalper {
namespace Threads {

using Logging::LoggingThreadLogs;

void LoggingThread::operator()() {
    std::ofstream log_file(logger_ptr->get_file_path(), std::ios::app);
    if (!log_file.is_open()) {
        LoggingThreadLogs::log_thread_exception("Failed to open log file " + logger_ptr->get_file_path() + ", console only");
    }

    try {
        run_drain_loop(log_file);
    } catch (const std::exception& exception) {
        LoggingThreadLogs::log_thread_exception(exception.what());
    }
}

void LoggingThread::run_drain_loop(std::ofstream& log_file) {
    while (logger_ptr->is_running()) {
        try {
            logger_ptr->wait_and_drain(log_file, poll_interval_milliseconds);
        } catch (const std::exception& exception) {
            LoggingThreadLogs::log_loop_iteration_exception(exception.what());
        }
    }

    // Lines enqueued between the last wait and stop()
    logger_ptr->drain(log_file);
}

} // namespace Threads
} // namespace ConfluenceScalper
