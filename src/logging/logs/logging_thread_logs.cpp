#include "logging_thread_logs.hpp"
#include <iostream>

namespace ConfluenceScalper {
namespace Logging {

void LoggingThreadLogs::log_thread_exception(const std::string& error_message) {
    std::cerr << "[LOG   ] drain thread: " << error_message << std::endl;
}

void LoggingThreadLogs::log_loop_iteration_exception(const std::string& error_message) {
    std::cerr << "[LOG   ] drain pass failed, retrying: " << error_message << std::endl;
}

} // namespace Logging
} // namespace ConfluenceScalper
