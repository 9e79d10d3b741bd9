#ifndef LOGGING_THREAD_LOGS_HPP
#define LOGGING_THREAD_LOGS_HPP

#include <string>

namespace ConfluenceScalper {
namespace Logging {

// The logging thread cannot report through its own queue; these write to stderr
class LoggingThreadLogs {
public:
    static void log_thread_exception(const std::string& error_message);
    static void log_loop_iteration_exception(const std::string& error_message);
};

} // namespace Logging
} // namespace ConfluenceScalper

#endif // LOGGING_THREAD_LOGS_HPP
