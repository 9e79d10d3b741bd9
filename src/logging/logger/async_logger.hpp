#ifndef ASYNC_LOGGER_HPP
#define ASYNC_LOGGER_HPP

#include <string>
#include <mutex>
#include <condition_variable>
#include <deque>
#include <atomic>
#include <thread>
#include <memory>
#include <unordered_map>
#include <fstream>
#include "configs/system_config.hpp"
#include "csv_trade_logger.hpp"

namespace ConfluenceScalper {
namespace Logging {

constexpr int LOG_TAG_WIDTH = 6;
static_assert(LOG_TAG_WIDTH > 0, "LOG_TAG_WIDTH must be positive");

/**
 * Line queue between the replay and the logging thread.
 * Producers only enqueue formatted lines; the logging thread drains them to the
 * console and the run log file.
 */
class AsyncLogger {
public:
    explicit AsyncLogger(const std::string& log_file_path) : file_path(log_file_path) {}

    const std::string& get_file_path() const { return file_path; }
    bool is_running() const { return running.load(); }
    size_t pending_line_count() const;

    void start() { running.store(true); }
    void stop();
    void enqueue(const std::string& formatted_line);

    // Blocks up to poll_interval_milliseconds for a line (or stop), then writes everything queued.
    // Returns the number of lines written.
    size_t wait_and_drain(std::ofstream& log_file, int poll_interval_milliseconds);

    // Writes everything queued without waiting
    size_t drain(std::ofstream& log_file);

private:
    std::string file_path;
    mutable std::mutex queue_mutex;
    std::condition_variable queue_condition;
    std::deque<std::string> pending_lines;
    std::atomic<bool> running{false};

    size_t drain_locked(std::unique_lock<std::mutex>& queue_lock, std::ofstream& log_file);
    static void write_line(const std::string& log_line, std::ofstream& log_file);
};

struct LoggingContext {
    std::shared_ptr<AsyncLogger> async_logger;
    std::shared_ptr<CSVTradeLogger> csv_trade_logger;
    std::mutex console_mutex;
    std::string run_folder;
    mutable std::mutex thread_tag_mutex;
    std::unordered_map<std::thread::id, std::string> thread_tags;

    std::string get_thread_tag() const;
    void set_thread_tag(const std::string& tag_value);
};

// Tag shown in brackets on every line from the calling thread, padded or cut to LOG_TAG_WIDTH
void set_log_thread_tag(const std::string& thread_tag_value);

// "<local time> [TAG   ]   message". Without a context for the calling thread the line goes
// straight to stdout; with a running logger it is queued; otherwise it is printed and, when
// log_file_path is set, appended there.
void log_message(const std::string& message, const std::string& log_file_path);

void shutdown_global_logger(AsyncLogger& logger);

// Creates <log_directory>/run_<DD-HH-MM>/ and a started logger writing <run folder>/<log_file>
std::shared_ptr<AsyncLogger> initialize_application_foundation(const Config::SystemConfig& config);

// Trade journal inside the run folder
std::shared_ptr<CSVTradeLogger> initialize_csv_trade_logger(const std::string& journal_filename);

// get_logging_context throws when the thread has none, find_logging_context returns nullptr
LoggingContext* get_logging_context();
LoggingContext* find_logging_context();
void set_logging_context(LoggingContext& context);
void clear_logging_context();

} // namespace Logging
} // namespace ConfluenceScalper

#endif // ASYNC_LOGGER_HPP
