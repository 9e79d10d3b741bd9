#include "async_logger.hpp"
#include "utils/time_utils.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <filesystem>
#include <stdexcept>

namespace ConfluenceScalper {
namespace Logging {

namespace {
    thread_local LoggingContext* current_logging_context = nullptr;

    std::string pad_thread_tag(const std::string& tag_value) {
        std::string tag_string = tag_value.substr(0, LOG_TAG_WIDTH);
        tag_string.append(LOG_TAG_WIDTH - tag_string.size(), ' ');
        return tag_string;
    }

    std::string format_log_line(const std::string& thread_tag, const std::string& message) {
        std::ostringstream log_stream;
        log_stream << TimeUtils::get_current_human_readable_time() << " [" << thread_tag << "]   " << message << "\n";
        return log_stream.str();
    }

    // <log_directory>/run_DD-HH-MM in local time
    std::string create_run_folder(const std::string& log_directory) {
        std::time_t now = std::time(nullptr);
        std::tm local_time;
        localtime_r(&now, &local_time);

        std::ostringstream run_folder_stream;
        run_folder_stream << "run_" << std::put_time(&local_time, TimeUtils::LOG_FILENAME);
        std::filesystem::path run_folder = std::filesystem::path(log_directory) / run_folder_stream.str();

        std::error_code create_error;
        std::filesystem::create_directories(run_folder, create_error);
        if (create_error) {
            throw std::runtime_error("Failed to create run folder " + run_folder.string() + ": " + create_error.message());
        }
        return run_folder.string();
    }

    std::string file_name_only(const std::string& configured_name) {
        return std::filesystem::path(configured_name).filename().string();
    }
}

// ========================================================================
// LOGGING CONTEXT
// ========================================================================

std::string LoggingContext::get_thread_tag() const {
    std::lock_guard<std::mutex> thread_tag_lock(thread_tag_mutex);
    auto thread_tag_iterator = thread_tags.find(std::this_thread::get_id());
    if (thread_tag_iterator != thread_tags.end()) {
        return thread_tag_iterator->second;
    }
    return pad_thread_tag("MAIN");
}

void LoggingContext::set_thread_tag(const std::string& tag_value) {
    std::lock_guard<std::mutex> thread_tag_lock(thread_tag_mutex);
    thread_tags[std::this_thread::get_id()] = pad_thread_tag(tag_value);
}

LoggingContext* get_logging_context() {
    if (!current_logging_context) {
        throw std::runtime_error("Logging context not initialized for current thread");
    }
    return current_logging_context;
}

LoggingContext* find_logging_context() {
    return current_logging_context;
}

void set_logging_context(LoggingContext& context) {
    current_logging_context = &context;
}

void clear_logging_context() {
    current_logging_context = nullptr;
}

void set_log_thread_tag(const std::string& thread_tag_value) {
    get_logging_context()->set_thread_tag(thread_tag_value);
}

void log_message(const std::string& message, const std::string& log_file_path) {
    LoggingContext* logging_context_ptr = find_logging_context();
    if (!logging_context_ptr) {
        std::cout << format_log_line(pad_thread_tag("MAIN"), message) << std::flush;
        return;
    }

    std::string log_line = format_log_line(logging_context_ptr->get_thread_tag(), message);
    if (logging_context_ptr->async_logger && logging_context_ptr->async_logger->is_running()) {
        logging_context_ptr->async_logger->enqueue(log_line);
        return;
    }

    {
        std::lock_guard<std::mutex> console_lock(logging_context_ptr->console_mutex);
        std::cout << log_line << std::flush;
    }
    if (!log_file_path.empty()) {
        std::ofstream log_file_stream(log_file_path, std::ios::app);
        if (!log_file_stream.is_open()) {
            std::cerr << "ERROR: Failed to open log file: " << log_file_path << std::endl;
            return;
        }
        log_file_stream << log_line;
    }
}

void shutdown_global_logger(AsyncLogger& logger) {
    logger.stop();
}

// ========================================================================
// ASYNC LOGGER
// ========================================================================

size_t AsyncLogger::pending_line_count() const {
    std::lock_guard<std::mutex> queue_lock(queue_mutex);
    return pending_lines.size();
}

void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> queue_lock(queue_mutex);
        running.store(false);
    }
    queue_condition.notify_all();
}

void AsyncLogger::enqueue(const std::string& formatted_line) {
    {
        std::lock_guard<std::mutex> queue_lock(queue_mutex);
        pending_lines.push_back(formatted_line);
    }
    queue_condition.notify_one();
}

size_t AsyncLogger::wait_and_drain(std::ofstream& log_file, int poll_interval_milliseconds) {
    std::unique_lock<std::mutex> queue_lock(queue_mutex);
    queue_condition.wait_for(queue_lock, std::chrono::milliseconds(poll_interval_milliseconds),
                             [this] { return !pending_lines.empty() || !running.load(); });
    return drain_locked(queue_lock, log_file);
}

size_t AsyncLogger::drain(std::ofstream& log_file) {
    std::unique_lock<std::mutex> queue_lock(queue_mutex);
    return drain_locked(queue_lock, log_file);
}

size_t AsyncLogger::drain_locked(std::unique_lock<std::mutex>& queue_lock, std::ofstream& log_file) {
    size_t written_lines = 0;
    while (!pending_lines.empty()) {
        std::string log_line = std::move(pending_lines.front());
        pending_lines.pop_front();

        // Producers keep enqueueing while the line is written
        queue_lock.unlock();
        write_line(log_line, log_file);
        ++written_lines;
        queue_lock.lock();
    }
    return written_lines;
}

void AsyncLogger::write_line(const std::string& log_line, std::ofstream& log_file) {
    std::cout << log_line << std::flush;
    if (log_file.is_open()) {
        log_file << log_line;
        log_file.flush();
    }
}

// ========================================================================
// RUN FOLDER SETUP
// ========================================================================

std::shared_ptr<AsyncLogger> initialize_application_foundation(const Config::SystemConfig& config) {
    LoggingContext* logging_context_ptr = get_logging_context();
    logging_context_ptr->run_folder = create_run_folder(config.logging.log_directory);

    std::string log_file_path = logging_context_ptr->run_folder + "/" + file_name_only(config.logging.log_file);
    auto logger_instance = std::make_shared<AsyncLogger>(log_file_path);
    logger_instance->start();

    logging_context_ptr->async_logger = logger_instance;
    set_log_thread_tag("MAIN");
    return logger_instance;
}

std::shared_ptr<CSVTradeLogger> initialize_csv_trade_logger(const std::string& journal_filename) {
    LoggingContext* logging_context_ptr = get_logging_context();
    if (logging_context_ptr->run_folder.empty()) {
        throw std::runtime_error("Run folder not initialized - call initialize_application_foundation first");
    }

    std::string journal_path = logging_context_ptr->run_folder + "/" + file_name_only(journal_filename);
    auto trade_logger_instance = std::make_shared<CSVTradeLogger>(journal_path);
    logging_context_ptr->csv_trade_logger = trade_logger_instance;
    return trade_logger_instance;
}

} // namespace Logging
} // namespace ConfluenceScalper
