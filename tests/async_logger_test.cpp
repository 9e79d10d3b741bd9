// Tests for the queued logger and the logging thread

#include <gtest/gtest.h>

#include "logging/logger/async_logger.hpp"
#include "threads/system_threads/logging_thread.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace ConfluenceScalper;
using ConfluenceScalper::Logging::AsyncLogger;

namespace {

std::string fresh_log_path(const std::string& file_name) {
    std::filesystem::path log_path = std::filesystem::path(::testing::TempDir()) / file_name;
    std::filesystem::remove(log_path);
    return log_path.string();
}

std::vector<std::string> read_lines(const std::string& file_path) {
    std::ifstream file_stream(file_path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file_stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // anonymous namespace

TEST(AsyncLoggerTest, DrainWritesQueuedLinesInOrder) {
    std::string log_path = fresh_log_path("drain.log");
    AsyncLogger logger(log_path);
    logger.enqueue("first\n");
    logger.enqueue("second\n");
    EXPECT_EQ(logger.pending_line_count(), 2u);

    {
        std::ofstream log_file(log_path, std::ios::app);
        EXPECT_EQ(logger.drain(log_file), 2u);
    }
    EXPECT_EQ(logger.pending_line_count(), 0u);
    EXPECT_EQ(read_lines(log_path), (std::vector<std::string>{"first", "second"}));
}

TEST(AsyncLoggerTest, StoppedLoggerDoesNotBlock) {
    std::string log_path = fresh_log_path("stopped.log");
    AsyncLogger logger(log_path);
    logger.start();
    logger.stop();

    std::ofstream log_file(log_path, std::ios::app);
    // Returns immediately because the logger is no longer running
    EXPECT_EQ(logger.wait_and_drain(log_file, 60000), 0u);
}

TEST(AsyncLoggerTest, LogMessageQueuesWithThreadTag) {
    std::string log_path = fresh_log_path("tagged.log");
    Logging::LoggingContext logging_context;
    Logging::set_logging_context(logging_context);
    logging_context.async_logger = std::make_shared<AsyncLogger>(log_path);
    logging_context.async_logger->start();
    Logging::set_log_thread_tag("REPLAY-LONG");

    Logging::log_message("bar evaluated", "");
    EXPECT_EQ(logging_context.async_logger->pending_line_count(), 1u);

    logging_context.async_logger->stop();
    {
        std::ofstream log_file(log_path, std::ios::app);
        logging_context.async_logger->drain(log_file);
    }
    Logging::clear_logging_context();

    std::vector<std::string> lines = read_lines(log_path);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find(" [REPLAY]   bar evaluated"), std::string::npos) << lines[0];
}

TEST(LoggingThreadTest, WritesEverythingBeforeExiting) {
    std::string log_path = fresh_log_path("thread.log");
    auto logger = std::make_shared<AsyncLogger>(log_path);
    logger->start();

    Config::LoggingConfig logging_config;
    logging_config.logging_poll_interval_ms = 5;
    std::thread logging_thread(Threads::LoggingThread(logger, logging_config));

    for (int line_index = 0; line_index < 50; ++line_index) {
        logger->enqueue("line " + std::to_string(line_index) + "\n");
    }
    logger->stop();
    logging_thread.join();

    std::vector<std::string> lines = read_lines(log_path);
    ASSERT_EQ(lines.size(), 50u);
    EXPECT_EQ(lines.front(), "line 0");
    EXPECT_EQ(lines.back(), "line 49");
    EXPECT_EQ(logger->pending_line_count(), 0u);
}
