#ifndef ASYNC_LOGGER_HPP
#define ASYNC_LOGGER_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "configs/logging_config.hpp"

namespace DirectoryHasher {
namespace Logging {

constexpr int LOG_TAG_WIDTH = 6;
static_assert(LOG_TAG_WIDTH > 0, "LOG_TAG_WIDTH must be positive");

/**
 * Diagnostic message queue drained by the logging thread.
 * Producers never block on output; they only take the queue mutex. Once
 * max_queued_messages lines are waiting, new lines are dropped and counted
 * so a stalled sink cannot grow the host process without bound.
 */
class AsyncLogger {
public:
    // Opens the log file when one is configured. Throws std::runtime_error when it cannot be opened.
    explicit AsyncLogger(const Config::LoggingConfig& logging_config);

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    bool is_running() const { return running.load(); }

    // Returns false when the line was dropped because the queue is full
    bool enqueue(std::string formatted_line);
    void stop();

    // Message processing methods (called by logging thread)
    bool wait_for_messages(int timeout_milliseconds);
    void collect_all_available_messages(std::vector<std::string>& message_buffer);

    // Lines dropped since the previous call
    std::size_t take_dropped_count();

    // Write buffered messages to the configured sinks and clear the buffer
    void flush_message_buffer(std::vector<std::string>& message_buffer);

private:
    const std::string file_path;
    const bool console_output;
    const std::size_t max_queued_messages;
    std::ofstream log_file;

    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::deque<std::string> pending_lines;
    std::atomic<bool> running{true};
    std::atomic<std::size_t> dropped_lines{0};

    std::mutex console_mutex;

    void output_log_line_internal(const std::string& log_line);
};


struct LoggingContext {
    std::shared_ptr<AsyncLogger> async_logger;
    mutable std::mutex thread_tag_mutex;
    std::unordered_map<std::thread::id, std::string> thread_tags;

    std::string get_thread_tag() const;
    void set_thread_tag(const std::string& tag_value);
    void clear_thread_tag();
};

// Thread-local log tag (6 characters, padded/truncated) to appear after the timestamp
void set_log_thread_tag(const std::string& thread_tag_value);

// Main logging function. Silently dropped when the current thread has no context
// or the context has no logger attached.
void log_message(const std::string& message, const std::string& source);

// Creates the logger for a context; returns null when the configuration enables no sink
std::shared_ptr<AsyncLogger> initialize_async_logger(LoggingContext& context, const Config::LoggingConfig& logging_config);

// Context access (validates context exists before returning)
LoggingContext* get_logging_context();
bool has_logging_context();
void set_logging_context(LoggingContext& context);
void clear_logging_context();

void log_message_to_stderr(const std::string& error_message);

} // namespace Logging
} // namespace DirectoryHasher

#endif // ASYNC_LOGGER_HPP
