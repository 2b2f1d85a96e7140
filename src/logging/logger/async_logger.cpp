#include "async_logger.hpp"
#include "utils/time_utils.hpp"
#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace DirectoryHasher {
namespace Logging {

namespace {
    thread_local LoggingContext* bound_logging_context = nullptr;

    const char* const DEFAULT_THREAD_TAG = "CALLER";

    std::string pad_thread_tag(const std::string& tag_value) {
        std::string tag_string = tag_value.substr(0, LOG_TAG_WIDTH);
        tag_string.append(LOG_TAG_WIDTH - tag_string.size(), ' ');
        return tag_string;
    }
}

// ============================================================================
// CONTEXT BINDING
// ============================================================================

LoggingContext* get_logging_context() {
    if (!bound_logging_context) {
        throw std::runtime_error("Logging context not initialized for current thread");
    }
    return bound_logging_context;
}

bool has_logging_context() {
    return bound_logging_context != nullptr;
}

void set_logging_context(LoggingContext& context) {
    bound_logging_context = &context;
}

void clear_logging_context() {
    bound_logging_context = nullptr;
}

std::string LoggingContext::get_thread_tag() const {
    std::lock_guard<std::mutex> lock(thread_tag_mutex);
    auto thread_tag_iterator = thread_tags.find(std::this_thread::get_id());
    return thread_tag_iterator != thread_tags.end() ? thread_tag_iterator->second : DEFAULT_THREAD_TAG;
}

void LoggingContext::set_thread_tag(const std::string& tag_value) {
    std::lock_guard<std::mutex> lock(thread_tag_mutex);
    thread_tags[std::this_thread::get_id()] = pad_thread_tag(tag_value);
}

void LoggingContext::clear_thread_tag() {
    std::lock_guard<std::mutex> lock(thread_tag_mutex);
    thread_tags.erase(std::this_thread::get_id());
}

void set_log_thread_tag(const std::string& thread_tag_value) {
    get_logging_context()->set_thread_tag(thread_tag_value);
}

// ============================================================================
// PRODUCERS
// ============================================================================

void log_message(const std::string& message, const std::string& source) {
    LoggingContext* logging_context = bound_logging_context;
    if (!logging_context || !logging_context->async_logger) {
        return;
    }

    try {
        std::string timestamp_string;
        try {
            timestamp_string = TimeUtils::get_current_human_readable_time();
        } catch (const std::exception& time_exception_error) {
            log_message_to_stderr("ERROR: TimeUtils failed: " + std::string(time_exception_error.what()));
            timestamp_string = "ERROR-TIME";
        }

        std::ostringstream log_stream;
        log_stream << timestamp_string << " [" << logging_context->get_thread_tag() << "]   ";
        if (!source.empty()) {
            log_stream << source << ": ";
        }
        log_stream << message << '\n';

        logging_context->async_logger->enqueue(log_stream.str());
    } catch (const std::exception& critical_exception_error) {
        log_message_to_stderr("CRITICAL ERROR: Logging system failure: " + std::string(critical_exception_error.what()));
    }
}

void log_message_to_stderr(const std::string& error_message) {
    std::cerr << "[libhash] " << error_message << std::endl;
}

std::shared_ptr<AsyncLogger> initialize_async_logger(LoggingContext& context, const Config::LoggingConfig& logging_config) {
    if (!logging_config.has_sink()) {
        context.async_logger.reset();
        return nullptr;
    }
    context.async_logger = std::make_shared<AsyncLogger>(logging_config);
    return context.async_logger;
}

// ============================================================================
// ASYNC LOGGER
// ============================================================================

AsyncLogger::AsyncLogger(const Config::LoggingConfig& logging_config)
    : file_path(logging_config.log_file),
      console_output(logging_config.console_output),
      max_queued_messages(logging_config.max_queued_messages) {
    if (!file_path.empty()) {
        log_file.open(file_path, std::ios::app);
        if (!log_file.is_open()) {
            throw std::runtime_error("Failed to open log file: " + file_path);
        }
    }
}

bool AsyncLogger::enqueue(std::string formatted_line) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (pending_lines.size() >= max_queued_messages) {
            dropped_lines.fetch_add(1);
            return false;
        }
        pending_lines.push_back(std::move(formatted_line));
    }
    queue_cv.notify_one();
    return true;
}

void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        running.store(false);
    }
    queue_cv.notify_all();
}

bool AsyncLogger::wait_for_messages(int timeout_milliseconds) {
    std::unique_lock<std::mutex> lock(queue_mutex);
    queue_cv.wait_for(lock, std::chrono::milliseconds(timeout_milliseconds),
                      [&]{ return !pending_lines.empty() || !running.load(); });
    return running.load();
}

void AsyncLogger::collect_all_available_messages(std::vector<std::string>& message_buffer) {
    std::lock_guard<std::mutex> lock(queue_mutex);
    while (!pending_lines.empty()) {
        message_buffer.push_back(std::move(pending_lines.front()));
        pending_lines.pop_front();
    }
}

std::size_t AsyncLogger::take_dropped_count() {
    return dropped_lines.exchange(0);
}

void AsyncLogger::output_log_line_internal(const std::string& log_line) {
    if (console_output) {
        std::lock_guard<std::mutex> console_guard(console_mutex);
        std::cerr << log_line << std::flush;
    }
    if (log_file.is_open()) {
        log_file << log_line;
    }
}

void AsyncLogger::flush_message_buffer(std::vector<std::string>& message_buffer) {
    for (const auto& log_line : message_buffer) {
        output_log_line_internal(log_line);
    }
    if (log_file.is_open()) {
        log_file.flush();
    }
    message_buffer.clear();
}

} // namespace Logging
} // namespace DirectoryHasher
