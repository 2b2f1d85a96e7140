/**
 * Logging thread.
 * Writes diagnostic messages to the configured log file and console.
 */
#include "logging_thread.hpp"
#include "logging/logs/thread_logs.hpp"
#include "threads/thread_logic/platform/thread_control.hpp"
#include <cstddef>
#include <string>
#include <vector>

using namespace DirectoryHasher::Threads;
using namespace DirectoryHasher::Logging;

void LoggingThread::operator()() {
    try {
        setup_logging_thread();
        execute_logging_processing_loop();
    } catch (const std::exception& exception_error) {
        DirectoryHasher::ThreadLogs::log_logging_loop_exception(exception_error.what());
    } catch (...) {
        DirectoryHasher::ThreadLogs::log_logging_loop_exception("Unknown error");
    }
    logging_context.clear_thread_tag();
    clear_logging_context();
}

void LoggingThread::setup_logging_thread() {
    set_logging_context(logging_context);
    set_log_thread_tag("LOGGER");
    DirectoryHasher::ThreadSystem::Platform::ThreadControl::set_thread_name("hash-logger");
}

void LoggingThread::execute_logging_processing_loop() {
    std::vector<std::string> message_buffer;
    bool keep_running = true;
    while (keep_running) {
        try {
            keep_running = logger_ptr->wait_for_messages(config.poll_interval_ms);
            drain_logger(message_buffer);
        } catch (const std::exception& exception_error) {
            DirectoryHasher::ThreadLogs::log_logging_loop_exception(exception_error.what());
            message_buffer.clear();
        }
    }

    // Final flush of anything enqueued during shutdown
    drain_logger(message_buffer);
}

void LoggingThread::drain_logger(std::vector<std::string>& message_buffer) {
    std::size_t dropped_lines = logger_ptr->take_dropped_count();
    if (dropped_lines > 0) {
        DirectoryHasher::ThreadLogs::log_diagnostics_dropped(dropped_lines);
    }
    logger_ptr->collect_all_available_messages(message_buffer);
    if (!message_buffer.empty()) {
        logger_ptr->flush_message_buffer(message_buffer);
    }
}
