#include "thread_logs.hpp"
#include "logging/logger/async_logger.hpp"

using DirectoryHasher::Logging::log_message;

namespace DirectoryHasher {

void ThreadLogs::log_pool_started(int thread_count) {
    log_message("THREAD_STARTUP: " + std::to_string(thread_count) + " worker threads started", "thread_logs");
}

void ThreadLogs::log_pool_stopped(int thread_count) {
    log_message("THREAD_SHUTDOWN: " + std::to_string(thread_count) + " worker threads joined", "thread_logs");
}

void ThreadLogs::log_thread_startup_error(const std::string& thread_name, const std::string& error_message) {
    log_message("ERROR: " + thread_name + " failed to start: " + error_message, "thread_logs");
}

void ThreadLogs::log_worker_started(int worker_index, const std::string& thread_info) {
    log_message("Worker " + std::to_string(worker_index) + " running on " + thread_info, "thread_logs");
}

void ThreadLogs::log_thread_exception(const std::string& thread_name, const std::string& error_message) {
    log_message("ERROR: Exception in " + thread_name + ": " + error_message, "thread_logs");
}

void ThreadLogs::log_thread_unknown_exception(const std::string& thread_name) {
    log_message("ERROR: Unknown exception in " + thread_name, "thread_logs");
}

void ThreadLogs::log_logging_loop_exception(const std::string& error_message) {
    Logging::log_message_to_stderr("ERROR: Logging thread loop failed: " + error_message);
}

void ThreadLogs::log_diagnostics_dropped(std::size_t dropped_lines) {
    log_message("WARNING: Diagnostic queue full, dropped " + std::to_string(dropped_lines) + " lines", "thread_logs");
}

} // namespace DirectoryHasher
