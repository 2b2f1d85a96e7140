#include "system_logs.hpp"
#include "logging/logger/async_logger.hpp"

using DirectoryHasher::Logging::log_message;

namespace DirectoryHasher {

void SystemLogs::log_library_initialized(int worker_thread_count, const std::string& algorithm) {
    log_message("SYSTEM_STARTUP: Library initialized with " + std::to_string(worker_thread_count) +
                " worker threads, digest " + algorithm, "system_logs");
}

void SystemLogs::log_library_terminating(std::size_t outstanding_operations, std::size_t unread_log_lines) {
    log_message("SYSTEM_SHUTDOWN: Stopping " + std::to_string(outstanding_operations) +
                " operations, discarding " + std::to_string(unread_log_lines) + " unread lines", "system_logs");
}

void SystemLogs::log_library_terminated() {
    log_message("SYSTEM_SHUTDOWN: Library terminated", "system_logs");
}

void SystemLogs::log_configuration_error(const std::string& error_message) {
    Logging::log_message_to_stderr("ERROR: Config error: " + error_message);
}

void SystemLogs::log_startup_error(const std::string& error_message) {
    Logging::log_message_to_stderr("ERROR: Library startup error: " + error_message);
}

void SystemLogs::log_shutdown_error(const std::string& error_message) {
    log_message(std::string("ERROR: Library shutdown error: ") + error_message, "system_logs");
}

void SystemLogs::log_entry_point_exception(const std::string& entry_point, const std::string& error_message) {
    log_message("ERROR: " + entry_point + " failed: " + error_message, "system_logs");
}

} // namespace DirectoryHasher
