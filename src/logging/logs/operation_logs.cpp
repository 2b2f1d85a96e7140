#include "operation_logs.hpp"
#include "logging/logger/async_logger.hpp"

using DirectoryHasher::Logging::log_message;

namespace DirectoryHasher {

namespace {
    std::string operation_prefix(std::size_t operation_id) {
        return "[op " + std::to_string(operation_id) + "] ";
    }
}

void OperationLogs::log_operation_started(std::size_t operation_id, const std::string& root_path) {
    log_message(operation_prefix(operation_id) + "Hashing " + root_path, "operation_logs");
}

void OperationLogs::log_identifier_reassigned(std::size_t requested_id, std::size_t assigned_id) {
    log_message("INFO: Identifier " + std::to_string(requested_id) + " belongs to a running operation, assigned " +
                std::to_string(assigned_id), "operation_logs");
}

void OperationLogs::log_stop_requested(std::size_t operation_id) {
    log_message(operation_prefix(operation_id) + "Stop requested", "operation_logs");
}

void OperationLogs::log_operation_finished(std::size_t operation_id, const std::string& final_state,
                                           std::size_t files_hashed, std::size_t failed_files,
                                           std::size_t skipped_entries, long long elapsed_milliseconds) {
    log_message(operation_prefix(operation_id) + final_state + ": hashed=" + std::to_string(files_hashed) +
                " failed=" + std::to_string(failed_files) + " skipped=" + std::to_string(skipped_entries) +
                " elapsed=" + std::to_string(elapsed_milliseconds) + "ms", "operation_logs");
}

void OperationLogs::log_operation_reaped(std::size_t operation_id) {
    log_message(operation_prefix(operation_id) + "Reaped", "operation_logs");
}

void OperationLogs::log_file_hash_failed(std::size_t operation_id, const std::string& path, const std::string& reason) {
    log_message("WARNING: " + operation_prefix(operation_id) + "Cannot hash " + path + ": " + reason, "operation_logs");
}

void OperationLogs::log_entry_skipped(std::size_t operation_id, const std::string& path, const std::string& reason) {
    log_message("INFO: " + operation_prefix(operation_id) + "Skipped " + path + " (" + reason + ")", "operation_logs");
}

void OperationLogs::log_directory_unreadable(std::size_t operation_id, const std::string& path, const std::string& reason) {
    log_message("WARNING: " + operation_prefix(operation_id) + "Cannot enumerate " + path + ": " + reason, "operation_logs");
}

void OperationLogs::log_root_unreadable(std::size_t operation_id, const std::string& path, const std::string& reason) {
    log_message("ERROR: " + operation_prefix(operation_id) + "Root " + path + " cannot be enumerated: " + reason, "operation_logs");
}

} // namespace DirectoryHasher
