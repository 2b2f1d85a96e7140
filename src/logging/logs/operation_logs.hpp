#ifndef OPERATION_LOGS_HPP
#define OPERATION_LOGS_HPP

#include <cstddef>
#include <string>

namespace DirectoryHasher {

class OperationLogs {
public:
    static void log_operation_started(std::size_t operation_id, const std::string& root_path);
    static void log_identifier_reassigned(std::size_t requested_id, std::size_t assigned_id);
    static void log_stop_requested(std::size_t operation_id);
    static void log_operation_finished(std::size_t operation_id, const std::string& final_state,
                                       std::size_t files_hashed, std::size_t failed_files,
                                       std::size_t skipped_entries, long long elapsed_milliseconds);
    static void log_operation_reaped(std::size_t operation_id);

    // Per-entry notes, never fatal to the operation
    static void log_file_hash_failed(std::size_t operation_id, const std::string& path, const std::string& reason);
    static void log_entry_skipped(std::size_t operation_id, const std::string& path, const std::string& reason);
    static void log_directory_unreadable(std::size_t operation_id, const std::string& path, const std::string& reason);
    static void log_root_unreadable(std::size_t operation_id, const std::string& path, const std::string& reason);
};

} // namespace DirectoryHasher

#endif // OPERATION_LOGS_HPP
