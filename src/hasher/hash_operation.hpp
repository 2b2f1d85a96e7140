#ifndef HASH_OPERATION_HPP
#define HASH_OPERATION_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>

namespace DirectoryHasher {
namespace Core {

using OperationId = std::size_t;

enum class OperationState {
    RUNNING,
    STOP_REQUESTED,
    COMPLETED,
    CANCELLED,
    FAILED
};

std::string operation_state_to_string(OperationState state);
bool is_terminal_state(OperationState state);

/**
 * @brief One HashDirectory invocation
 *
 * Shared between the operation table and every unit of work dispatched for it,
 * so the cancellation flag outlives the last worker that reads it.
 * pending_work counts dispatched units (directory enumerations and file hashes)
 * that have not finished; the unit that brings it to zero finalizes the operation.
 */
class HashOperation {
public:
    HashOperation(OperationId operation_id, std::filesystem::path root_directory);

    HashOperation(const HashOperation&) = delete;
    HashOperation& operator=(const HashOperation&) = delete;

    OperationId id() const { return operation_id; }
    const std::filesystem::path& root_path() const { return root_directory; }

    // Whitespace-free tag leading every result line of this operation
    std::string tag() const;

    OperationState state() const { return current_state.load(); }
    bool is_running() const { return !is_terminal_state(current_state.load()); }
    bool is_stop_requested() const { return stop_flag.load(std::memory_order_acquire); }

    // Sets the cancellation flag. Returns true when this call moved Running to StopRequested.
    bool request_stop();

    void begin_unit();
    // Returns true when the finished unit was the last outstanding one
    bool finish_unit();
    // Reverts a begin_unit whose task never got queued, without finalizing
    void abandon_unit();
    std::size_t pending_work() const { return pending_units.load(); }

    void mark_root_failed() { root_failed.store(true); }

    // Moves to Completed, Cancelled or Failed and wakes waiters. Returns the final state.
    OperationState finalize();

    // Blocks until the operation reaches a terminal state
    void wait_until_finished();

    void record_file_hashed() { files_hashed.fetch_add(1); }
    void record_file_failed() { failed_files.fetch_add(1); }
    void record_entry_skipped() { skipped_entries.fetch_add(1); }

    std::size_t hashed_file_count() const { return files_hashed.load(); }
    std::size_t failed_file_count() const { return failed_files.load(); }
    std::size_t skipped_entry_count() const { return skipped_entries.load(); }
    std::chrono::steady_clock::time_point started_at() const { return start_time; }

private:
    const OperationId operation_id;
    const std::filesystem::path root_directory;
    const std::chrono::steady_clock::time_point start_time;

    std::atomic<OperationState> current_state{OperationState::RUNNING};
    std::atomic<bool> stop_flag{false};
    std::atomic<bool> root_failed{false};
    std::atomic<std::size_t> pending_units{0};

    std::atomic<std::size_t> files_hashed{0};
    std::atomic<std::size_t> failed_files{0};
    std::atomic<std::size_t> skipped_entries{0};

    std::mutex finish_mutex;
    std::condition_variable finish_cv;
};

} // namespace Core
} // namespace DirectoryHasher

#endif // HASH_OPERATION_HPP
