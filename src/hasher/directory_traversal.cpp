#include "directory_traversal.hpp"
#include "logging/logs/operation_logs.hpp"
#include "utils/time_utils.hpp"
#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace {
    // std::ifstream does not promise to set errno, so an unset value gets a generic reason
    std::string describe_open_failure(int open_errno) {
        if (open_errno == 0) {
            return "cannot open";
        }
        return "cannot open: " + std::generic_category().message(open_errno);
    }
}

namespace DirectoryHasher {
namespace Core {

// Finishes one unit of work on scope exit, whichever way the unit ends
class DirectoryTraversal::UnitGuard {
public:
    UnitGuard(DirectoryTraversal& owner, const std::shared_ptr<HashOperation>& unit_operation)
        : traversal(owner), operation(unit_operation) {}
    ~UnitGuard() { traversal.finish_unit(operation); }

    UnitGuard(const UnitGuard&) = delete;
    UnitGuard& operator=(const UnitGuard&) = delete;

private:
    DirectoryTraversal& traversal;
    std::shared_ptr<HashOperation> operation;
};

fs::path DirectoryTraversal::validate_root(const std::string& root_path) {
    if (root_path.empty()) {
        throw std::invalid_argument("Directory path is empty");
    }

    std::error_code filesystem_error;
    fs::path absolute_root = fs::absolute(fs::path(root_path), filesystem_error);
    if (filesystem_error) {
        throw std::invalid_argument("Cannot resolve " + root_path + ": " + filesystem_error.message());
    }
    if (!fs::is_directory(absolute_root, filesystem_error)) {
        throw std::invalid_argument(root_path + " is not a directory");
    }
    fs::directory_iterator probe_iterator(absolute_root, filesystem_error);
    if (filesystem_error) {
        throw std::invalid_argument("Cannot read " + root_path + ": " + filesystem_error.message());
    }
    return absolute_root.lexically_normal();
}

void DirectoryTraversal::start(const std::shared_ptr<HashOperation>& operation) {
    operation->begin_unit();
    bool queued = false;
    try {
        queued = worker_pool.submit([this, operation]() { walk_directory(operation, fs::path()); });
    } catch (...) {
        operation->abandon_unit();
        throw;
    }
    if (!queued) {
        operation->abandon_unit();
        throw std::runtime_error("Worker pool is not accepting work");
    }
    OperationLogs::log_operation_started(operation->id(), operation->root_path().string());
}

bool DirectoryTraversal::dispatch(const std::shared_ptr<HashOperation>& operation, ThreadSystem::WorkerPool::Task task) {
    operation->begin_unit();
    bool queued = false;
    try {
        queued = worker_pool.submit(std::move(task));
    } catch (const std::exception& submit_error) {
        OperationLogs::log_entry_skipped(operation->id(), operation->root_path().string(),
                                         std::string("dispatch failed: ") + submit_error.what());
    }
    if (!queued) {
        finish_unit(operation);
    }
    return queued;
}

void DirectoryTraversal::dispatch_directory(const std::shared_ptr<HashOperation>& operation, const fs::path& relative_directory) {
    dispatch(operation, [this, operation, relative_directory]() { walk_directory(operation, relative_directory); });
}

void DirectoryTraversal::dispatch_file(const std::shared_ptr<HashOperation>& operation, const fs::path& relative_file) {
    dispatch(operation, [this, operation, relative_file]() { hash_file(operation, relative_file); });
}

void DirectoryTraversal::walk_directory(const std::shared_ptr<HashOperation>& operation, const fs::path& relative_directory) {
    UnitGuard unit_guard(*this, operation);
    if (operation->is_stop_requested()) {
        return;
    }

    const bool is_root = relative_directory.empty();
    const fs::path absolute_directory = is_root ? operation->root_path() : operation->root_path() / relative_directory;

    std::error_code iteration_error;
    fs::directory_iterator directory_iterator(absolute_directory, fs::directory_options::skip_permission_denied, iteration_error);
    if (iteration_error) {
        if (is_root) {
            operation->mark_root_failed();
            OperationLogs::log_root_unreadable(operation->id(), absolute_directory.string(), iteration_error.message());
        } else {
            operation->record_entry_skipped();
            OperationLogs::log_directory_unreadable(operation->id(), relative_directory.generic_string(), iteration_error.message());
        }
        return;
    }

    const fs::directory_iterator end_iterator;
    while (directory_iterator != end_iterator) {
        if (operation->is_stop_requested()) {
            return;
        }

        const fs::directory_entry& directory_entry = *directory_iterator;
        const fs::path relative_entry = relative_directory / directory_entry.path().filename();

        std::error_code status_error;
        fs::file_status entry_status = directory_entry.symlink_status(status_error);
        if (status_error) {
            operation->record_entry_skipped();
            OperationLogs::log_entry_skipped(operation->id(), relative_entry.generic_string(), status_error.message());
        } else if (fs::is_symlink(entry_status)) {
            operation->record_entry_skipped();
            OperationLogs::log_entry_skipped(operation->id(), relative_entry.generic_string(), "symbolic link");
        } else if (fs::is_directory(entry_status)) {
            dispatch_directory(operation, relative_entry);
        } else if (fs::is_regular_file(entry_status)) {
            dispatch_file(operation, relative_entry);
        } else {
            operation->record_entry_skipped();
            OperationLogs::log_entry_skipped(operation->id(), relative_entry.generic_string(), "not a regular file");
        }

        directory_iterator.increment(iteration_error);
        if (iteration_error) {
            OperationLogs::log_directory_unreadable(operation->id(), relative_directory.generic_string(), iteration_error.message());
            return;
        }
    }
}

void DirectoryTraversal::hash_file(const std::shared_ptr<HashOperation>& operation, const fs::path& relative_file) {
    UnitGuard unit_guard(*this, operation);
    if (operation->is_stop_requested()) {
        return;
    }

    const std::string relative_path_string = relative_file.generic_string();
    errno = 0;
    std::ifstream file_stream(operation->root_path() / relative_file, std::ios::binary);
    if (!file_stream.is_open()) {
        const int open_errno = errno;
        operation->record_file_failed();
        OperationLogs::log_file_hash_failed(operation->id(), relative_path_string, describe_open_failure(open_errno));
        return;
    }

    ContentDigest digest;
    try {
        digest = digest_provider.compute(file_stream);
    } catch (const std::runtime_error& digest_error) {
        operation->record_file_failed();
        OperationLogs::log_file_hash_failed(operation->id(), relative_path_string, digest_error.what());
        return;
    }

    log_queue.push(LogEntry{operation->tag(), relative_path_string, to_hex(digest)});
    operation->record_file_hashed();
}

void DirectoryTraversal::finish_unit(const std::shared_ptr<HashOperation>& operation) noexcept {
    try {
        if (!operation->finish_unit()) {
            return;
        }
        OperationState final_state = operation->finalize();
        OperationLogs::log_operation_finished(operation->id(), operation_state_to_string(final_state),
                                              operation->hashed_file_count(), operation->failed_file_count(),
                                              operation->skipped_entry_count(),
                                              TimeUtils::milliseconds_since(operation->started_at()));
    } catch (const std::exception& finish_error) {
        Logging::log_message_to_stderr(std::string("ERROR: Failed to finish unit: ") + finish_error.what());
    }
}

} // namespace Core
} // namespace DirectoryHasher
