#ifndef OPERATION_COORDINATOR_HPP
#define OPERATION_COORDINATOR_HPP

#include <cstddef>
#include <string>
#include <utility>
#include "configs/operations_config.hpp"
#include "directory_traversal.hpp"
#include "log_queue.hpp"
#include "operation_table.hpp"

namespace DirectoryHasher {
namespace Core {

/**
 * @brief Operation-level requests behind the public entry points
 *
 * Failures are reported as exceptions: std::invalid_argument for bad paths and
 * unknown or conflicting identifiers, std::bad_alloc for allocation failure,
 * std::runtime_error when work cannot be scheduled.
 */
class OperationCoordinator {
public:
    OperationCoordinator(OperationTable& table, DirectoryTraversal& traversal, LogQueue& queue,
                         const Config::OperationsConfig& operations_config)
        : operation_table(table), directory_traversal(traversal), log_queue(queue), config(operations_config) {}

    // Starts hashing root_path under requested_id (or a reassigned one). Returns the identifier used.
    OperationId start_operation(const std::string& root_path, OperationId requested_id);

    // True while the operation is running or stopping with work outstanding
    bool is_operation_running(OperationId operation_id) const;

    // Idempotent; returns immediately
    void stop_operation(OperationId operation_id);

    // Removes a finished operation from the table
    void reap_operation(OperationId operation_id);

    // Pops the next entry and passes its formatted line to consume. If consume throws
    // the entry is put back at the head of the queue before the exception propagates.
    template<typename LineConsumer>
    bool consume_next_log_line(LineConsumer&& consume) {
        LogEntry next_entry;
        if (!log_queue.try_pop(next_entry)) {
            return false;
        }
        try {
            consume(next_entry.format());
        } catch (...) {
            log_queue.push_front(std::move(next_entry));
            throw;
        }
        return true;
    }

    // Requests stop on every live operation and waits until each has finished
    std::size_t stop_all_and_wait();

private:
    OperationTable& operation_table;
    DirectoryTraversal& directory_traversal;
    LogQueue& log_queue;
    Config::OperationsConfig config;

    std::shared_ptr<HashOperation> require_operation(OperationId operation_id) const;
};

} // namespace Core
} // namespace DirectoryHasher

#endif // OPERATION_COORDINATOR_HPP
