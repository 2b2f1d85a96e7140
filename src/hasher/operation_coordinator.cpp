#include "operation_coordinator.hpp"
#include "logging/logs/operation_logs.hpp"
#include <stdexcept>

namespace DirectoryHasher {
namespace Core {

std::shared_ptr<HashOperation> OperationCoordinator::require_operation(OperationId operation_id) const {
    std::shared_ptr<HashOperation> operation = operation_table.find(operation_id);
    if (!operation) {
        throw std::invalid_argument("Unknown operation " + std::to_string(operation_id));
    }
    return operation;
}

OperationId OperationCoordinator::start_operation(const std::string& root_path, OperationId requested_id) {
    std::filesystem::path validated_root = DirectoryTraversal::validate_root(root_path);

    std::shared_ptr<HashOperation> operation =
        operation_table.create_operation(requested_id, validated_root, config.reject_live_id_collision);
    if (operation->id() != requested_id) {
        OperationLogs::log_identifier_reassigned(requested_id, operation->id());
    }

    try {
        directory_traversal.start(operation);
    } catch (...) {
        operation_table.discard(operation);
        throw;
    }
    return operation->id();
}

bool OperationCoordinator::is_operation_running(OperationId operation_id) const {
    return require_operation(operation_id)->is_running();
}

void OperationCoordinator::stop_operation(OperationId operation_id) {
    std::shared_ptr<HashOperation> operation = require_operation(operation_id);
    if (operation->request_stop()) {
        OperationLogs::log_stop_requested(operation_id);
    }
}

void OperationCoordinator::reap_operation(OperationId operation_id) {
    switch (operation_table.remove(operation_id)) {
        case RemoveResult::REMOVED:
            OperationLogs::log_operation_reaped(operation_id);
            return;
        case RemoveResult::NOT_FOUND:
            throw std::invalid_argument("Unknown operation " + std::to_string(operation_id));
        case RemoveResult::STILL_RUNNING:
            throw std::invalid_argument("Operation " + std::to_string(operation_id) + " is still running");
    }
}

std::size_t OperationCoordinator::stop_all_and_wait() {
    std::vector<std::shared_ptr<HashOperation>> operations = operation_table.snapshot();
    std::size_t stopped_operations = 0;
    for (const auto& operation : operations) {
        if (operation->request_stop()) {
            ++stopped_operations;
        }
    }
    for (const auto& operation : operations) {
        operation->wait_until_finished();
    }
    return stopped_operations;
}

} // namespace Core
} // namespace DirectoryHasher
