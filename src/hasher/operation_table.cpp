#include "operation_table.hpp"
#include <mutex>
#include <stdexcept>

namespace DirectoryHasher {
namespace Core {

OperationId OperationTable::next_free_identifier_locked() {
    while (next_identifier == 0 || operations.count(next_identifier) != 0) {
        ++next_identifier;
    }
    return next_identifier++;
}

std::shared_ptr<HashOperation> OperationTable::create_operation(OperationId requested_id,
                                                                const std::filesystem::path& root_directory,
                                                                bool reject_live_collision) {
    std::unique_lock<std::shared_mutex> lock(table_mutex);

    OperationId assigned_id = requested_id;
    auto existing_iterator = operations.find(requested_id);
    if (existing_iterator != operations.end() && existing_iterator->second->is_running()) {
        if (reject_live_collision) {
            throw std::invalid_argument("Operation " + std::to_string(requested_id) + " is still running");
        }
        assigned_id = next_free_identifier_locked();
    }

    auto operation = std::make_shared<HashOperation>(assigned_id, root_directory);
    operations[assigned_id] = operation;
    return operation;
}

std::shared_ptr<HashOperation> OperationTable::find(OperationId operation_id) const {
    std::shared_lock<std::shared_mutex> lock(table_mutex);
    auto operation_iterator = operations.find(operation_id);
    if (operation_iterator == operations.end()) {
        return nullptr;
    }
    return operation_iterator->second;
}

RemoveResult OperationTable::remove(OperationId operation_id) {
    std::unique_lock<std::shared_mutex> lock(table_mutex);
    auto operation_iterator = operations.find(operation_id);
    if (operation_iterator == operations.end()) {
        return RemoveResult::NOT_FOUND;
    }
    if (operation_iterator->second->is_running()) {
        return RemoveResult::STILL_RUNNING;
    }
    operations.erase(operation_iterator);
    return RemoveResult::REMOVED;
}

void OperationTable::discard(const std::shared_ptr<HashOperation>& operation) {
    std::unique_lock<std::shared_mutex> lock(table_mutex);
    auto operation_iterator = operations.find(operation->id());
    if (operation_iterator != operations.end() && operation_iterator->second == operation) {
        operations.erase(operation_iterator);
    }
}

std::vector<std::shared_ptr<HashOperation>> OperationTable::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(table_mutex);
    std::vector<std::shared_ptr<HashOperation>> operation_list;
    operation_list.reserve(operations.size());
    for (const auto& operation_entry : operations) {
        operation_list.push_back(operation_entry.second);
    }
    return operation_list;
}

std::size_t OperationTable::size() const {
    std::shared_lock<std::shared_mutex> lock(table_mutex);
    return operations.size();
}

std::size_t OperationTable::live_count() const {
    std::shared_lock<std::shared_mutex> lock(table_mutex);
    std::size_t running_operations = 0;
    for (const auto& operation_entry : operations) {
        if (operation_entry.second->is_running()) {
            ++running_operations;
        }
    }
    return running_operations;
}

std::size_t OperationTable::clear() {
    std::unique_lock<std::shared_mutex> lock(table_mutex);
    std::size_t removed_operations = operations.size();
    operations.clear();
    return removed_operations;
}

} // namespace Core
} // namespace DirectoryHasher
