#ifndef OPERATION_TABLE_HPP
#define OPERATION_TABLE_HPP

#include <cstddef>
#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>
#include "hash_operation.hpp"

namespace DirectoryHasher {
namespace Core {

enum class RemoveResult {
    REMOVED,
    NOT_FOUND,
    STILL_RUNNING
};

/**
 * @brief Process-wide registry of operations by identifier
 *
 * Lookups take a shared lock so status polling runs concurrently; registration
 * and removal take the exclusive lock. Finished operations stay registered until
 * reaped, replaced, or the table is cleared.
 */
class OperationTable {
public:
    /**
     * @brief Creates and registers an operation
     *
     * An unknown or finished identifier is used as requested (a finished entry is replaced).
     * A live identifier is rejected with std::invalid_argument when reject_live_collision is set,
     * otherwise the next free identifier is assigned. Read the result's id() for the final value.
     */
    std::shared_ptr<HashOperation> create_operation(OperationId requested_id,
                                                    const std::filesystem::path& root_directory,
                                                    bool reject_live_collision);

    // Null when the identifier is unknown
    std::shared_ptr<HashOperation> find(OperationId operation_id) const;

    // Removes a finished operation; live operations are never removed
    RemoveResult remove(OperationId operation_id);

    // Unconditionally drops an entry that never had work scheduled
    void discard(const std::shared_ptr<HashOperation>& operation);

    std::vector<std::shared_ptr<HashOperation>> snapshot() const;
    std::size_t size() const;
    std::size_t live_count() const;
    std::size_t clear();

private:
    OperationId next_free_identifier_locked();

    mutable std::shared_mutex table_mutex;
    std::unordered_map<OperationId, std::shared_ptr<HashOperation>> operations;
    OperationId next_identifier = 1;
};

} // namespace Core
} // namespace DirectoryHasher

#endif // OPERATION_TABLE_HPP
