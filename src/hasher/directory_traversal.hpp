#ifndef DIRECTORY_TRAVERSAL_HPP
#define DIRECTORY_TRAVERSAL_HPP

#include <filesystem>
#include <memory>
#include <string>
#include "hash_operation.hpp"
#include "digest_provider.hpp"
#include "log_queue.hpp"
#include "threads/thread_logic/worker_pool.hpp"

namespace DirectoryHasher {
namespace Core {

/**
 * @brief Walks directory trees on the worker pool and hashes every regular file
 *
 * Every directory enumeration and every file hash is one pool task. Each task checks
 * the owning operation's cancellation flag before doing any work, and a directory
 * stops enumerating as soon as the flag is seen. Symbolic links are never followed.
 * Per-file failures are logged and counted, never fatal to the operation.
 */
class DirectoryTraversal {
public:
    DirectoryTraversal(ThreadSystem::WorkerPool& pool, LogQueue& queue, const DigestProvider& provider)
        : worker_pool(pool), log_queue(queue), digest_provider(provider) {}

    // Resolves root to an absolute directory path that can be enumerated.
    // Throws std::invalid_argument otherwise.
    static std::filesystem::path validate_root(const std::string& root_path);

    // Schedules the root enumeration. Throws std::runtime_error when the pool
    // is shutting down; nothing is then scheduled for the operation.
    void start(const std::shared_ptr<HashOperation>& operation);

private:
    ThreadSystem::WorkerPool& worker_pool;
    LogQueue& log_queue;
    const DigestProvider& digest_provider;

    class UnitGuard;

    void dispatch_directory(const std::shared_ptr<HashOperation>& operation, const std::filesystem::path& relative_directory);
    void dispatch_file(const std::shared_ptr<HashOperation>& operation, const std::filesystem::path& relative_file);
    bool dispatch(const std::shared_ptr<HashOperation>& operation, ThreadSystem::WorkerPool::Task task);

    void walk_directory(const std::shared_ptr<HashOperation>& operation, const std::filesystem::path& relative_directory);
    void hash_file(const std::shared_ptr<HashOperation>& operation, const std::filesystem::path& relative_file);

    void finish_unit(const std::shared_ptr<HashOperation>& operation) noexcept;
};

} // namespace Core
} // namespace DirectoryHasher

#endif // DIRECTORY_TRAVERSAL_HPP
