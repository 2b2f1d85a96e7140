#ifndef SYSTEM_STATE_HPP
#define SYSTEM_STATE_HPP

#include <memory>
#include <thread>
#include "configs/system_config.hpp"
#include "hasher/digest_provider.hpp"
#include "hasher/directory_traversal.hpp"
#include "hasher/log_queue.hpp"
#include "hasher/operation_coordinator.hpp"
#include "hasher/operation_table.hpp"
#include "logging/logger/async_logger.hpp"
#include "threads/thread_logic/worker_pool.hpp"

namespace DirectoryHasher {
namespace System {

/**
 * @brief Everything that exists between a successful init and terminate
 *
 * Members are declared in dependency order: the logging context outlives the
 * worker pool and the logging thread that write through it, and the pool is
 * destroyed before the table, queue and digest provider its tasks reference.
 */
struct SystemState {
    Config::SystemConfig config;

    // =========================================================================
    // DIAGNOSTIC LOGGING
    // =========================================================================
    std::shared_ptr<Logging::LoggingContext> logging_context;
    std::shared_ptr<Logging::AsyncLogger> logger;       // Null when no sink is configured
    std::thread logging_thread;

    // =========================================================================
    // SHARED ENGINE STATE
    // =========================================================================
    std::unique_ptr<Core::DigestProvider> digest_provider;
    Core::LogQueue log_queue;
    Core::OperationTable operation_table;

    // =========================================================================
    // WORKERS AND COORDINATION
    // =========================================================================
    std::unique_ptr<ThreadSystem::WorkerPool> worker_pool;
    std::unique_ptr<Core::DirectoryTraversal> traversal;
    std::unique_ptr<Core::OperationCoordinator> coordinator;

    explicit SystemState(const Config::SystemConfig& initial)
        : config(initial), logging_context(std::make_shared<Logging::LoggingContext>()) {}

    SystemState(const SystemState&) = delete;
    SystemState& operator=(const SystemState&) = delete;
};

} // namespace System
} // namespace DirectoryHasher

#endif // SYSTEM_STATE_HPP
