#include "system_manager.hpp"
#include <stdexcept>
#include <string>
#include <system_error>
#include "configs/config_loader.hpp"
#include "logging/logs/system_logs.hpp"
#include "threads/system_threads/logging_thread.hpp"

namespace DirectoryHasher {
namespace System {

namespace {
    void stop_logging(SystemState& system_state) noexcept {
        if (system_state.logger) {
            system_state.logger->stop();
        }
        try {
            if (system_state.logging_thread.joinable()) {
                system_state.logging_thread.join();
            }
        } catch (const std::system_error& join_error) {
            Logging::log_message_to_stderr(std::string("ERROR: Failed to join logging thread: ") + join_error.what());
        }
    }
}

Config::SystemConfig load_configuration() {
    Config::SystemConfig config;
    if (Config::load_system_config(config) != 0) {
        SystemLogs::log_configuration_error("Config load failed");
        throw std::invalid_argument("Configuration loading failed");
    }

    std::string configuration_error_message;
    if (!Config::validate_config(config, configuration_error_message)) {
        SystemLogs::log_configuration_error(configuration_error_message);
        throw std::invalid_argument("Configuration validation failed: " + configuration_error_message);
    }
    return config;
}

std::unique_ptr<SystemState> initialize(const Config::SystemConfig& config) {
    auto system_state = std::make_unique<SystemState>(config);
    Logging::set_logging_context(*system_state->logging_context);

    try {
        system_state->logger = Logging::initialize_async_logger(*system_state->logging_context, config.logging);
        if (system_state->logger) {
            system_state->logging_thread = std::thread(Threads::LoggingThread(
                system_state->logger, *system_state->logging_context, config.logging));
        }

        system_state->digest_provider = Core::create_digest_provider(config.hashing);

        int worker_thread_count = Config::resolve_worker_thread_count(config.workers);
        system_state->worker_pool = std::make_unique<ThreadSystem::WorkerPool>(worker_thread_count, *system_state->logging_context);
        system_state->worker_pool->start();

        system_state->traversal = std::make_unique<Core::DirectoryTraversal>(
            *system_state->worker_pool, system_state->log_queue, *system_state->digest_provider);
        system_state->coordinator = std::make_unique<Core::OperationCoordinator>(
            system_state->operation_table, *system_state->traversal, system_state->log_queue, config.operations);

        SystemLogs::log_library_initialized(worker_thread_count, system_state->digest_provider->name());
    } catch (const std::exception& exception_error) {
        SystemLogs::log_startup_error(exception_error.what());
        if (system_state->worker_pool) {
            system_state->worker_pool->shutdown();
        }
        stop_logging(*system_state);
        Logging::clear_logging_context();
        throw;
    }
    return system_state;
}

void shutdown(SystemState& system_state) noexcept {
    Logging::set_logging_context(*system_state.logging_context);

    try {
        SystemLogs::log_library_terminating(system_state.operation_table.live_count(), system_state.log_queue.size());
        if (system_state.coordinator) {
            system_state.coordinator->stop_all_and_wait();
        }
    } catch (const std::exception& exception_error) {
        SystemLogs::log_shutdown_error(std::string("Stopping operations: ") + exception_error.what());
    }

    try {
        if (system_state.worker_pool) {
            system_state.worker_pool->shutdown();
        }
        system_state.log_queue.clear();
        system_state.operation_table.clear();
    } catch (const std::exception& exception_error) {
        SystemLogs::log_shutdown_error(std::string("Releasing engine state: ") + exception_error.what());
    }

    SystemLogs::log_library_terminated();
    stop_logging(system_state);
    Logging::clear_logging_context();
}

} // namespace System
} // namespace DirectoryHasher
