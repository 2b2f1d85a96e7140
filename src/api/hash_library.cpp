#include "hash_library.hpp"
#include <cstring>
#include <memory>
#include <mutex>
#include <new>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include "logging/logs/system_logs.hpp"
#include "system/system_manager.hpp"

using DirectoryHasher::SystemLogs;
using DirectoryHasher::System::SystemState;

namespace {

// Lifecycle of the single library instance. Init and Terminate take the lock
// exclusively; every other entry point holds it shared for its whole call, so
// Terminate cannot complete underneath a call that found the library initialized.
struct LibraryHandle {
    std::shared_mutex lifecycle_mutex;
    std::unique_ptr<SystemState> system_state;
};

LibraryHandle& library_handle() {
    static LibraryHandle handle;
    return handle;
}

HashResult translate_exception(const char* entry_point) {
    try {
        throw;
    } catch (const std::invalid_argument& argument_error) {
        SystemLogs::log_entry_point_exception(entry_point, argument_error.what());
        return HASH_ERROR_ARGUMENT_INVALID;
    } catch (const std::bad_alloc&) {
        return HASH_ERROR_MEMORY;
    } catch (const std::exception& exception_error) {
        SystemLogs::log_entry_point_exception(entry_point, exception_error.what());
        return HASH_ERROR_EXCEPTION;
    } catch (...) {
        SystemLogs::log_entry_point_exception(entry_point, "unknown exception");
        return HASH_ERROR_EXCEPTION;
    }
}

template<typename EntryPointBody>
HashResult run_initialized(const char* entry_point, EntryPointBody&& body) {
    LibraryHandle& handle = library_handle();
    // Held through the handler so a failure is logged before Terminate can release the context
    std::shared_lock<std::shared_mutex> lifecycle_lock(handle.lifecycle_mutex, std::defer_lock);
    try {
        lifecycle_lock.lock();
        if (!handle.system_state) {
            return HASH_ERROR_NOT_INITIALIZED;
        }
        DirectoryHasher::Logging::set_logging_context(*handle.system_state->logging_context);
        return body(*handle.system_state);
    } catch (...) {
        return translate_exception(entry_point);
    }
}

} // namespace

extern "C" {

HashResult HashInit(void) {
    LibraryHandle& handle = library_handle();
    std::unique_lock<std::shared_mutex> lifecycle_lock(handle.lifecycle_mutex, std::defer_lock);
    try {
        lifecycle_lock.lock();
        if (handle.system_state) {
            return HASH_ERROR_ALREADY_INITIALIZED;
        }
        // A previous instance may have left this thread bound to its destroyed context
        DirectoryHasher::Logging::clear_logging_context();
        DirectoryHasher::Config::SystemConfig config = DirectoryHasher::System::load_configuration();
        handle.system_state = DirectoryHasher::System::initialize(config);
        return HASH_ERROR_OK;
    } catch (...) {
        return translate_exception("HashInit");
    }
}

HashResult HashTerminate(void) {
    LibraryHandle& handle = library_handle();
    std::unique_lock<std::shared_mutex> lifecycle_lock(handle.lifecycle_mutex, std::defer_lock);
    try {
        lifecycle_lock.lock();
        if (!handle.system_state) {
            return HASH_ERROR_NOT_INITIALIZED;
        }
        DirectoryHasher::System::shutdown(*handle.system_state);
        handle.system_state.reset();
        return HASH_ERROR_OK;
    } catch (...) {
        return translate_exception("HashTerminate");
    }
}

HashResult HashDirectory(const char* path, size_t* operation_id) {
    return run_initialized("HashDirectory", [&](SystemState& system_state) -> HashResult {
        if (path == nullptr || operation_id == nullptr) {
            return HASH_ERROR_ARGUMENT_NULL;
        }
        *operation_id = system_state.coordinator->start_operation(path, *operation_id);
        return HASH_ERROR_OK;
    });
}

HashResult HashReadNextLogLine(char** line) {
    return run_initialized("HashReadNextLogLine", [&](SystemState& system_state) -> HashResult {
        if (line == nullptr) {
            return HASH_ERROR_ARGUMENT_NULL;
        }
        // Allocation failure throws std::bad_alloc, which requeues the entry
        bool delivered = system_state.coordinator->consume_next_log_line([line](const std::string& log_line) {
            char* owned_line = new char[log_line.size() + 1];
            std::memcpy(owned_line, log_line.c_str(), log_line.size() + 1);
            *line = owned_line;
        });
        return delivered ? HASH_ERROR_OK : HASH_ERROR_LOG_EMPTY;
    });
}

HashResult HashStatus(size_t operation_id, bool* running) {
    return run_initialized("HashStatus", [&](SystemState& system_state) -> HashResult {
        if (running == nullptr) {
            return HASH_ERROR_ARGUMENT_NULL;
        }
        *running = system_state.coordinator->is_operation_running(operation_id);
        return HASH_ERROR_OK;
    });
}

HashResult HashStop(size_t operation_id) {
    return run_initialized("HashStop", [&](SystemState& system_state) -> HashResult {
        system_state.coordinator->stop_operation(operation_id);
        return HASH_ERROR_OK;
    });
}

HashResult HashReap(size_t operation_id) {
    return run_initialized("HashReap", [&](SystemState& system_state) -> HashResult {
        system_state.coordinator->reap_operation(operation_id);
        return HASH_ERROR_OK;
    });
}

void HashFree(void* pointer) {
    delete[] static_cast<char*>(pointer);
}

} // extern "C"
