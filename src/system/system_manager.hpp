#ifndef SYSTEM_MANAGER_HPP
#define SYSTEM_MANAGER_HPP

#include <memory>
#include "configs/system_config.hpp"
#include "system/system_state.hpp"

namespace DirectoryHasher {
namespace System {

// Loads HASH_CONFIG_PATH (when set) over the defaults and validates the result.
// Throws std::invalid_argument when the file cannot be read or fails validation.
Config::SystemConfig load_configuration();

// Builds the complete library state: logging, digest provider, worker pool, coordinator.
// The calling thread is bound to the new logging context. Nothing is left running on failure.
std::unique_ptr<SystemState> initialize(const Config::SystemConfig& config);

// Stops every operation, waits for workers to quiesce, discards unread lines and
// stops the logging thread. Never throws.
void shutdown(SystemState& system_state) noexcept;

} // namespace System
} // namespace DirectoryHasher

#endif // SYSTEM_MANAGER_HPP
