#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include "configs/logging_config.hpp"
#include "configs/worker_config.hpp"
#include "configs/hashing_config.hpp"
#include "configs/operations_config.hpp"

namespace DirectoryHasher {
namespace Config {

/**
 * @brief Complete library configuration
 *
 * Every member carries a usable default, so a configuration file is optional.
 */
struct SystemConfig {
    LoggingConfig logging;
    WorkerConfig workers;
    HashingConfig hashing;
    OperationsConfig operations;
};

} // namespace Config
} // namespace DirectoryHasher

#endif // SYSTEM_CONFIG_HPP
