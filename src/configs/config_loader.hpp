#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include <string>
#include "configs/system_config.hpp"

namespace DirectoryHasher {
namespace Config {

// Environment variable naming an optional key,value CSV configuration file
constexpr const char* CONFIG_PATH_ENVIRONMENT_VARIABLE = "HASH_CONFIG_PATH";

// Load key,value CSV into SystemConfig. Unknown keys are ignored. Returns true on success.
// Throws std::invalid_argument when a known key carries a malformed value.
bool load_config_from_csv(SystemConfig& cfg, const std::string& csv_path);

// Load the file named by HASH_CONFIG_PATH, or keep defaults when it is unset. Returns 0 on success, 1 on failure.
int load_system_config(SystemConfig& config);

// Validate system configuration. Returns true if valid, false otherwise with error message.
bool validate_config(const SystemConfig& config, std::string& error_message);

} // namespace Config
} // namespace DirectoryHasher

#endif // CONFIG_LOADER_HPP
