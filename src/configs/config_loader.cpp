#include "config_loader.hpp"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace DirectoryHasher {
namespace Config {

namespace {
    inline std::string trim(const std::string& input_string) {
        const char* whitespace_chars = " \t\r\n";
        auto begin_position = input_string.find_first_not_of(whitespace_chars);
        auto end_position = input_string.find_last_not_of(whitespace_chars);
        if (begin_position == std::string::npos) return "";
        return input_string.substr(begin_position, end_position - begin_position + 1);
    }

    inline bool to_bool(const std::string& input_value) {
        std::string normalized_value = input_value;
        std::transform(normalized_value.begin(), normalized_value.end(), normalized_value.begin(), ::tolower);
        return normalized_value == "1" || normalized_value == "true" || normalized_value == "yes";
    }

    int to_int(const std::string& key, const std::string& value) {
        try {
            size_t parsed_characters = 0;
            int parsed_value = std::stoi(value, &parsed_characters);
            if (parsed_characters != value.size()) {
                throw std::invalid_argument("trailing characters");
            }
            return parsed_value;
        } catch (const std::exception&) {
            throw std::invalid_argument("Invalid integer for " + key + ": '" + value + "'");
        }
    }

    std::size_t to_size(const std::string& key, const std::string& value) {
        int parsed_value = to_int(key, value);
        if (parsed_value < 0) {
            throw std::invalid_argument("Negative size for " + key + ": '" + value + "'");
        }
        return static_cast<std::size_t>(parsed_value);
    }
}

int resolve_worker_thread_count(const WorkerConfig& worker_config) {
    if (worker_config.thread_count > 0) {
        return worker_config.thread_count;
    }
    int hardware_threads = static_cast<int>(std::thread::hardware_concurrency());
    return std::max(MIN_DEFAULT_WORKER_THREADS, std::min(MAX_DEFAULT_WORKER_THREADS, hardware_threads));
}

bool load_config_from_csv(SystemConfig& cfg, const std::string& csv_path) {
    std::ifstream config_file_stream(csv_path);
    if (!config_file_stream.is_open()) {
        return false;
    }

    std::string config_line_string;
    while (std::getline(config_file_stream, config_line_string)) {
        config_line_string = trim(config_line_string);
        if (config_line_string.empty() || config_line_string[0] == '#') continue;

        std::stringstream config_line_stream(config_line_string);
        std::string config_key_string, config_value_string;
        if (!std::getline(config_line_stream, config_key_string, ',')) continue;
        if (!std::getline(config_line_stream, config_value_string)) continue;
        config_key_string = trim(config_key_string);
        config_value_string = trim(config_value_string);

        // Logging
        if (config_key_string == "logging.log_file") cfg.logging.log_file = config_value_string;
        else if (config_key_string == "logging.console_output") cfg.logging.console_output = to_bool(config_value_string);
        else if (config_key_string == "logging.poll_interval_ms") cfg.logging.poll_interval_ms = to_int(config_key_string, config_value_string);
        else if (config_key_string == "logging.max_queued_messages") cfg.logging.max_queued_messages = to_size(config_key_string, config_value_string);

        // Worker pool
        else if (config_key_string == "workers.thread_count") cfg.workers.thread_count = to_int(config_key_string, config_value_string);

        // Hashing
        else if (config_key_string == "hashing.algorithm") cfg.hashing.algorithm = config_value_string;
        else if (config_key_string == "hashing.read_buffer_size") cfg.hashing.read_buffer_size = to_size(config_key_string, config_value_string);

        // Operations
        else if (config_key_string == "operations.reject_live_id_collision") cfg.operations.reject_live_id_collision = to_bool(config_value_string);
    }
    return true;
}

int load_system_config(SystemConfig& config) {
    const char* configured_path = std::getenv(CONFIG_PATH_ENVIRONMENT_VARIABLE);
    if (configured_path == nullptr || configured_path[0] == '\0') {
        return 0;
    }

    try {
        if (!load_config_from_csv(config, configured_path)) {
            std::fprintf(stderr, "Failed to load config CSV from %s\n", configured_path);
            return 1;
        }
    } catch (const std::invalid_argument& parse_error) {
        std::fprintf(stderr, "Failed to parse config CSV %s: %s\n", configured_path, parse_error.what());
        return 1;
    }
    return 0;
}

bool validate_config(const SystemConfig& config, std::string& error_message) {
    if (config.logging.poll_interval_ms <= 0) {
        error_message = "logging.poll_interval_ms must be > 0";
        return false;
    }
    if (config.logging.max_queued_messages == 0) {
        error_message = "logging.max_queued_messages must be > 0";
        return false;
    }
    if (config.workers.thread_count < 0 || config.workers.thread_count > MAX_WORKER_THREADS) {
        error_message = "workers.thread_count must be between 0 and " + std::to_string(MAX_WORKER_THREADS);
        return false;
    }
    if (config.hashing.algorithm != "md5") {
        error_message = "hashing.algorithm '" + config.hashing.algorithm + "' is not supported (expected md5)";
        return false;
    }
    if (config.hashing.read_buffer_size < MIN_READ_BUFFER_SIZE || config.hashing.read_buffer_size > MAX_READ_BUFFER_SIZE) {
        error_message = "hashing.read_buffer_size must be between " + std::to_string(MIN_READ_BUFFER_SIZE) +
                        " and " + std::to_string(MAX_READ_BUFFER_SIZE);
        return false;
    }
    return true;
}

} // namespace Config
} // namespace DirectoryHasher
