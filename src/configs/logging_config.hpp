#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <cstddef>
#include <string>

namespace DirectoryHasher {
namespace Config {

struct LoggingConfig {
    std::string log_file;            // Diagnostic log file, empty disables file output
    bool console_output = false;     // Mirror diagnostics to stderr
    int poll_interval_ms = 200;      // Logging thread drain interval
    std::size_t max_queued_messages = 10000;  // Lines beyond this are dropped until the thread drains

    bool has_sink() const { return console_output || !log_file.empty(); }
};

} // namespace Config
} // namespace DirectoryHasher

#endif // LOGGING_CONFIG_HPP
