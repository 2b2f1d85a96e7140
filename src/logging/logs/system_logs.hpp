#ifndef SYSTEM_LOGS_HPP
#define SYSTEM_LOGS_HPP

#include <cstddef>
#include <string>

namespace DirectoryHasher {

/**
 * Specialized logging for library lifecycle operations.
 * Handles all init/terminate logging in a consistent format.
 */
class SystemLogs {
public:
    // Library startup and shutdown
    static void log_library_initialized(int worker_thread_count, const std::string& algorithm);
    static void log_library_terminating(std::size_t outstanding_operations, std::size_t unread_log_lines);
    static void log_library_terminated();
    static void log_configuration_error(const std::string& error_message);
    static void log_startup_error(const std::string& error_message);
    static void log_shutdown_error(const std::string& error_message);

    // Boundary errors converted to result codes
    static void log_entry_point_exception(const std::string& entry_point, const std::string& error_message);
};

} // namespace DirectoryHasher

#endif // SYSTEM_LOGS_HPP
