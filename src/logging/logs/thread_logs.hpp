#ifndef THREAD_LOGS_HPP
#define THREAD_LOGS_HPP

#include <cstddef>
#include <string>

namespace DirectoryHasher {

class ThreadLogs {
public:
    static void log_pool_started(int thread_count);
    static void log_pool_stopped(int thread_count);
    static void log_worker_started(int worker_index, const std::string& thread_info);
    static void log_thread_startup_error(const std::string& thread_name, const std::string& error_message);
    static void log_thread_exception(const std::string& thread_name, const std::string& error_message);
    static void log_thread_unknown_exception(const std::string& thread_name);
    static void log_logging_loop_exception(const std::string& error_message);
    static void log_diagnostics_dropped(std::size_t dropped_lines);
};

} // namespace DirectoryHasher

#endif // THREAD_LOGS_HPP
