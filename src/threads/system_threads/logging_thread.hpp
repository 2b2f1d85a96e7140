#ifndef LOGGING_THREAD_HPP
#define LOGGING_THREAD_HPP

#include <memory>
#include <string>
#include <vector>
#include "logging/logger/async_logger.hpp"
#include "configs/logging_config.hpp"

namespace DirectoryHasher {
namespace Threads {

/**
 * Drains the diagnostic logger into its sinks until the logger is stopped,
 * then flushes whatever is left.
 */
class LoggingThread {
public:
    LoggingThread(std::shared_ptr<Logging::AsyncLogger> logger,
                  Logging::LoggingContext& context,
                  const Config::LoggingConfig& logging_config)
        : logger_ptr(std::move(logger)), logging_context(context), config(logging_config) {}

    void operator()();

private:
    std::shared_ptr<Logging::AsyncLogger> logger_ptr;
    Logging::LoggingContext& logging_context;
    Config::LoggingConfig config;

    void setup_logging_thread();
    void execute_logging_processing_loop();
    void drain_logger(std::vector<std::string>& message_buffer);
};

} // namespace Threads
} // namespace DirectoryHasher

#endif // LOGGING_THREAD_HPP
