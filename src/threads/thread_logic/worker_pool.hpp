#ifndef WORKER_POOL_HPP
#define WORKER_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "logging/logger/async_logger.hpp"
#include "logging/logs/thread_logs.hpp"

namespace DirectoryHasher {
namespace ThreadSystem {

/**
 * @brief Fixed-size pool executing hashing and enumeration units
 *
 * Tasks are run in submission order by whichever worker is free. The number of
 * workers bounds how many files and directories are open at the same time.
 */
class WorkerPool {
public:
    using Task = std::function<void()>;

    WorkerPool(int thread_count, Logging::LoggingContext& logging_context);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Starts every worker. On failure the workers already started are joined and the exception rethrown.
    void start();

    // Queues a task. Returns false once shutdown has begun; the task is then dropped.
    bool submit(Task task);

    // Stops accepting tasks, lets the workers drain the queue and joins them
    void shutdown();

    bool is_accepting() const;

    // Exception-safe task execution
    template<typename TaskFunction>
    static void safe_task_execution(TaskFunction&& task_function, const std::string& thread_name) {
        try {
            task_function();
        } catch (const std::exception& exception_error) {
            ThreadLogs::log_thread_exception(thread_name, exception_error.what());
        } catch (...) {
            ThreadLogs::log_thread_unknown_exception(thread_name);
        }
    }

private:
    void worker_loop(int worker_index);

    const int configured_thread_count;
    Logging::LoggingContext& logging_context;

    mutable std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::deque<Task> task_queue;
    bool accepting = false;
    bool stopping = false;
    std::vector<std::thread> worker_threads;
};

} // namespace ThreadSystem
} // namespace DirectoryHasher

#endif // WORKER_POOL_HPP
