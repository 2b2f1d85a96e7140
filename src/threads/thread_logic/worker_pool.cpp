#include "worker_pool.hpp"
#include "threads/thread_logic/platform/thread_control.hpp"
#include <cstdio>
#include <stdexcept>

using DirectoryHasher::ThreadSystem::Platform::ThreadControl;

namespace DirectoryHasher {
namespace ThreadSystem {

namespace {
    std::string worker_tag(int worker_index) {
        char tag_buffer[16];
        std::snprintf(tag_buffer, sizeof(tag_buffer), "WRK%02d", worker_index);
        return tag_buffer;
    }
}

WorkerPool::WorkerPool(int thread_count, Logging::LoggingContext& context)
    : configured_thread_count(thread_count), logging_context(context) {
    if (thread_count <= 0) {
        throw std::invalid_argument("Worker pool requires at least one thread");
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::start() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (accepting || !worker_threads.empty()) {
            throw std::logic_error("Worker pool already started");
        }
        accepting = true;
        stopping = false;
    }

    try {
        worker_threads.reserve(static_cast<std::size_t>(configured_thread_count));
        for (int worker_index = 0; worker_index < configured_thread_count; ++worker_index) {
            worker_threads.emplace_back(&WorkerPool::worker_loop, this, worker_index);
        }
    } catch (const std::exception& exception_error) {
        ThreadLogs::log_thread_startup_error("WorkerPool", exception_error.what());
        shutdown();
        throw;
    }
    ThreadLogs::log_pool_started(configured_thread_count);
}

bool WorkerPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (!accepting) {
            return false;
        }
        task_queue.push_back(std::move(task));
    }
    queue_cv.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        accepting = false;
        stopping = true;
    }
    queue_cv.notify_all();

    if (worker_threads.empty()) {
        return;
    }
    for (auto& worker_thread : worker_threads) {
        if (worker_thread.joinable()) {
            worker_thread.join();
        }
    }
    int joined_threads = static_cast<int>(worker_threads.size());
    worker_threads.clear();
    ThreadLogs::log_pool_stopped(joined_threads);
}

bool WorkerPool::is_accepting() const {
    std::lock_guard<std::mutex> lock(queue_mutex);
    return accepting;
}

void WorkerPool::worker_loop(int worker_index) {
    Logging::set_logging_context(logging_context);
    std::string thread_tag = worker_tag(worker_index);
    logging_context.set_thread_tag(thread_tag);
    ThreadControl::set_thread_name("hash-worker-" + std::to_string(worker_index));
    ThreadLogs::log_worker_started(worker_index, ThreadControl::get_thread_info());

    while (true) {
        Task next_task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            queue_cv.wait(lock, [&]{ return stopping || !task_queue.empty(); });
            if (task_queue.empty()) {
                break;
            }
            next_task = std::move(task_queue.front());
            task_queue.pop_front();
        }
        safe_task_execution(next_task, thread_tag);
    }

    logging_context.clear_thread_tag();
    Logging::clear_logging_context();
}

} // namespace ThreadSystem
} // namespace DirectoryHasher
