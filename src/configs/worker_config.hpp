#ifndef WORKER_CONFIG_HPP
#define WORKER_CONFIG_HPP

namespace DirectoryHasher {
namespace Config {

constexpr int MIN_DEFAULT_WORKER_THREADS = 2;
constexpr int MAX_DEFAULT_WORKER_THREADS = 8;
constexpr int MAX_WORKER_THREADS = 256;

struct WorkerConfig {
    int thread_count = 0;    // 0 selects hardware concurrency clamped to the default range
};

// Resolves thread_count = 0 to a concrete pool size
int resolve_worker_thread_count(const WorkerConfig& worker_config);

} // namespace Config
} // namespace DirectoryHasher

#endif // WORKER_CONFIG_HPP
