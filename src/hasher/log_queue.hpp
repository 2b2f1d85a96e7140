#ifndef LOG_QUEUE_HPP
#define LOG_QUEUE_HPP

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>

namespace DirectoryHasher {
namespace Core {

// One hashed file, formatted as "<tag> <relative_path> <digest_hex>"
struct LogEntry {
    std::string tag;
    std::string relative_path;
    std::string digest_hex;

    std::string format() const;
};

// Encodes whitespace, control characters, '%' and every byte >= 0x7F as %XX,
// so the path stays one ASCII field without whitespace
std::string encode_log_path(const std::string& relative_path);

/**
 * @brief Unbounded FIFO shared by every operation
 *
 * Producers are pool workers; the consumer is whoever calls HashReadNextLogLine.
 * Each pushed entry is handed out exactly once. Never blocks waiting for data.
 */
class LogQueue {
public:
    void push(LogEntry entry);

    // Pops the oldest entry. Returns false when empty.
    bool try_pop(LogEntry& entry);

    // Puts an entry back at the head, used when delivery fails after popping
    void push_front(LogEntry entry);

    std::size_t size() const;
    bool empty() const;

    // Drops every entry, returning how many were discarded
    std::size_t clear();

private:
    mutable std::mutex queue_mutex;
    std::deque<LogEntry> entries;
};

} // namespace Core
} // namespace DirectoryHasher

#endif // LOG_QUEUE_HPP
