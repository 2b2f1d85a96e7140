#include "log_queue.hpp"
#include <cstdio>

namespace DirectoryHasher {
namespace Core {

std::string encode_log_path(const std::string& relative_path) {
    std::string encoded_path;
    encoded_path.reserve(relative_path.size());
    for (char path_character : relative_path) {
        unsigned char byte_value = static_cast<unsigned char>(path_character);
        if (byte_value <= 0x20 || byte_value >= 0x7F || path_character == '%') {
            char escape_buffer[4];
            std::snprintf(escape_buffer, sizeof(escape_buffer), "%%%02X", byte_value);
            encoded_path += escape_buffer;
        } else {
            encoded_path += path_character;
        }
    }
    return encoded_path;
}

std::string LogEntry::format() const {
    std::string formatted_line;
    formatted_line.reserve(tag.size() + relative_path.size() + digest_hex.size() + 2);
    formatted_line += tag;
    formatted_line += ' ';
    formatted_line += encode_log_path(relative_path);
    formatted_line += ' ';
    formatted_line += digest_hex;
    return formatted_line;
}

void LogQueue::push(LogEntry entry) {
    std::lock_guard<std::mutex> lock(queue_mutex);
    entries.push_back(std::move(entry));
}

bool LogQueue::try_pop(LogEntry& entry) {
    std::lock_guard<std::mutex> lock(queue_mutex);
    if (entries.empty()) {
        return false;
    }
    entry = std::move(entries.front());
    entries.pop_front();
    return true;
}

void LogQueue::push_front(LogEntry entry) {
    std::lock_guard<std::mutex> lock(queue_mutex);
    entries.push_front(std::move(entry));
}

std::size_t LogQueue::size() const {
    std::lock_guard<std::mutex> lock(queue_mutex);
    return entries.size();
}

bool LogQueue::empty() const {
    std::lock_guard<std::mutex> lock(queue_mutex);
    return entries.empty();
}

std::size_t LogQueue::clear() {
    std::lock_guard<std::mutex> lock(queue_mutex);
    std::size_t discarded_entries = entries.size();
    entries.clear();
    return discarded_entries;
}

} // namespace Core
} // namespace DirectoryHasher
