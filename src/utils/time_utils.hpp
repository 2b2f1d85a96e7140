#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <chrono>
#include <string>

namespace DirectoryHasher {
namespace TimeUtils {

constexpr long long MILLISECONDS_PER_SECOND = 1000;

// Time format constants
constexpr const char* HUMAN_READABLE = "%Y-%m-%d %H:%M:%S";

// Local time as "YYYY-MM-DD HH:MM:SS.mmm"
std::string get_current_human_readable_time();

// Milliseconds elapsed since start_time
long long milliseconds_since(const std::chrono::steady_clock::time_point& start_time);

} // namespace TimeUtils
} // namespace DirectoryHasher

#endif // TIME_UTILS_HPP
