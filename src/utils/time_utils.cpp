#include "time_utils.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace DirectoryHasher {
namespace TimeUtils {

std::string get_current_human_readable_time() {
    auto now = std::chrono::system_clock::now();
    std::time_t now_time = std::chrono::system_clock::to_time_t(now);
    long long milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % MILLISECONDS_PER_SECOND;

    std::tm local_tm_buf;
    localtime_r(&now_time, &local_tm_buf);

    std::stringstream time_stream;
    time_stream << std::put_time(&local_tm_buf, HUMAN_READABLE)
                << "." << std::setw(3) << std::setfill('0') << milliseconds;
    return time_stream.str();
}

long long milliseconds_since(const std::chrono::steady_clock::time_point& start_time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
}

} // namespace TimeUtils
} // namespace DirectoryHasher
