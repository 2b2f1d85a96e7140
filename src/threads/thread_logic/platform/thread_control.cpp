#include "thread_control.hpp"
#include <cstddef>
#include <sstream>
#include <thread>

#ifdef __linux__
#include <pthread.h>
#include <sys/syscall.h>
#include <unistd.h>
#endif

namespace DirectoryHasher {
namespace ThreadSystem {
namespace Platform {

namespace {
    // Linux limits thread names to 16 bytes including the terminator
    constexpr std::size_t MAX_THREAD_NAME_LENGTH = 15;
}

bool ThreadControl::set_thread_name(const std::string& name) {
#ifdef __linux__
    std::string truncated_name = name.substr(0, MAX_THREAD_NAME_LENGTH);
    return pthread_setname_np(pthread_self(), truncated_name.c_str()) == 0;
#else
    (void)name;
    return false;
#endif
}

std::string ThreadControl::get_thread_info() {
    std::stringstream info_stream;
#ifdef __linux__
    info_stream << "tid " << static_cast<long>(syscall(SYS_gettid));
#else
    info_stream << "thread " << std::this_thread::get_id();
#endif
    return info_stream.str();
}

} // namespace Platform
} // namespace ThreadSystem
} // namespace DirectoryHasher
