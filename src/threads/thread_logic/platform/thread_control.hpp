#ifndef THREAD_CONTROL_HPP
#define THREAD_CONTROL_HPP

#include <string>

namespace DirectoryHasher {
namespace ThreadSystem {
namespace Platform {

// Cross-platform thread control interface
class ThreadControl {
public:
    // Names the calling thread (truncated to the platform limit). Returns false when unsupported.
    static bool set_thread_name(const std::string& name);

    // Short description of the calling thread for diagnostics
    static std::string get_thread_info();
};

} // namespace Platform
} // namespace ThreadSystem
} // namespace DirectoryHasher

#endif // THREAD_CONTROL_HPP
