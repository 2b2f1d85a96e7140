#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace DirectoryHasher {
namespace Testing {

// Unique scratch directory removed with everything under it on destruction
class TemporaryDirectory {
public:
    explicit TemporaryDirectory(const std::string& prefix = "directory_hasher") {
        static std::atomic<int> directory_counter{0};
        directory_path = std::filesystem::temp_directory_path() /
                         (prefix + "_" + std::to_string(::getpid()) + "_" + std::to_string(directory_counter.fetch_add(1)));
        std::filesystem::remove_all(directory_path);
        std::filesystem::create_directories(directory_path);
    }

    ~TemporaryDirectory() {
        std::error_code cleanup_error;
        std::filesystem::remove_all(directory_path, cleanup_error);
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::filesystem::path& path() const { return directory_path; }

    // Writes content to relative_path, creating intermediate directories
    std::filesystem::path write_file(const std::string& relative_path, const std::string& content) const {
        std::filesystem::path file_path = directory_path / relative_path;
        std::filesystem::create_directories(file_path.parent_path());
        std::ofstream file_stream(file_path, std::ios::binary);
        file_stream.write(content.data(), static_cast<std::streamsize>(content.size()));
        return file_path;
    }

    std::filesystem::path make_directory(const std::string& relative_path) const {
        std::filesystem::path created_path = directory_path / relative_path;
        std::filesystem::create_directories(created_path);
        return created_path;
    }

private:
    std::filesystem::path directory_path;
};

// Sets an environment variable for the lifetime of the object
class ScopedEnvironment {
public:
    ScopedEnvironment(const std::string& variable_name, const std::string& value) : name(variable_name) {
        const char* previous = std::getenv(variable_name.c_str());
        had_previous = previous != nullptr;
        if (had_previous) {
            previous_value = previous;
        }
        ::setenv(variable_name.c_str(), value.c_str(), 1);
    }

    ~ScopedEnvironment() {
        if (had_previous) {
            ::setenv(name.c_str(), previous_value.c_str(), 1);
        } else {
            ::unsetenv(name.c_str());
        }
    }

    ScopedEnvironment(const ScopedEnvironment&) = delete;
    ScopedEnvironment& operator=(const ScopedEnvironment&) = delete;

private:
    std::string name;
    std::string previous_value;
    bool had_previous = false;
};

// Polls condition until it holds or timeout elapses. Returns the last result.
inline bool wait_for(const std::function<bool()>& condition,
                     std::chrono::milliseconds timeout = std::chrono::milliseconds(10000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

} // namespace Testing
} // namespace DirectoryHasher

#endif // TEST_SUPPORT_HPP
