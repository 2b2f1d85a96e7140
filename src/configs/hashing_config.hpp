#ifndef HASHING_CONFIG_HPP
#define HASHING_CONFIG_HPP

#include <cstddef>
#include <string>

namespace DirectoryHasher {
namespace Config {

constexpr std::size_t MIN_READ_BUFFER_SIZE = 512;
constexpr std::size_t MAX_READ_BUFFER_SIZE = 64 * 1024 * 1024;

struct HashingConfig {
    std::string algorithm = "md5";
    std::size_t read_buffer_size = 64 * 1024;
};

} // namespace Config
} // namespace DirectoryHasher

#endif // HASHING_CONFIG_HPP
