#ifndef DIGEST_PROVIDER_HPP
#define DIGEST_PROVIDER_HPP

#include <array>
#include <cstddef>
#include <istream>
#include <memory>
#include <string>
#include "configs/hashing_config.hpp"

namespace DirectoryHasher {
namespace Core {

constexpr std::size_t CONTENT_DIGEST_BYTES = 16;
constexpr std::size_t CONTENT_DIGEST_HEX_LENGTH = CONTENT_DIGEST_BYTES * 2;

// 128-bit content fingerprint
struct ContentDigest {
    std::array<unsigned char, CONTENT_DIGEST_BYTES> bytes{};
};

// Lowercase hexadecimal rendering, always CONTENT_DIGEST_HEX_LENGTH characters
std::string to_hex(const ContentDigest& digest);

/**
 * @brief Computes a content digest from a byte stream
 *
 * Implementations keep no state between calls and may be shared by all workers.
 */
class DigestProvider {
public:
    virtual ~DigestProvider() = default;

    virtual std::string name() const = 0;

    // Consumes input until end of stream. Throws std::runtime_error on read or digest failure.
    virtual ContentDigest compute(std::istream& input) const = 0;

    ContentDigest compute(const std::string& data) const;
};

class Md5DigestProvider : public DigestProvider {
public:
    explicit Md5DigestProvider(std::size_t read_buffer_size = 64 * 1024);

    std::string name() const override { return "md5"; }
    ContentDigest compute(std::istream& input) const override;
    using DigestProvider::compute;

private:
    std::size_t buffer_size;
};

// Creates the provider named by hashing.algorithm. Throws std::invalid_argument for unknown names.
std::unique_ptr<DigestProvider> create_digest_provider(const Config::HashingConfig& hashing_config);

} // namespace Core
} // namespace DirectoryHasher

#endif // DIGEST_PROVIDER_HPP
