#include "digest_provider.hpp"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace DirectoryHasher {
namespace Core {

namespace {
    struct EvpContextDeleter {
        void operator()(EVP_MD_CTX* context) const { EVP_MD_CTX_free(context); }
    };
    using EvpContextPointer = std::unique_ptr<EVP_MD_CTX, EvpContextDeleter>;

    [[noreturn]] void throw_openssl_error(const std::string& operation) {
        std::string error_description = operation + " failed";
        unsigned long openssl_error_code = ERR_get_error();
        if (openssl_error_code != 0) {
            char error_buffer[256];
            ERR_error_string_n(openssl_error_code, error_buffer, sizeof(error_buffer));
            error_description += ": " + std::string(error_buffer);
        }
        throw std::runtime_error(error_description);
    }
}

std::string to_hex(const ContentDigest& digest) {
    static const char* hex_digits = "0123456789abcdef";

    std::string hex_string;
    hex_string.resize(digest.bytes.size() * 2);
    for (std::size_t byte_index = 0; byte_index < digest.bytes.size(); ++byte_index) {
        unsigned char byte_value = digest.bytes[byte_index];
        hex_string[byte_index * 2] = hex_digits[(byte_value >> 4) & 0x0F];
        hex_string[byte_index * 2 + 1] = hex_digits[byte_value & 0x0F];
    }
    return hex_string;
}

ContentDigest DigestProvider::compute(const std::string& data) const {
    std::istringstream data_stream(data);
    return compute(data_stream);
}

Md5DigestProvider::Md5DigestProvider(std::size_t read_buffer_size) : buffer_size(read_buffer_size) {
    if (buffer_size == 0) {
        throw std::invalid_argument("Digest read buffer size must be positive");
    }
}

ContentDigest Md5DigestProvider::compute(std::istream& input) const {
    EvpContextPointer digest_context(EVP_MD_CTX_new());
    if (!digest_context) {
        throw_openssl_error("EVP_MD_CTX_new");
    }
    if (EVP_DigestInit_ex(digest_context.get(), EVP_md5(), nullptr) != 1) {
        throw_openssl_error("EVP_DigestInit_ex");
    }

    std::vector<char> read_buffer(buffer_size);
    while (input) {
        input.read(read_buffer.data(), static_cast<std::streamsize>(read_buffer.size()));
        std::streamsize bytes_read = input.gcount();
        if (bytes_read > 0 && EVP_DigestUpdate(digest_context.get(), read_buffer.data(), static_cast<std::size_t>(bytes_read)) != 1) {
            throw_openssl_error("EVP_DigestUpdate");
        }
    }
    if (input.bad()) {
        throw std::runtime_error("Read error while hashing stream");
    }

    ContentDigest digest;
    unsigned int digest_length = 0;
    if (EVP_DigestFinal_ex(digest_context.get(), digest.bytes.data(), &digest_length) != 1) {
        throw_openssl_error("EVP_DigestFinal_ex");
    }
    if (digest_length != digest.bytes.size()) {
        throw std::runtime_error("Unexpected MD5 digest length " + std::to_string(digest_length));
    }
    return digest;
}

std::unique_ptr<DigestProvider> create_digest_provider(const Config::HashingConfig& hashing_config) {
    if (hashing_config.algorithm == "md5") {
        return std::make_unique<Md5DigestProvider>(hashing_config.read_buffer_size);
    }
    throw std::invalid_argument("Unsupported digest algorithm: " + hashing_config.algorithm);
}

} // namespace Core
} // namespace DirectoryHasher
