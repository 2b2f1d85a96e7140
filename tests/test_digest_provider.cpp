#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include "hasher/digest_provider.hpp"

using namespace DirectoryHasher::Core;

// ============================================================================
// KNOWN DIGESTS
// ============================================================================

TEST(Md5DigestProviderTest, EmptyInputMatchesKnownDigest) {
    Md5DigestProvider provider;
    EXPECT_EQ(to_hex(provider.compute(std::string())), "d41d8cd98f00b204e9800998ecf8427e");
}

TEST(Md5DigestProviderTest, ShortInputsMatchKnownDigests) {
    Md5DigestProvider provider;
    EXPECT_EQ(to_hex(provider.compute(std::string("abc"))), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(to_hex(provider.compute(std::string("The quick brown fox jumps over the lazy dog"))),
              "9e107d9d372bb6826bd81d3542a419d6");
}

TEST(Md5DigestProviderTest, DigestIndependentOfReadBufferSize) {
    std::string large_input;
    for (int block_index = 0; block_index < 5000; ++block_index) {
        large_input += "block " + std::to_string(block_index) + "\n";
    }

    Md5DigestProvider small_buffer_provider(512);
    Md5DigestProvider large_buffer_provider(1024 * 1024);
    EXPECT_EQ(to_hex(small_buffer_provider.compute(large_input)), to_hex(large_buffer_provider.compute(large_input)));
}

TEST(Md5DigestProviderTest, BinaryContentIsHashedVerbatim) {
    Md5DigestProvider provider;
    std::string with_nul("a\0b", 3);
    EXPECT_NE(to_hex(provider.compute(with_nul)), to_hex(provider.compute(std::string("ab"))));
}

TEST(Md5DigestProviderTest, ZeroBufferSizeRejected) {
    EXPECT_THROW(Md5DigestProvider(0), std::invalid_argument);
}

TEST(Md5DigestProviderTest, BadStreamReportsRuntimeError) {
    Md5DigestProvider provider;
    std::istringstream failing_stream("content");
    failing_stream.setstate(std::ios::badbit);
    EXPECT_THROW(provider.compute(failing_stream), std::runtime_error);
}

// ============================================================================
// HEX RENDERING AND FACTORY
// ============================================================================

TEST(ContentDigestTest, HexIsLowercaseAndFixedWidth) {
    ContentDigest digest;
    digest.bytes[0] = 0xAB;
    digest.bytes[15] = 0x0F;

    std::string hex_string = to_hex(digest);
    ASSERT_EQ(hex_string.size(), CONTENT_DIGEST_HEX_LENGTH);
    EXPECT_EQ(hex_string.substr(0, 2), "ab");
    EXPECT_EQ(hex_string.substr(30, 2), "0f");
    EXPECT_EQ(hex_string.substr(2, 28), std::string(28, '0'));
}

TEST(DigestProviderFactoryTest, CreatesMd5Provider) {
    DirectoryHasher::Config::HashingConfig hashing_config;
    auto provider = create_digest_provider(hashing_config);
    ASSERT_NE(provider, nullptr);
    EXPECT_EQ(provider->name(), "md5");
}

TEST(DigestProviderFactoryTest, UnknownAlgorithmRejected) {
    DirectoryHasher::Config::HashingConfig hashing_config;
    hashing_config.algorithm = "sha1";
    EXPECT_THROW(create_digest_provider(hashing_config), std::invalid_argument);
}
