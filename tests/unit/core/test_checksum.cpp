// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file test_checksum.cpp
 * @brief Unit tests for SHA-256 checksum utilities
 */

#include <gtest/gtest.h>

#include <kcenon/ims_session/core/checksum.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace kcenon::ims_session::test {

namespace {

constexpr const char* kHelloSha256 =
    "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";
constexpr const char* kEmptySha256 =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

}  // namespace

class ChecksumTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("ims_session_test_checksum_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, const std::string& content)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        return path;
    }

    static auto to_bytes(const std::string& s) -> std::vector<std::byte> {
        std::vector<std::byte> bytes(s.size());
        if (!s.empty()) {
            std::memcpy(bytes.data(), s.data(), s.size());
        }
        return bytes;
    }

    std::filesystem::path test_dir_;
};

TEST_F(ChecksumTest, SHA256_EmptyData) {
    std::vector<std::byte> empty;
    EXPECT_EQ(checksum::sha256(empty), kEmptySha256);
}

TEST_F(ChecksumTest, SHA256_KnownValue) {
    EXPECT_EQ(checksum::sha256(to_bytes("hello")), kHelloSha256);
}

TEST_F(ChecksumTest, SHA256_HashLength) {
    auto hash = checksum::sha256(to_bytes("The quick brown fox jumps over the lazy dog"));
    EXPECT_EQ(hash.size(), 64u);
}

TEST_F(ChecksumTest, SHA256File_EmptyFile) {
    auto path = create_test_file("empty.bin", "");

    auto result = checksum::sha256_file(path);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), kEmptySha256);
}

TEST_F(ChecksumTest, SHA256File_KnownContent) {
    auto path = create_test_file("hello.txt", "hello");

    auto result = checksum::sha256_file(path);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), kHelloSha256);
}

TEST_F(ChecksumTest, SHA256File_NonExistent) {
    auto result = checksum::sha256_file(test_dir_ / "missing.bin");
    EXPECT_FALSE(result.has_value());
}

TEST_F(ChecksumTest, SHA256File_MatchesInMemoryHashAcrossBlocks) {
    std::string content(200 * 1024, '\0');
    std::mt19937 gen(7);
    for (auto& c : content) {
        c = static_cast<char>(gen() & 0xFF);
    }
    auto path = create_test_file("large.bin", content);

    auto result = checksum::sha256_file(path);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), checksum::sha256(to_bytes(content)));
}

TEST_F(ChecksumTest, VerifySHA256_Valid) {
    auto path = create_test_file("hello.txt", "hello");
    EXPECT_TRUE(checksum::verify_sha256(path, kHelloSha256));
}

TEST_F(ChecksumTest, VerifySHA256_CaseInsensitive) {
    auto path = create_test_file("hello.txt", "hello");
    EXPECT_TRUE(checksum::verify_sha256(
        path, "2CF24DBA5FB0A30E26E83B2AC5B9E29E1B161E5C1FA7425E73043362938B9824"));
}

TEST_F(ChecksumTest, VerifySHA256_Invalid) {
    auto path = create_test_file("hello.txt", "hello!");
    EXPECT_FALSE(checksum::verify_sha256(path, kHelloSha256));
}

TEST_F(ChecksumTest, VerifySHA256_NonExistentFile) {
    EXPECT_FALSE(checksum::verify_sha256(test_dir_ / "missing.bin", kHelloSha256));
}

}  // namespace kcenon::ims_session::test
