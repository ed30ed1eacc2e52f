#include "dsync/local/fingerprint.hpp"

#include "../support/test_doubles.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using dsync::ErrorKind;
using dsync::local::fingerprint_bytes;
using dsync::local::fingerprint_file;
using dsync::local::kFingerprintChunkSize;

class FingerprintTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = dsync::test::create_temp_dir("dsync_fingerprint_");
    }

    void TearDown() override {
        if (!root_.empty()) {
            fs::remove_all(root_);
        }
    }

    fs::path root_;
};

TEST_F(FingerprintTest, KnownDigests) {
    EXPECT_EQ(fingerprint_bytes("hello world"), "5eb63bbbe01eeed093cb22bb8f5acdc3");
    EXPECT_EQ(fingerprint_bytes(""), "d41d8cd98f00b204e9800998ecf8427e");
}

TEST_F(FingerprintTest, FileMatchesInMemoryDigest) {
    const auto file = root_ / "hello.txt";
    dsync::test::write_file(file, "hello world");

    auto result = fingerprint_file(file);
    ASSERT_TRUE(result.is_ok()) << result.error().message;
    EXPECT_EQ(result.value(), "5eb63bbbe01eeed093cb22bb8f5acdc3");
}

TEST_F(FingerprintTest, EmptyFile) {
    const auto file = root_ / "empty.bin";
    dsync::test::write_file(file, "");

    auto result = fingerprint_file(file);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), "d41d8cd98f00b204e9800998ecf8427e");
}

TEST_F(FingerprintTest, FileSpanningSeveralChunks) {
    std::string content;
    for (std::size_t i = 0; i < kFingerprintChunkSize * 3 + 17; ++i) {
        content.push_back(static_cast<char>('a' + i % 26));
    }
    const auto file = root_ / "large.txt";
    dsync::test::write_file(file, content);

    auto result = fingerprint_file(file);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), fingerprint_bytes(content));
    EXPECT_EQ(result.value().size(), 32u);
}

TEST_F(FingerprintTest, MissingFileIsIoError) {
    auto result = fingerprint_file(root_ / "missing.txt");
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::Io));
}

TEST_F(FingerprintTest, ContentChangeChangesDigest) {
    const auto file = root_ / "doc.txt";
    dsync::test::write_file(file, "version one");
    auto first = fingerprint_file(file);

    dsync::test::write_file(file, "version two");
    auto second = fingerprint_file(file);

    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_NE(first.value(), second.value());
}
