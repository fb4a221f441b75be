#include "medialib/library/checksum.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <string>

using medialib::ErrorKind;
using medialib::library::hash_file;
using medialib::library::to_hex;
using medialib::test_support::TempDirTest;
using medialib::test_support::write_file;

class ChecksumTest : public TempDirTest {};

TEST_F(ChecksumTest, KnownSha1Digests) {
    write_file(root_ / "empty.jpg", "");
    write_file(root_ / "abc.jpg", "abc");

    auto empty = hash_file(root_ / "empty.jpg");
    ASSERT_TRUE(empty.is_ok());
    EXPECT_EQ(to_hex(empty.value()), "da39a3ee5e6b4b0d3255bfef95601890afd80709");

    auto abc = hash_file(root_ / "abc.jpg");
    ASSERT_TRUE(abc.is_ok());
    EXPECT_EQ(to_hex(abc.value()), "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST_F(ChecksumTest, LargeFileSpanningSeveralBlocks) {
    // One million 'a': the FIPS 180 long-message vector
    write_file(root_ / "big.raw", std::string(1000000, 'a'));

    auto digest = hash_file(root_ / "big.raw");
    ASSERT_TRUE(digest.is_ok());
    EXPECT_EQ(to_hex(digest.value()), "34aa973cd4c4daa4f61eeb2bdbad27316534016f");
}

TEST_F(ChecksumTest, MissingFileIsTransient) {
    auto digest = hash_file(root_ / "missing.jpg");
    ASSERT_TRUE(digest.is_error());
    EXPECT_EQ(digest.error().kind, ErrorKind::TransientIO);
    EXPECT_FALSE(medialib::is_permanent(digest.error().kind));
}
