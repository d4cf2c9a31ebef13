#include "seshat/duplicate.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

namespace seshat {
namespace {

class DuplicateResolverTest : public ::testing::Test {
protected:
    test::TempDir dir;
    std::string src;
    std::string dest_dir;

    void SetUp() override {
        src = dir.file("watch/photo.jpg");
        dest_dir = dir.make_dir("archive/2021/05/01");
    }
};

TEST(FileMd5Test, KnownDigest) {
    test::TempDir dir;
    const std::string path = dir.file("abc.bin");
    test::write_file(path, "abc");

    std::string hex;
    ASSERT_TRUE(file_md5(path, hex));
    EXPECT_EQ(hex, "900150983cd24fb0d6963f7d28e17f72");
}

TEST(FileMd5Test, MissingFileFails) {
    test::TempDir dir;
    std::string hex;
    EXPECT_FALSE(file_md5(dir.file("missing.bin"), hex));
}

TEST_F(DuplicateResolverTest, NoFileAtDestinationIsNotDuplicate) {
    test::write_file(src, "content");
    EXPECT_FALSE(DuplicateResolver(true).is_duplicate(src, dest_dir));
}

TEST_F(DuplicateResolverTest, EqualSizeAndHashIsDuplicate) {
    test::write_file(src, "identical bytes");
    test::write_file(dest_dir + "/photo.jpg", "identical bytes");
    EXPECT_TRUE(DuplicateResolver(true).is_duplicate(src, dest_dir));
}

TEST_F(DuplicateResolverTest, EqualSizeDifferentContentIsNotDuplicateWithChecksum) {
    test::write_file(src, "aaaaaaaa");
    test::write_file(dest_dir + "/photo.jpg", "bbbbbbbb");
    EXPECT_FALSE(DuplicateResolver(true).is_duplicate(src, dest_dir));
}

TEST_F(DuplicateResolverTest, EqualSizeIsEnoughWithoutChecksum) {
    test::write_file(src, "aaaaaaaa");
    test::write_file(dest_dir + "/photo.jpg", "bbbbbbbb");
    EXPECT_TRUE(DuplicateResolver(false).is_duplicate(src, dest_dir));
}

TEST_F(DuplicateResolverTest, DifferentSizeIsNeverDuplicate) {
    test::write_file(src, "short");
    test::write_file(dest_dir + "/photo.jpg", "much longer content");
    EXPECT_FALSE(DuplicateResolver(false).is_duplicate(src, dest_dir));
}

TEST_F(DuplicateResolverTest, DirectoryWithSameNameIsNotDuplicate) {
    test::write_file(src, "content");
    dir.make_dir("archive/2021/05/01/photo.jpg");
    EXPECT_FALSE(DuplicateResolver(true).is_duplicate(src, dest_dir));
}

}
}
