#include "seshat/ingest_filter.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

namespace seshat {
namespace {

TEST(MediaCategoryTest, ExtensionsMapToCategories) {
    EXPECT_EQ(category_for_extension(".jpg"), MediaCategory::Image);
    EXPECT_EQ(category_for_extension(".heic"), MediaCategory::Image);
    EXPECT_EQ(category_for_extension(".cr2"), MediaCategory::Raw);
    EXPECT_EQ(category_for_extension(".dng"), MediaCategory::Raw);
    EXPECT_EQ(category_for_extension(".mov"), MediaCategory::Video);
    EXPECT_EQ(category_for_extension(".m2ts"), MediaCategory::Video);
    EXPECT_FALSE(category_for_extension(".txt").has_value());
    EXPECT_FALSE(category_for_extension("").has_value());
    EXPECT_STREQ(category_name(MediaCategory::Raw), "raw");
}

TEST(IngestFilterTest, IgnoredNames) {
    EXPECT_TRUE(IngestFilter::is_ignored_name(".DS_Store"));
    EXPECT_TRUE(IngestFilter::is_ignored_name("~lock.jpg"));
    EXPECT_TRUE(IngestFilter::is_ignored_name("Thumbs.db"));
    EXPECT_TRUE(IngestFilter::is_ignored_name("clip.mp4.part"));
    EXPECT_TRUE(IngestFilter::is_ignored_name("video.CRDOWNLOAD"));
    EXPECT_TRUE(IngestFilter::is_ignored_name(""));
    EXPECT_FALSE(IngestFilter::is_ignored_name("IMG_0001.JPG"));
}

TEST(IngestFilterTest, IgnoredDirectoryNamesAreCaseInsensitive) {
    EXPECT_TRUE(IngestFilter::is_ignored_dir_name("cache"));
    EXPECT_TRUE(IngestFilter::is_ignored_dir_name("Cache"));
    EXPECT_TRUE(IngestFilter::is_ignored_dir_name("THUMBNAIL"));
    EXPECT_TRUE(IngestFilter::is_ignored_dir_name("._failed_locked"));
    EXPECT_FALSE(IngestFilter::is_ignored_dir_name("DCIM"));
    EXPECT_FALSE(IngestFilter::is_ignored_dir_name("thumbnails"));
}

TEST(IngestFilterTest, AcceptsMediaBelowRootOnly) {
    IngestFilter filter("/srv/uploads/");
    EXPECT_EQ(filter.watch_root(), "/srv/uploads");

    EXPECT_TRUE(filter.accepts_path("/srv/uploads/a.jpg"));
    EXPECT_TRUE(filter.accepts_path("/srv/uploads/trip/day1/IMG_1.CR2"));
    EXPECT_TRUE(filter.accepts_path("/srv/uploads/phone/VID_2.MP4"));

    EXPECT_FALSE(filter.accepts_path("/srv/uploads"));
    EXPECT_FALSE(filter.accepts_path("/srv/uploads-old/a.jpg"));
    EXPECT_FALSE(filter.accepts_path("/srv/photos/a.jpg"));
    EXPECT_FALSE(filter.accepts_path("/srv/uploads/notes.txt"));
    EXPECT_FALSE(filter.accepts_path("/srv/uploads/.a.jpg"));
    EXPECT_FALSE(filter.accepts_path("/srv/uploads/noext"));
}

TEST(IngestFilterTest, IgnoredComponentsOnlyCountBelowRoot) {
    // The root itself may live under a directory that would otherwise be ignored
    IngestFilter filter("/var/tmp/uploads");

    EXPECT_TRUE(filter.accepts_path("/var/tmp/uploads/a.jpg"));
    EXPECT_FALSE(filter.accepts_path("/var/tmp/uploads/tmp/a.jpg"));
    EXPECT_FALSE(filter.accepts_path("/var/tmp/uploads/x/Cache/y/a.jpg"));
    EXPECT_FALSE(filter.accepts_path("/var/tmp/uploads/._failed_locked/a_locked_1.jpg"));
    EXPECT_TRUE(filter.accepts_path("/var/tmp/uploads/cached/a.jpg"));
}

TEST(IngestFilterTest, AcceptsRequiresRegularFile) {
    test::TempDir dir;
    const std::string watch = dir.make_dir("watch");
    IngestFilter filter(watch);

    test::write_file(watch + "/real.jpg", "x");
    dir.make_dir("watch/folder.jpg");
    ASSERT_EQ(symlink((watch + "/real.jpg").c_str(), (watch + "/link.jpg").c_str()), 0);

    EXPECT_TRUE(filter.accepts(watch + "/real.jpg"));
    EXPECT_FALSE(filter.accepts(watch + "/folder.jpg"));
    EXPECT_FALSE(filter.accepts(watch + "/link.jpg"));
    EXPECT_FALSE(filter.accepts(watch + "/missing.jpg"));
    EXPECT_TRUE(filter.accepts_path(watch + "/link.jpg"));
}

}
}
