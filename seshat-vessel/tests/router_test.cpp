#include "seshat/router.hpp"
#include "seshat/metadata.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <ctime>
#include <string>

namespace seshat {
namespace {

TEST(DestinationBucketTest, RendersZeroPadded) {
    DestinationBucket b{2021, 5, 1};
    EXPECT_EQ(b.render(), "2021/05/01");
    EXPECT_EQ((DestinationBucket{987, 12, 31}).render(), "0987/12/31");
}

TEST(DestinationBucketTest, BucketUsesLocalCalendarDay) {
    DestinationBucket b = bucket_for_time(test::local_time(2021, 5, 1, 10, 0, 0));
    EXPECT_EQ(b, (DestinationBucket{2021, 5, 1}));

    b = bucket_for_time(test::local_time(2020, 2, 29, 23, 59, 59));
    EXPECT_EQ(b, (DestinationBucket{2020, 2, 29}));
}

TEST(ResolveDestinationBucketTest, MetadataTimestampWins) {
    test::TempDir dir;
    const std::string path = dir.file("photo.jpg");
    test::write_file(path, "jpeg");
    test::set_mtime(path, test::local_time(2019, 1, 2, 12));

    DestinationBucket b = resolve_destination_bucket(path, test::local_time(2021, 5, 1, 10));
    EXPECT_EQ(b.render(), "2021/05/01");
}

TEST(ResolveDestinationBucketTest, FallsBackToEarlierOfMtimeAndCtime) {
    test::TempDir dir;
    const std::string path = dir.file("clip.mov");
    test::write_file(path, "video");
    // ctime is "now", so the backdated mtime is the earlier one
    test::set_mtime(path, test::local_time(2019, 1, 2, 12));

    DestinationBucket b = resolve_destination_bucket(path, std::nullopt);
    EXPECT_EQ(b.render(), "2019/01/02");
}

TEST(ArchiveDirectoryTest, JoinsBucketUnderRoot) {
    std::string out;
    ASSERT_TRUE(archive_directory_for("/srv/photos", DestinationBucket{2021, 5, 1}, out));
    EXPECT_EQ(out, "/srv/photos/2021/05/01");
}

TEST(UniqueDestinationTest, FreeNameIsUsedAsIs) {
    test::TempDir dir;
    EXPECT_EQ(make_unique_destination(dir.path(), "photo.jpg", 0), dir.file("photo.jpg"));
}

TEST(UniqueDestinationTest, CollisionsGetTimestampThenCounter) {
    test::TempDir dir;
    const std::time_t now = test::local_time(2024, 3, 9, 8, 7, 6);

    test::write_file(dir.file("photo.jpg"), "a");
    EXPECT_EQ(make_unique_destination(dir.path(), "photo.jpg", now),
              dir.file("photo_20240309_080706.jpg"));

    test::write_file(dir.file("photo_20240309_080706.jpg"), "b");
    EXPECT_EQ(make_unique_destination(dir.path(), "photo.jpg", now),
              dir.file("photo_20240309_080706_1.jpg"));

    test::write_file(dir.file("photo_20240309_080706_1.jpg"), "c");
    EXPECT_EQ(make_unique_destination(dir.path(), "photo.jpg", now),
              dir.file("photo_20240309_080706_2.jpg"));
}

TEST(UniqueDestinationTest, NamesWithoutExtensionKeepNoExtension) {
    test::TempDir dir;
    const std::time_t now = test::local_time(2024, 3, 9, 8, 7, 6);
    test::write_file(dir.file("README"), "a");
    EXPECT_EQ(make_unique_destination(dir.path(), "README", now), dir.file("README_20240309_080706"));
}

TEST(MetadataDateParsingTest, ExifDateTime) {
    EXPECT_EQ(parse_exif_datetime("2021:05:01 10:00:00"), test::local_time(2021, 5, 1, 10, 0, 0));
    EXPECT_EQ(parse_exif_datetime("2021-05-01 10:00:00"), test::local_time(2021, 5, 1, 10, 0, 0));
}

TEST(MetadataDateParsingTest, ExifRejectsImpossibleDates) {
    EXPECT_FALSE(parse_exif_datetime("2021:02:30 10:00:00").has_value());
    EXPECT_FALSE(parse_exif_datetime("0000:00:00 00:00:00").has_value());
    EXPECT_FALSE(parse_exif_datetime("garbage").has_value());
}

TEST(MetadataDateParsingTest, Iso8601WithZoneIsAbsolute) {
    EXPECT_EQ(parse_iso8601("2021-05-01T10:00:00Z"), std::time_t{1619863200});
    EXPECT_EQ(parse_iso8601("2021-05-01T12:00:00.250+02:00"), std::time_t{1619863200});
}

// Pins the process zone to a fixed UTC+10 offset for the duration of a test.
class FixedZoneTest : public ::testing::Test {
    std::string saved_;
    bool had_tz_ = false;

protected:
    void SetUp() override {
        if (const char* tz = getenv("TZ")) {
            had_tz_ = true;
            saved_ = tz;
        }
        setenv("TZ", "AEST-10", 1);
        tzset();
    }

    void TearDown() override {
        if (had_tz_) {
            setenv("TZ", saved_.c_str(), 1);
        } else {
            unsetenv("TZ");
        }
        tzset();
    }
};

TEST_F(FixedZoneTest, ZonedVideoTimeIsBucketedByLocalDay) {
    // 23:30 UTC on May 1 is 09:30 local on May 2
    auto zoned = parse_iso8601("2021-05-01T23:30:00Z");
    ASSERT_TRUE(zoned.has_value());
    EXPECT_EQ(bucket_for_time(*zoned), (DestinationBucket{2021, 5, 2}));

    auto offset = parse_iso8601("2021-05-01T19:30:00-04:00");
    ASSERT_TRUE(offset.has_value());
    EXPECT_EQ(bucket_for_time(*offset), (DestinationBucket{2021, 5, 2}));
}

TEST_F(FixedZoneTest, ZonelessVideoTimeIsReadAsLocal) {
    auto local = parse_iso8601("2021-05-01T23:30:00");
    ASSERT_TRUE(local.has_value());
    EXPECT_EQ(bucket_for_time(*local), (DestinationBucket{2021, 5, 1}));
}

TEST(MetadataResolverTest, UnsupportedExtensionHasNoTimestamp) {
    test::TempDir dir;
    const std::string path = dir.file("notes.txt");
    test::write_file(path, "hello");
    EXPECT_FALSE(MetadataResolver{}.resolve(path).has_value());
}

TEST(MetadataResolverTest, UnreadableImageDegradesToNoTimestamp) {
    test::TempDir dir;
    const std::string path = dir.file("broken.jpg");
    test::write_file(path, "not really a jpeg");
    EXPECT_FALSE(MetadataResolver{}.resolve(path).has_value());
}

}
}
