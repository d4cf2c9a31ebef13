#include "seshat/janitor.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <ctime>

namespace seshat {
namespace {

TEST(StaleTempCollectionTest, RemovesOnlyOldTempArtifacts) {
    test::TempDir dir;
    Metrics metrics;
    StopSource stop;

    const std::string archive = dir.make_dir("archive");
    const std::time_t now = time(nullptr);

    const std::string stale = archive + "/2021/05/01/.seshat.tmp.123.456.photo.jpg";
    const std::string fresh = archive + "/2021/05/02/.seshat.tmp.123.789.clip.mov";
    const std::string photo = archive + "/2021/05/01/photo.jpg";
    test::write_file(stale, "partial");
    test::write_file(fresh, "partial");
    test::write_file(photo, "complete");
    test::set_mtime(stale, now - 3600);
    test::set_mtime(photo, now - 3600);

    EXPECT_EQ(collect_stale_temps(archive, 600, metrics, stop, now), 1u);

    EXPECT_FALSE(test::exists(stale));
    EXPECT_TRUE(test::exists(fresh));
    EXPECT_TRUE(test::exists(photo));
    // Date directories stay even when a temp was their only content
    EXPECT_TRUE(test::exists(archive + "/2021/05/01"));
    EXPECT_EQ(metrics.temp_gc_removed.load(), 1u);
}

TEST(StaleTempCollectionTest, StopRequestSkipsTheWalk) {
    test::TempDir dir;
    Metrics metrics;
    StopSource stop;
    stop.request_stop();

    const std::string archive = dir.make_dir("archive");
    const std::string stale = archive + "/.seshat.tmp.1.2.a.jpg";
    test::write_file(stale, "partial");
    test::set_mtime(stale, time(nullptr) - 3600);

    EXPECT_EQ(collect_stale_temps(archive, 600, metrics, stop), 0u);
    EXPECT_TRUE(test::exists(stale));
}

TEST(StaleTempCollectionTest, MissingArchiveIsHarmless) {
    test::TempDir dir;
    Metrics metrics;
    StopSource stop;
    EXPECT_EQ(collect_stale_temps(dir.file("nope"), 600, metrics, stop), 0u);
}

}
}
