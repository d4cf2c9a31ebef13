#include "seshat/reaper.hpp"
#include "seshat/fs_util.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

namespace seshat {
namespace {

class DirectoryReaperTest : public ::testing::Test {
protected:
    test::TempDir dir;
    Metrics metrics;
    std::string watch;

    void SetUp() override { watch = dir.make_dir("watch"); }
};

TEST_F(DirectoryReaperTest, RemovesEmptyChainUpToButExcludingWatchRoot) {
    const std::string leaf = dir.make_dir("watch/2024/trip/day1");
    DirectoryReaper reaper(watch, metrics);

    EXPECT_EQ(reaper.prune_empty_ancestors(leaf), 3u);
    EXPECT_FALSE(is_directory(watch + "/2024"));
    EXPECT_TRUE(is_directory(watch));
    EXPECT_EQ(metrics.dirs_pruned.load(), 3u);
}

TEST_F(DirectoryReaperTest, StopsAtFirstNonEmptyAncestor) {
    const std::string leaf = dir.make_dir("watch/a/b/c");
    test::write_file(watch + "/a/keep.jpg", "x");
    DirectoryReaper reaper(watch, metrics);

    EXPECT_EQ(reaper.prune_empty_ancestors(leaf), 2u);
    EXPECT_FALSE(is_directory(watch + "/a/b"));
    EXPECT_TRUE(is_directory(watch + "/a"));
}

TEST_F(DirectoryReaperTest, RemovesEmptySubdirectoriesBelowStart) {
    dir.make_dir("watch/a/x/y");
    dir.make_dir("watch/a/z");
    test::write_file(watch + "/a/file.jpg", "x");
    DirectoryReaper reaper(watch, metrics);

    EXPECT_EQ(reaper.prune_empty_ancestors(watch + "/a"), 3u);
    EXPECT_FALSE(is_directory(watch + "/a/x"));
    EXPECT_FALSE(is_directory(watch + "/a/z"));
    EXPECT_TRUE(is_directory(watch + "/a"));
}

TEST_F(DirectoryReaperTest, IgnoredDirectoriesAreLeftAlone) {
    dir.make_dir("watch/a/._failed_locked");
    dir.make_dir("watch/a/Thumbnail");
    DirectoryReaper reaper(watch, metrics);

    EXPECT_EQ(reaper.prune_empty_ancestors(watch + "/a"), 0u);
    EXPECT_TRUE(is_directory(watch + "/a/._failed_locked"));
    EXPECT_TRUE(is_directory(watch + "/a/Thumbnail"));
}

TEST_F(DirectoryReaperTest, NeverTouchesWatchRootOrOutside) {
    const std::string outside = dir.make_dir("elsewhere/empty");
    DirectoryReaper reaper(watch, metrics);

    EXPECT_EQ(reaper.prune_empty_ancestors(watch), 0u);
    EXPECT_TRUE(is_directory(watch));
    EXPECT_EQ(reaper.prune_empty_ancestors(outside), 0u);
    EXPECT_TRUE(is_directory(outside));
}

TEST_F(DirectoryReaperTest, PruningTheRootClearsEmptyTreesBelowIt) {
    dir.make_dir("watch/one/two");
    dir.make_dir("watch/three");
    test::write_file(watch + "/four/photo.jpg", "x");
    DirectoryReaper reaper(watch, metrics);

    EXPECT_EQ(reaper.prune_empty_ancestors(watch), 3u);
    EXPECT_FALSE(is_directory(watch + "/one"));
    EXPECT_FALSE(is_directory(watch + "/three"));
    EXPECT_TRUE(is_directory(watch + "/four"));
}

}
}
