#include "seshat/dispatcher.hpp"
#include "seshat/fs_util.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

#include <unistd.h>

using namespace std::chrono_literals;

namespace seshat {
namespace {

// Outcome chosen by file name, every submission recorded.
class CannedHandler {
    std::mutex mtx_;
    std::map<std::string, int> calls_;

public:
    TaskResult operator()(const std::string& path) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            ++calls_[path];
        }

        const std::string name = base_name(path);
        if (name == "throw.jpg") throw std::runtime_error("worker blew up");
        if (name == "skip.jpg") return std::nullopt;

        MoveOutcome out;
        if (name == "dup.jpg") {
            out.kind = OutcomeKind::DuplicateSkipped;
        } else if (name == "bad.jpg") {
            out.kind = OutcomeKind::Failed;
            out.reason = "copy failed";
        } else {
            out.kind = OutcomeKind::Moved;
        }
        return out;
    }

    int calls_for(const std::string& path) {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = calls_.find(path);
        return it == calls_.end() ? 0 : it->second;
    }

    size_t distinct_paths() {
        std::lock_guard<std::mutex> lk(mtx_);
        return calls_.size();
    }
};

class DispatcherTest : public ::testing::Test {
protected:
    test::TempDir dir;
    std::string watch;
    StopSource stop;
    Metrics metrics;
    CannedHandler handler;
    std::unique_ptr<WorkerPool> pool;

    void SetUp() override {
        watch = dir.make_dir("watch");
        pool = std::make_unique<WorkerPool>(
            2, [this](const std::string& p) { return handler(p); }, stop, metrics);
    }

    void TearDown() override { pool->stop(); }

    std::unique_ptr<Dispatcher> make(std::chrono::milliseconds debounce = 50ms) {
        return std::make_unique<Dispatcher>(*pool, IngestFilter(watch), stop, metrics, debounce);
    }
};

TEST_F(DispatcherTest, EnumerateSkipsIgnoredDirectoriesAndNames) {
    test::write_file(watch + "/a.jpg", "x");
    test::write_file(watch + "/trip/b.CR2", "x");
    test::write_file(watch + "/trip/day2/c.mp4", "x");
    test::write_file(watch + "/notes.txt", "x");
    test::write_file(watch + "/.hidden.jpg", "x");
    test::write_file(watch + "/upload.jpg.part", "x");
    test::write_file(watch + "/tmp/d.jpg", "x");
    test::write_file(watch + "/Thumbnail/e.jpg", "x");
    test::write_file(watch + "/._failed_locked/f_locked_1.jpg", "x");
    ASSERT_EQ(symlink((watch + "/a.jpg").c_str(), (watch + "/link.jpg").c_str()), 0);

    auto dispatcher = make();
    std::vector<std::string> files = dispatcher->enumerate(watch);
    std::sort(files.begin(), files.end());

    const std::vector<std::string> expected = {
        watch + "/a.jpg",
        watch + "/trip/b.CR2",
        watch + "/trip/day2/c.mp4",
    };
    EXPECT_EQ(files, expected);
    // Regular files seen in descended directories, accepted or not
    EXPECT_EQ(metrics.files_scanned.load(), 6u);
}

TEST_F(DispatcherTest, InitialScanTalliesOutcomes) {
    for (const char* name : {"a.jpg", "dup.jpg", "bad.jpg", "skip.jpg", "throw.jpg"}) {
        test::write_file(watch + "/" + name, "x");
    }
    test::write_file(watch + "/readme.txt", "x");

    auto dispatcher = make();
    ScanSummary summary = dispatcher->initial_scan(watch);

    EXPECT_EQ(summary.discovered, 5u);
    EXPECT_EQ(summary.moved, 1u);
    EXPECT_EQ(summary.duplicates, 1u);
    EXPECT_EQ(summary.failed, 2u);
    EXPECT_EQ(summary.skipped, 1u);
    EXPECT_EQ(handler.calls_for(watch + "/readme.txt"), 0);
}

TEST_F(DispatcherTest, ScanLargerThanQueueDropsNothing) {
    for (int i = 0; i < 10; ++i) {
        test::write_file(watch + "/img" + std::to_string(i) + ".jpg", "x");
    }

    WorkerPool small(1, [this](const std::string& p) {
        std::this_thread::sleep_for(5ms);
        return handler(p);
    }, stop, metrics, 3);
    Dispatcher dispatcher(small, IngestFilter(watch), stop, metrics, 50ms);
    ScanSummary summary = dispatcher.initial_scan(watch);
    small.stop();

    EXPECT_EQ(summary.discovered, 10u);
    EXPECT_EQ(summary.moved, 10u);
    EXPECT_EQ(summary.skipped, 0u);
    EXPECT_EQ(metrics.queue_full_rejections.load(), 0u);
    EXPECT_EQ(handler.distinct_paths(), 10u);
}

TEST_F(DispatcherTest, EmptyTreeScansToEmptySummary) {
    dir.make_dir("watch/empty/nested");

    auto dispatcher = make();
    ScanSummary summary = dispatcher->initial_scan(watch);

    EXPECT_EQ(summary.discovered, 0u);
    EXPECT_EQ(handler.distinct_paths(), 0u);
}

TEST_F(DispatcherTest, ScanAfterStopDispatchesNothing) {
    test::write_file(watch + "/a.jpg", "x");
    stop.request_stop();

    auto dispatcher = make();
    ScanSummary summary = dispatcher->initial_scan(watch);

    EXPECT_EQ(summary.discovered, 0u);
    EXPECT_EQ(handler.distinct_paths(), 0u);
}

TEST_F(DispatcherTest, WatchEventsAreFilteredBeforeScheduling) {
    auto dispatcher = make();

    dispatcher->on_watch_event({watch + "/notes.txt", WatchEventKind::Created});
    dispatcher->on_watch_event({watch + "/.partial.jpg", WatchEventKind::Created});
    dispatcher->on_watch_event({watch + "/cache/a.jpg", WatchEventKind::Moved});
    dispatcher->on_watch_event({dir.file("elsewhere/a.jpg"), WatchEventKind::Created});
    EXPECT_EQ(dispatcher->pending_count(), 0u);

    dispatcher->on_watch_event({watch + "/a.jpg", WatchEventKind::Created});
    dispatcher->on_watch_event({watch + "/a.jpg", WatchEventKind::Moved});
    EXPECT_EQ(dispatcher->pending_count(), 1u);
}

TEST_F(DispatcherTest, BurstOfEventsYieldsOneSubmissionAfterQuietPeriod) {
    const std::string path = watch + "/burst.jpg";
    auto dispatcher = make(100ms);
    dispatcher->start();

    for (int i = 0; i < 5; ++i) {
        dispatcher->schedule(path);
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(handler.calls_for(path), 0);

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (handler.calls_for(path) == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(handler.calls_for(path), 1);

    std::this_thread::sleep_for(300ms);
    EXPECT_EQ(handler.calls_for(path), 1);
    EXPECT_EQ(dispatcher->pending_count(), 0u);

    dispatcher->stop();
}

TEST_F(DispatcherTest, StopLeavesPendingPathsUnsubmitted) {
    const std::string path = watch + "/late.jpg";
    auto dispatcher = make(10s);
    dispatcher->start();
    dispatcher->schedule(path);
    dispatcher->stop();

    EXPECT_EQ(handler.calls_for(path), 0);
    EXPECT_EQ(dispatcher->pending_count(), 1u);
}

}
}
