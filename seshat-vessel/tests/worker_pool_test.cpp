#include "seshat/worker_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>

using namespace std::chrono_literals;

namespace seshat {
namespace {

TaskResult moved_to(const std::string& path) {
    MoveOutcome out;
    out.kind = OutcomeKind::Moved;
    out.destination = "/archive/" + path;
    return out;
}

// Handler that parks every task until release() is called.
class Gate {
    std::promise<void> started_;
    std::promise<void> release_;
    std::shared_future<void> released_;
    std::atomic<bool> signalled_{false};

public:
    Gate() : released_(release_.get_future().share()) {}

    TaskHandler handler() {
        return [this](const std::string& path) {
            if (!signalled_.exchange(true)) started_.set_value();
            released_.wait();
            return moved_to(path);
        };
    }

    void wait_started() { started_.get_future().wait(); }
    void release() { release_.set_value(); }
};

TEST(WorkerPoolTest, SubmitResolvesToHandlerResult) {
    StopSource stop;
    Metrics metrics;
    WorkerPool pool(2, moved_to, stop, metrics);

    auto fut = pool.submit("a.jpg");
    ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);

    TaskResult r = fut.get();
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->kind, OutcomeKind::Moved);
    EXPECT_EQ(r->destination, "/archive/a.jpg");
    EXPECT_EQ(pool.thread_count(), 2);
}

TEST(WorkerPoolTest, ThreadCountIsClamped) {
    StopSource stop;
    Metrics metrics;
    WorkerPool none(0, moved_to, stop, metrics);
    WorkerPool many(500, moved_to, stop, metrics);

    EXPECT_EQ(none.thread_count(), constants::MIN_WORKERS);
    EXPECT_EQ(many.thread_count(), constants::MAX_WORKERS);
}

TEST(WorkerPoolTest, FullQueueRejectsImmediately) {
    StopSource stop;
    Metrics metrics;
    Gate gate;
    WorkerPool pool(1, gate.handler(), stop, metrics, 2);

    auto running = pool.submit("running.jpg");
    gate.wait_started();

    auto q1 = pool.submit("q1.jpg");
    auto q2 = pool.submit("q2.jpg");
    auto rejected = pool.submit("overflow.jpg");

    EXPECT_EQ(rejected.wait_for(0s), std::future_status::ready);
    EXPECT_FALSE(rejected.get().has_value());
    EXPECT_EQ(metrics.queue_full_rejections.load(), 1u);
    EXPECT_EQ(pool.queue_size(), 2u);

    gate.release();
    EXPECT_TRUE(running.get().has_value());
    EXPECT_TRUE(q1.get().has_value());
    EXPECT_TRUE(q2.get().has_value());
}

TEST(WorkerPoolTest, BlockingSubmitWaitsForQueueSpace) {
    StopSource stop;
    Metrics metrics;
    Gate gate;
    WorkerPool pool(1, gate.handler(), stop, metrics, 1);

    auto running = pool.submit("running.jpg");
    gate.wait_started();
    auto queued = pool.submit("queued.jpg");

    auto waiter = std::async(std::launch::async, [&] { return pool.submit_blocking("waiting.jpg"); });
    EXPECT_EQ(waiter.wait_for(200ms), std::future_status::timeout);

    gate.release();
    ASSERT_EQ(waiter.wait_for(5s), std::future_status::ready);
    auto waited = waiter.get();

    EXPECT_TRUE(running.get().has_value());
    EXPECT_TRUE(queued.get().has_value());
    TaskResult r = waited.get();
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->destination, "/archive/waiting.jpg");
    EXPECT_EQ(metrics.queue_full_rejections.load(), 0u);
}

TEST(WorkerPoolTest, BlockingSubmitGivesUpOnShutdown) {
    StopSource stop;
    Metrics metrics;
    Gate gate;
    WorkerPool pool(1, gate.handler(), stop, metrics, 1);

    auto running = pool.submit("running.jpg");
    gate.wait_started();
    auto queued = pool.submit("queued.jpg");

    auto waiter = std::async(std::launch::async, [&] { return pool.submit_blocking("waiting.jpg"); });
    EXPECT_EQ(waiter.wait_for(100ms), std::future_status::timeout);

    stop.request_stop();
    ASSERT_EQ(waiter.wait_for(5s), std::future_status::ready);
    auto waited = waiter.get();
    ASSERT_EQ(waited.wait_for(0s), std::future_status::ready);
    EXPECT_FALSE(waited.get().has_value());

    gate.release();
    pool.stop();
    EXPECT_TRUE(running.get().has_value());
}

TEST(WorkerPoolTest, SubmitAfterStopResolvesToNothing) {
    StopSource stop;
    Metrics metrics;
    WorkerPool pool(1, moved_to, stop, metrics);
    pool.stop();

    auto fut = pool.submit("late.jpg");
    ASSERT_EQ(fut.wait_for(0s), std::future_status::ready);
    EXPECT_FALSE(fut.get().has_value());
}

TEST(WorkerPoolTest, HandlerExceptionPropagatesThroughFuture) {
    StopSource stop;
    Metrics metrics;
    WorkerPool pool(1, [](const std::string& path) -> TaskResult {
        if (path == "bad.jpg") throw std::runtime_error("handler failed");
        return moved_to(path);
    }, stop, metrics);

    auto bad = pool.submit("bad.jpg");
    auto good = pool.submit("good.jpg");

    EXPECT_THROW(bad.get(), std::runtime_error);
    // The worker survives the exception
    EXPECT_TRUE(good.get().has_value());
}

TEST(WorkerPoolTest, QueuedTasksAreAbandonedOnShutdown) {
    StopSource stop;
    Metrics metrics;
    Gate gate;
    WorkerPool pool(1, gate.handler(), stop, metrics);

    auto running = pool.submit("running.jpg");
    gate.wait_started();
    auto queued = pool.submit("queued.jpg");
    EXPECT_EQ(metrics.queued_tasks.load(), 1);

    stop.request_stop();
    gate.release();
    pool.stop();

    EXPECT_TRUE(running.get().has_value());
    ASSERT_EQ(queued.wait_for(0s), std::future_status::ready);
    EXPECT_FALSE(queued.get().has_value());
    EXPECT_EQ(metrics.queued_tasks.load(), 0);
}

}
}
