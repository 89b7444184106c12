#include "app/TaskPool.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <set>

using namespace NewsDeck;

static TaskSpec sleepingTask(ArticleId id, std::atomic<int>& running, std::atomic<int>& peak) {
    TaskSpec spec;
    spec.tag = "sleep";
    spec.work = [id, &running, &peak]() -> AppEvent {
        int now = ++running;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
        g_usleep(20 * 1000);
        --running;
        ContentExtracted event;
        event.articleId = id;
        event.success = true;
        return event;
    };
    spec.recover = [id](const TaskError& error) -> AppEvent {
        ContentExtracted event;
        event.articleId = id;
        event.error = error;
        return event;
    };
    return spec;
}

TEST(TestTaskPool, neverRunsMoreThanTheSlotLimit)
{
    auto channel = std::make_shared<EventChannel>();
    TaskPool pool(channel, 10);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    for (ArticleId id = 1; id <= 25; ++id) pool.spawn(sleepingTask(id, running, peak));

    std::set<ArticleId> done;
    while (done.size() < 25) {
        auto event = channel->receive(Testing::kWait);
        ASSERT_TRUE(event);
        const auto& extracted = std::get<ContentExtracted>(*event);
        EXPECT_TRUE(extracted.success);
        done.insert(extracted.articleId);
    }
    EXPECT_LE(peak.load(), 10);
    EXPECT_LE(pool.peakRunning(), 10);
    EXPECT_GT(peak.load(), 1);
}

TEST(TestTaskPool, convertsThrowingTaskIntoErrorEvent)
{
    auto channel = std::make_shared<EventChannel>();
    TaskPool pool(channel, 2);

    TaskSpec spec;
    spec.tag = "boom";
    spec.work = []() -> AppEvent { throw std::runtime_error("kaboom"); };
    spec.recover = [](const TaskError& error) -> AppEvent {
        ContentExtracted event;
        event.articleId = 42;
        event.error = error;
        return event;
    };
    pool.spawn(std::move(spec));

    auto event = channel->receive(Testing::kWait);
    ASSERT_TRUE(event);
    const auto& extracted = std::get<ContentExtracted>(*event);
    EXPECT_EQ(42, extracted.articleId);
    EXPECT_FALSE(extracted.success);
    EXPECT_EQ(ErrorKind::Crashed, extracted.error.kind);
    EXPECT_EQ("kaboom", extracted.error.message);
}

TEST(TestTaskPool, runsAfterSendOnceTheEventIsQueued)
{
    auto channel = std::make_shared<EventChannel>();
    TaskPool pool(channel, 1);
    std::atomic<size_t> pendingSeen{0};

    TaskSpec spec;
    spec.tag = "after";
    spec.work = []() -> AppEvent { return Tick{}; };
    spec.recover = [](const TaskError&) -> AppEvent { return Tick{}; };
    spec.afterSend = [channel, &pendingSeen]() { pendingSeen = channel->pending(); };
    pool.spawn(std::move(spec));
    pool.shutdown(true);

    EXPECT_EQ(1u, pendingSeen.load());
}

TEST(TestTaskPool, dropsResultsAfterChannelCloses)
{
    auto channel = std::make_shared<EventChannel>();
    TaskPool pool(channel, 1);
    channel->close();

    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    pool.spawn(sleepingTask(1, running, peak));
    pool.shutdown(true);

    EXPECT_EQ(0u, channel->pending());
}
