#include "app/EventChannel.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace NewsDeck;

static AppEvent fetched(FeedId feed, BatchId seq) {
    FeedFetched event;
    event.feedId = feed;
    event.batchId = seq;
    return event;
}

TEST(TestEventChannel, deliversInSendOrder)
{
    EventChannel channel;

    ASSERT_TRUE(channel.send(fetched(1, 0)));
    ASSERT_TRUE(channel.send(fetched(2, 0)));
    ASSERT_TRUE(channel.send(RefreshBatchComplete{7, 2, 2, 0}));

    auto first = channel.tryReceive();
    auto second = channel.tryReceive();
    auto third = channel.tryReceive();
    ASSERT_TRUE(first && second && third);
    EXPECT_EQ(1, std::get<FeedFetched>(*first).feedId);
    EXPECT_EQ(2, std::get<FeedFetched>(*second).feedId);
    EXPECT_EQ(7u, std::get<RefreshBatchComplete>(*third).batchId);
    EXPECT_FALSE(channel.tryReceive());
}

TEST(TestEventChannel, refusesAfterClose)
{
    EventChannel channel;
    channel.close();

    EXPECT_TRUE(channel.isClosed());
    EXPECT_FALSE(channel.send(Tick{}));
    EXPECT_EQ(0u, channel.pending());
}

TEST(TestEventChannel, receiveTimesOutWhenEmpty)
{
    EventChannel channel;

    EXPECT_FALSE(channel.receive(10 * 1000));
}

TEST(TestEventChannel, keepsPerProducerOrderAcrossThreads)
{
    const int producers = 4;
    const int perProducer = 200;
    EventChannel channel;

    std::vector<std::thread> threads;
    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([&channel, p]() {
            for (int i = 0; i < perProducer; ++i) channel.send(fetched(p, static_cast<BatchId>(i)));
        });
    }
    for (auto& t : threads) t.join();

    std::vector<BatchId> next(producers, 0);
    int received = 0;
    while (auto event = channel.tryReceive()) {
        const auto& f = std::get<FeedFetched>(*event);
        EXPECT_EQ(next[static_cast<size_t>(f.feedId)], f.batchId);
        next[static_cast<size_t>(f.feedId)] = f.batchId + 1;
        ++received;
    }
    EXPECT_EQ(producers * perProducer, received);
}

TEST(TestEventChannel, dispatchesOneEventPerIterationOnAttachedContext)
{
    GMainContext* context = g_main_context_new();
    EventChannel channel;
    std::vector<FeedId> seen;
    channel.attach(context, [&seen](AppEvent& event) { seen.push_back(std::get<FeedFetched>(event).feedId); });

    std::thread producer([&channel]() {
        channel.send(fetched(10, 0));
        channel.send(fetched(11, 0));
    });
    producer.join();

    gint64 deadline = g_get_monotonic_time() + Testing::kWait;
    while (seen.size() < 2 && g_get_monotonic_time() < deadline) g_main_context_iteration(context, TRUE);
    ASSERT_EQ(2u, seen.size());
    EXPECT_EQ(10, seen[0]);
    EXPECT_EQ(11, seen[1]);

    channel.detach();
    g_main_context_unref(context);
}
