#include "app/RefreshCoordinator.hpp"
#include <glib.h>
#include <mutex>

namespace NewsDeck {

struct RefreshCoordinator::BatchTracker {
    BatchId id;
    size_t total;
    size_t remaining;
    size_t succeeded = 0;
    size_t failed = 0;
    std::mutex mutex;

    BatchTracker(BatchId batchId, size_t count) : id(batchId), total(count), remaining(count) {}
};

RefreshCoordinator::RefreshCoordinator(TaskPool& pool, std::shared_ptr<EventChannel> channel,
                                       std::shared_ptr<FeedFetcher> fetcher)
    : pool_(pool), channel_(std::move(channel)), fetcher_(std::move(fetcher)), nextBatch_(1), lastSkipped_(0) {}

BatchId RefreshCoordinator::startBatch(const std::vector<RefreshTarget>& targets) {
    BatchId batchId = nextBatch_++;
    std::vector<RefreshTarget> launch;
    for (const auto& target : targets) {
        if (inFlight_.count(target.feedId)) continue;
        inFlight_.insert(target.feedId);
        launch.push_back(target);
    }
    lastSkipped_ = targets.size() - launch.size();
    if (lastSkipped_) g_debug("Batch %" G_GUINT64_FORMAT ": %zu feeds already refreshing", batchId, lastSkipped_);

    activeBatches_.insert(batchId);
    if (launch.empty()) {
        channel_->send(RefreshBatchComplete{batchId, 0, 0, 0});
        return batchId;
    }

    g_message("Refreshing %zu feeds (batch %" G_GUINT64_FORMAT ")", launch.size(), batchId);
    auto tracker = std::make_shared<BatchTracker>(batchId, launch.size());
    for (const auto& target : launch) {
        auto fetcher = fetcher_;
        auto channel = channel_;
        auto outcome = std::make_shared<bool>(false);
        FeedId feedId = target.feedId;
        std::string url = target.url;

        TaskSpec spec;
        spec.tag = "refresh:" + std::to_string(feedId);
        spec.work = [fetcher, feedId, batchId, url, outcome]() -> AppEvent {
            RetrievedFeed retrieved = retrieveFeed(*fetcher, url);
            FeedFetched event;
            event.feedId = feedId;
            event.batchId = batchId;
            event.success = retrieved.success;
            if (retrieved.success) {
                event.title = std::move(retrieved.feed.title);
                event.htmlUrl = std::move(retrieved.feed.htmlUrl);
                event.resolvedUrl = std::move(retrieved.resolvedUrl);
                event.articles = std::move(retrieved.feed.articles);
            } else {
                event.error = retrieved.error;
            }
            *outcome = retrieved.success;
            return event;
        };
        spec.recover = [feedId, batchId](const TaskError& error) -> AppEvent {
            FeedFetched event;
            event.feedId = feedId;
            event.batchId = batchId;
            event.error = error;
            return event;
        };
        spec.afterSend = [tracker, channel, outcome]() {
            std::lock_guard<std::mutex> lock(tracker->mutex);
            if (*outcome) {
                ++tracker->succeeded;
            } else {
                ++tracker->failed;
            }
            if (--tracker->remaining == 0) {
                channel->send(RefreshBatchComplete{tracker->id, tracker->total, tracker->succeeded, tracker->failed});
            }
        };
        pool_.spawn(std::move(spec));
    }
    return batchId;
}

void RefreshCoordinator::finishFeed(FeedId feedId) {
    inFlight_.erase(feedId);
}

void RefreshCoordinator::finishBatch(BatchId batchId) {
    activeBatches_.erase(batchId);
}

}
