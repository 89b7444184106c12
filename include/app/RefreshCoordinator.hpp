#pragma once
#include "app/AppEvent.hpp"
#include "app/EventChannel.hpp"
#include "app/TaskPool.hpp"
#include "services/FeedFetcher.hpp"
#include <map>
#include <memory>
#include <set>
#include <vector>

namespace NewsDeck {

struct RefreshTarget {
    FeedId feedId = 0;
    std::string url;
};

// Launches one fetch task per feed of a batch. Each task sends its own
// FeedFetched; whichever task finishes last also sends RefreshBatchComplete.
// Owned and driven by the main loop thread.
class RefreshCoordinator {
public:
    RefreshCoordinator(TaskPool& pool, std::shared_ptr<EventChannel> channel,
                       std::shared_ptr<FeedFetcher> fetcher);

    // Feeds already being fetched are skipped. With nothing to launch the
    // completion event is sent straight away.
    BatchId startBatch(const std::vector<RefreshTarget>& targets);

    // Called by the loop when a FeedFetched has been applied.
    void finishFeed(FeedId feedId);
    void finishBatch(BatchId batchId);

    bool isInFlight(FeedId feedId) const { return inFlight_.count(feedId) != 0; }
    size_t inFlightCount() const { return inFlight_.size(); }
    bool hasActiveBatch() const { return !activeBatches_.empty(); }
    // Feeds skipped by the last startBatch because they were still in flight.
    size_t lastSkipped() const { return lastSkipped_; }

private:
    struct BatchTracker;

    TaskPool& pool_;
    std::shared_ptr<EventChannel> channel_;
    std::shared_ptr<FeedFetcher> fetcher_;
    std::set<FeedId> inFlight_;
    std::set<BatchId> activeBatches_;
    BatchId nextBatch_;
    size_t lastSkipped_;
};

}
