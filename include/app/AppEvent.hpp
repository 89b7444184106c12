#pragma once
#include "storage/Models.hpp"
#include "utils/Errors.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace NewsDeck {

using BatchId = std::uint64_t;

struct FeedFetched {
    FeedId feedId = 0;
    BatchId batchId = 0;
    bool success = false;
    std::string title;
    std::string htmlUrl;
    std::string resolvedUrl;      // non-empty when autodiscovery moved the feed
    std::vector<ArticleDraft> articles;
    TaskError error;
};

struct ContentExtracted {
    ArticleId articleId = 0;
    bool success = false;
    std::string text;
    TaskError error;
};

struct RefreshBatchComplete {
    BatchId batchId = 0;
    size_t total = 0;
    size_t succeeded = 0;
    size_t failed = 0;
};

struct Tick {};

using AppEvent = std::variant<FeedFetched, ContentExtracted, RefreshBatchComplete, Tick>;

}
