#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace NewsDeck {

using FeedId = std::int64_t;
using CategoryId = std::int64_t;
using ArticleId = std::int64_t;

struct Category {
    CategoryId id = 0;
    std::string name;
    std::optional<CategoryId> parentId;
    bool collapsed = false;
};

struct Feed {
    FeedId id = 0;
    std::string url;
    std::string title;
    std::string htmlUrl;
    std::optional<CategoryId> categoryId;
    std::int64_t lastRefreshed = 0;   // unix seconds, 0 = never
    std::optional<std::string> lastError;
    int consecutiveFailures = 0;
    int unreadCount = 0;
};

struct Article {
    ArticleId id = 0;
    FeedId feedId = 0;
    std::string guid;
    std::string title;
    std::string link;
    std::int64_t published = 0;
    std::string summary;
    std::optional<std::string> content;
    bool read = false;
    bool starred = false;
};

// One entry as parsed from a feed document, before it has a row.
struct ArticleDraft {
    std::string guid;
    std::string title;
    std::string link;
    std::int64_t published = 0;
    std::string summary;
};

enum class ArticleFlag {
    Read,
    Starred
};

struct ArticleFilter {
    std::optional<FeedId> feedId;     // empty = all feeds
    std::string search;
    bool unreadOnly = false;
    bool starredOnly = false;
};

}
