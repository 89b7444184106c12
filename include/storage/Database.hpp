#pragma once
#include "storage/Models.hpp"
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace NewsDeck {

// SQLite-backed store for feeds, categories and articles. Every write is an
// upsert keyed so that replaying the same fetch never creates duplicate rows.
// Not thread-safe; owned and used by the event loop thread.
// All methods throw StorageError on failure.
class Database {
public:
    explicit Database(const std::string& path);
    ~Database();
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Removes the database file and its WAL/SHM siblings.
    static void destroy(const std::string& path);

    // Feeds
    FeedId upsertFeed(const std::string& url, const std::string& title,
                      std::optional<CategoryId> categoryId = std::nullopt,
                      const std::string& htmlUrl = "");
    std::vector<Feed> listFeeds() const;
    std::optional<Feed> getFeed(FeedId id) const;
    std::optional<Feed> findFeedByUrl(const std::string& url) const;
    // Returns the number of articles removed with the feed.
    size_t deleteFeed(FeedId id);
    void updateFeedUrl(FeedId id, const std::string& url);
    void updateFeedTitle(FeedId id, const std::string& title);
    void assignFeedCategory(FeedId id, std::optional<CategoryId> categoryId);
    void recordRefreshSuccess(FeedId id, std::int64_t refreshedAt);
    void recordRefreshFailure(FeedId id, const std::string& error);

    // Articles
    // Returns how many drafts were new rows.
    size_t upsertArticles(FeedId feedId, const std::vector<ArticleDraft>& drafts);
    std::vector<Article> listArticles(const ArticleFilter& filter) const;
    std::optional<Article> getArticle(ArticleId id) const;
    size_t countArticles(std::optional<FeedId> feedId) const;
    void setArticleFlag(ArticleId id, ArticleFlag flag, bool value);
    void setArticleContent(ArticleId id, const std::string& content);
    size_t markAllRead(std::optional<FeedId> feedId);

    // Categories
    CategoryId createCategory(const std::string& name, std::optional<CategoryId> parentId);
    CategoryId findOrCreateCategory(const std::string& name, std::optional<CategoryId> parentId);
    void renameCategory(CategoryId id, const std::string& name);
    // Rejects moves that would make the category its own ancestor.
    void moveCategory(CategoryId id, std::optional<CategoryId> parentId);
    void setCategoryCollapsed(CategoryId id, bool collapsed);
    // Member feeds become uncategorised; child categories move up one level.
    void deleteCategory(CategoryId id);
    std::vector<Category> listCategories() const;

private:
    void exec(const char* sql);
    void migrate();
    std::optional<CategoryId> parentOf(CategoryId id) const;

    sqlite3* db_;
};

}
