#pragma once
#include "app/AppEvent.hpp"
#include "storage/Models.hpp"
#include <glib.h>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace NewsDeck {

enum class View {
    Browse,
    Reader
};

enum class Focus {
    Categories,
    Feeds,
    Articles
};

enum class InputMode {
    Normal,
    Search,
    Subscribe,
    NewCategory,
    Rename,
    PickCategory,
    ConfirmDelete
};

enum class TargetKind {
    Feed,
    Category
};

// The feed or category a prompt, picker or confirmation acts on.
struct Target {
    TargetKind kind = TargetKind::Feed;
    std::int64_t id = 0;
};

enum class ContentPhase {
    Idle,
    Loading,
    Loaded,
    Failed
};

struct ContentState {
    ContentPhase phase = ContentPhase::Idle;
    std::string content;
    std::string error;
};

struct CategoryRow {
    std::optional<CategoryId> id;     // empty = every feed
    std::string name;
    int depth = 0;
    bool hasChildren = false;
    bool collapsed = false;
    int unread = 0;
};

// Everything the screen shows. Only the main loop thread reads or writes it.
struct AppState {
    View view = View::Browse;
    Focus focus = Focus::Feeds;
    InputMode mode = InputMode::Normal;

    std::string search;               // applied filter, empty = none
    std::string input;                // text being typed at a prompt
    std::optional<Target> target;
    size_t pickerCursor = 0;

    std::vector<Category> categories;
    std::vector<Feed> feeds;
    std::vector<Article> articles;
    std::optional<FeedId> articleScope;   // feed whose articles are listed, empty = all
    bool starredOnly = false;
    bool unreadOnly = false;

    size_t categoryCursor = 0;
    size_t feedCursor = 0;
    size_t articleCursor = 0;

    std::optional<ArticleId> readerArticleId;
    std::optional<Article> pinnedArticle;   // reader article no longer in the filtered list
    size_t readerScroll = 0;
    std::map<ArticleId, ContentState> content;

    size_t refreshPending = 0;        // feeds of running batches not yet reported
    gint64 lastRefreshAll = 0;        // monotonic microseconds
    std::optional<RefreshBatchComplete> lastBatch;

    std::string status;
    bool statusIsError = false;
    gint64 statusSetAt = 0;
    unsigned spinnerFrame = 0;

    bool needsRedraw = true;
    bool quit = false;

    std::vector<CategoryRow> categoryRows() const;
    // Destinations for a move: "no category" first, then every category
    // except a moving category's own subtree.
    std::vector<CategoryRow> pickerRows() const;
    std::optional<CategoryId> selectedCategory() const;
    std::vector<const Feed*> visibleFeeds() const;
    const Feed* selectedFeed() const;
    const Article* selectedArticle() const;
    const Article* readerArticle() const;
    Article* findArticle(ArticleId id);
    Feed* findFeed(FeedId id);

    ContentState contentOf(ArticleId id) const;

    void clampCursors();
    void setStatus(const std::string& message, gint64 now, bool error = false);
};

}
