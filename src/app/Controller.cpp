#include "app/Controller.hpp"
#include "storage/OpmlImport.hpp"
#include "utils/Opml.hpp"
#include "utils/UrlValidator.hpp"
#include <algorithm>
#include <variant>

namespace NewsDeck {

struct EventVisitor {
    Controller& controller;
    gint64 now;

    void operator()(const FeedFetched& event) const { controller.onFeedFetched(event, now); }
    void operator()(const ContentExtracted& event) const { controller.onContentExtracted(event, now); }
    void operator()(const RefreshBatchComplete& event) const { controller.onBatchComplete(event, now); }
    void operator()(const Tick&) const { controller.handleTick(now); }
};

static std::int64_t wallClockSeconds() {
    return g_get_real_time() / G_USEC_PER_SEC;
}

Controller::Controller(AppState& state, Database& db, RefreshCoordinator& refresher, ContentLoader& loader,
                       ControllerSettings settings)
    : state_(state), db_(db), refresher_(refresher), loader_(loader), settings_(std::move(settings)),
      pageSize_(10) {}

void Controller::loadFromStorage() {
    state_.categories = db_.listCategories();
    reloadFeeds();
    reloadArticles();
}

void Controller::reloadFeeds() {
    state_.categories = db_.listCategories();
    state_.feeds = db_.listFeeds();
    state_.clampCursors();
    state_.needsRedraw = true;
}

void Controller::reloadArticles() {
    std::optional<ArticleId> selected;
    if (const Article* a = state_.selectedArticle()) selected = a->id;

    ArticleFilter filter;
    filter.feedId = state_.articleScope;
    filter.search = state_.search;
    filter.starredOnly = state_.starredOnly;
    filter.unreadOnly = state_.unreadOnly;
    state_.articles = db_.listArticles(filter);

    // Keep the cursor on the same article when it is still listed.
    if (selected) {
        auto it = std::find_if(state_.articles.begin(), state_.articles.end(),
                               [&](const Article& a) { return a.id == *selected; });
        if (it != state_.articles.end()) state_.articleCursor = static_cast<size_t>(it - state_.articles.begin());
    }
    // An open article that no longer matches the filter stays readable.
    state_.pinnedArticle.reset();
    if (state_.view == View::Reader && state_.readerArticleId && !state_.readerArticle()) {
        state_.pinnedArticle = db_.getArticle(*state_.readerArticleId);
        if (!state_.pinnedArticle) {
            state_.view = View::Browse;
            state_.readerArticleId.reset();
        }
    }
    state_.clampCursors();
    state_.needsRedraw = true;
}

void Controller::handleCommand(const Command& command, gint64 now) {
    try {
        dispatch(command, now);
    } catch (const StorageError& e) {
        g_warning("Storage error: %s", e.what());
        state_.setStatus(std::string("Storage error: ") + e.what(), now, true);
    }
}

void Controller::handleEvent(AppEvent& event, gint64 now) {
    try {
        std::visit(EventVisitor{*this, now}, event);
    } catch (const StorageError& e) {
        g_warning("Storage error while applying result: %s", e.what());
        state_.setStatus(std::string("Storage error: ") + e.what(), now, true);
    }
}

void Controller::handleTick(gint64 now) {
    bool loading = std::any_of(state_.content.begin(), state_.content.end(),
                               [](const auto& entry) { return entry.second.phase == ContentPhase::Loading; });
    if (loading || state_.refreshPending > 0) {
        ++state_.spinnerFrame;
        state_.needsRedraw = true;
    }

    if (!state_.status.empty() &&
        now - state_.statusSetAt >= static_cast<gint64>(settings_.statusTimeoutSeconds) * G_USEC_PER_SEC) {
        state_.status.clear();
        state_.statusIsError = false;
        state_.needsRedraw = true;
    }

    if (settings_.refreshIntervalMinutes > 0 && !refresher_.hasActiveBatch()) {
        gint64 interval = static_cast<gint64>(settings_.refreshIntervalMinutes) * 60 * G_USEC_PER_SEC;
        if (now - state_.lastRefreshAll >= interval) {
            g_message("Automatic refresh");
            try {
                refreshAll(now);
            } catch (const StorageError& e) {
                g_warning("Automatic refresh failed: %s", e.what());
                state_.lastRefreshAll = now;
            }
        }
    }
}

void Controller::refreshAll(gint64 now) {
    std::vector<RefreshTarget> targets;
    size_t broken = 0;
    for (const auto& feed : db_.listFeeds()) {
        if (feed.consecutiveFailures >= settings_.failureThreshold) {
            ++broken;
            continue;
        }
        targets.push_back({feed.id, feed.url});
    }
    state_.lastRefreshAll = now;
    refresher_.startBatch(targets);
    size_t launched = targets.size() - refresher_.lastSkipped();
    state_.refreshPending += launched;

    std::string message = "Refreshing " + std::to_string(launched) + " feeds";
    if (broken) message += " (" + std::to_string(broken) + " failing feeds skipped)";
    state_.setStatus(message, now);
}

void Controller::refreshFeed(FeedId feedId, gint64 now) {
    std::optional<Feed> feed = db_.getFeed(feedId);
    if (!feed) return;
    if (refresher_.isInFlight(feedId)) {
        state_.setStatus(feed->title + " is already refreshing", now);
        return;
    }
    refresher_.startBatch({{feed->id, feed->url}});
    ++state_.refreshPending;
    state_.setStatus("Refreshing " + feed->title, now);
}

void Controller::onFeedFetched(const FeedFetched& event, gint64 /*now*/) {
    refresher_.finishFeed(event.feedId);
    if (state_.refreshPending > 0) --state_.refreshPending;
    state_.needsRedraw = true;

    std::optional<Feed> feed = db_.getFeed(event.feedId);
    if (!feed) {
        g_debug("Dropping refresh result for deleted feed %" G_GINT64_FORMAT, event.feedId);
        return;
    }

    if (!event.success) {
        std::string error = event.error.describe();
        g_message("Refresh of %s failed: %s", feed->url.c_str(), error.c_str());
        db_.recordRefreshFailure(event.feedId, error);
        reloadFeeds();
        return;
    }

    if (!event.resolvedUrl.empty() && event.resolvedUrl != feed->url) {
        try {
            db_.updateFeedUrl(event.feedId, event.resolvedUrl);
            g_message("Feed %s moved to %s", feed->url.c_str(), event.resolvedUrl.c_str());
        } catch (const StorageError& e) {
            g_warning("Keeping %s: %s", feed->url.c_str(), e.what());
        }
    }
    if (!event.title.empty() && (feed->title.empty() || feed->title == feed->url)) {
        db_.updateFeedTitle(event.feedId, event.title);
    }
    size_t inserted = db_.upsertArticles(event.feedId, event.articles);
    db_.recordRefreshSuccess(event.feedId, wallClockSeconds());
    g_debug("Feed %s: %zu entries, %zu new", feed->url.c_str(), event.articles.size(), inserted);

    reloadFeeds();
    if (!state_.articleScope || *state_.articleScope == event.feedId) reloadArticles();
}

void Controller::onContentExtracted(const ContentExtracted& event, gint64 now) {
    bool onScreen = loader_.apply(state_, event);
    if (event.success) {
        db_.setArticleContent(event.articleId, event.text);
    } else {
        g_message("Content extraction for article %" G_GINT64_FORMAT " failed: %s", event.articleId,
                  event.error.describe().c_str());
        if (onScreen) state_.setStatus("Full text unavailable, showing summary", now, true);
    }
    if (onScreen) state_.needsRedraw = true;
}

void Controller::onBatchComplete(const RefreshBatchComplete& event, gint64 now) {
    refresher_.finishBatch(event.batchId);
    state_.lastBatch = event;
    if (event.total == 0) {
        state_.setStatus("Nothing to refresh", now);
        return;
    }
    std::string message = "Refreshed " + std::to_string(event.total) + " feeds: " +
                          std::to_string(event.succeeded) + " ok, " + std::to_string(event.failed) + " failed";
    g_message("%s", message.c_str());
    state_.setStatus(message, now, event.failed > 0);
}

void Controller::dispatch(const Command& command, gint64 now) {
    switch (command.kind) {
        case CommandKind::None:
            return;
        case CommandKind::Quit:
            state_.quit = true;
            return;
        case CommandKind::Resize:
            break;
        case CommandKind::MoveUp: move(-1); break;
        case CommandKind::MoveDown: move(1); break;
        case CommandKind::PageUp: move(-static_cast<long>(pageSize_)); break;
        case CommandKind::PageDown: move(static_cast<long>(pageSize_)); break;
        case CommandKind::Top: moveTo(false); break;
        case CommandKind::Bottom: moveTo(true); break;
        case CommandKind::NextFocus: cycleFocus(true); break;
        case CommandKind::PrevFocus: cycleFocus(false); break;
        case CommandKind::Open: open(); break;
        case CommandKind::Back: back(); break;
        case CommandKind::ToggleCollapse: toggleCollapse(); break;
        case CommandKind::StartSearch:
            state_.mode = InputMode::Search;
            state_.input = state_.search;
            break;
        case CommandKind::StartSubscribe:
            state_.mode = InputMode::Subscribe;
            state_.input.clear();
            break;
        case CommandKind::InputChar:
            state_.input += command.text;
            break;
        case CommandKind::InputBackspace:
            // Drop the last UTF-8 character.
            while (!state_.input.empty()) {
                unsigned char c = static_cast<unsigned char>(state_.input.back());
                state_.input.pop_back();
                if ((c & 0xC0) != 0x80) break;
            }
            break;
        case CommandKind::InputCommit: commitInput(now); break;
        case CommandKind::InputCancel:
            state_.mode = InputMode::Normal;
            state_.input.clear();
            state_.target.reset();
            break;
        case CommandKind::RefreshAll: refreshAll(now); break;
        case CommandKind::RefreshFeed:
            if (auto feed = currentFeed()) {
                refreshFeed(*feed, now);
            } else {
                state_.setStatus("No feed selected", now);
            }
            break;
        case CommandKind::Delete:
            if (auto target = focusedTarget()) {
                state_.target = target;
                state_.mode = InputMode::ConfirmDelete;
            }
            break;
        case CommandKind::Confirm: confirmDelete(now); break;
        case CommandKind::Deny:
            state_.target.reset();
            state_.mode = InputMode::Normal;
            break;
        case CommandKind::NewCategory:
            if (state_.view != View::Browse) break;
            state_.target.reset();
            if (state_.focus == Focus::Categories) {
                if (auto parent = state_.selectedCategory()) state_.target = Target{TargetKind::Category, *parent};
            }
            state_.mode = InputMode::NewCategory;
            state_.input.clear();
            break;
        case CommandKind::Rename:
            if (auto target = focusedTarget()) {
                state_.target = target;
                state_.mode = InputMode::Rename;
                state_.input = targetName(*target);
            }
            break;
        case CommandKind::MoveToCategory:
            if (auto target = focusedTarget()) {
                state_.target = target;
                state_.mode = InputMode::PickCategory;
                state_.pickerCursor = 0;
            }
            break;
        case CommandKind::ToggleStarredOnly:
            state_.starredOnly = !state_.starredOnly;
            if (state_.starredOnly) {
                state_.articleScope.reset();
                if (state_.view == View::Browse) state_.focus = Focus::Articles;
            }
            state_.articleCursor = 0;
            reloadArticles();
            state_.setStatus(state_.starredOnly ? "Showing starred articles" : "Showing all articles", now);
            break;
        case CommandKind::ToggleUnreadOnly:
            state_.unreadOnly = !state_.unreadOnly;
            state_.articleCursor = 0;
            reloadArticles();
            state_.setStatus(state_.unreadOnly ? "Showing unread articles" : "Showing read and unread articles",
                             now);
            break;
        case CommandKind::ToggleStar: toggleFlag(ArticleFlag::Starred, now); break;
        case CommandKind::ToggleRead: toggleFlag(ArticleFlag::Read, now); break;
        case CommandKind::MarkAllRead: markAllRead(now); break;
        case CommandKind::OpenInBrowser: openInBrowser(now); break;
        case CommandKind::ReloadContent:
            if (state_.view == View::Reader) {
                if (const Article* article = state_.readerArticle()) loader_.request(state_, *article, true);
            }
            break;
        case CommandKind::ExportOpml: exportSubscriptions(now); break;
    }
    state_.needsRedraw = true;
}

void Controller::move(long delta) {
    if (state_.mode == InputMode::PickCategory) {
        size_t count = state_.pickerRows().size();
        long target = static_cast<long>(state_.pickerCursor) + delta;
        target = std::max(0L, std::min(target, static_cast<long>(count) - 1));
        state_.pickerCursor = static_cast<size_t>(target);
        return;
    }
    if (state_.view == View::Reader) {
        long scroll = static_cast<long>(state_.readerScroll) + delta;
        state_.readerScroll = scroll < 0 ? 0 : static_cast<size_t>(scroll);
        return;
    }
    size_t* cursor = nullptr;
    size_t count = 0;
    switch (state_.focus) {
        case Focus::Categories:
            cursor = &state_.categoryCursor;
            count = state_.categoryRows().size();
            break;
        case Focus::Feeds:
            cursor = &state_.feedCursor;
            count = state_.visibleFeeds().size();
            break;
        case Focus::Articles:
            cursor = &state_.articleCursor;
            count = state_.articles.size();
            break;
    }
    if (count == 0) return;
    long target = static_cast<long>(*cursor) + delta;
    target = std::max(0L, std::min(target, static_cast<long>(count) - 1));
    *cursor = static_cast<size_t>(target);
    if (state_.focus == Focus::Categories) state_.feedCursor = 0;
}

void Controller::moveTo(bool bottom) {
    if (state_.view == View::Reader) {
        if (!bottom) state_.readerScroll = 0;
        return;
    }
    move(bottom ? static_cast<long>(G_MAXINT) : -static_cast<long>(G_MAXINT));
}

void Controller::cycleFocus(bool forward) {
    if (state_.view != View::Browse) return;
    static const Focus order[] = {Focus::Categories, Focus::Feeds, Focus::Articles};
    int index = static_cast<int>(state_.focus);
    index = (index + (forward ? 1 : 2)) % 3;
    state_.focus = order[index];
}

void Controller::open() {
    if (state_.view == View::Reader) return;
    switch (state_.focus) {
        case Focus::Categories:
            state_.feedCursor = 0;
            state_.focus = Focus::Feeds;
            break;
        case Focus::Feeds: {
            const Feed* feed = state_.selectedFeed();
            if (!feed) return;
            state_.articleScope = feed->id;
            state_.articleCursor = 0;
            reloadArticles();
            state_.focus = Focus::Articles;
            break;
        }
        case Focus::Articles:
            if (const Article* article = state_.selectedArticle()) openArticle(*article);
            break;
    }
}

void Controller::openArticle(const Article& article) {
    state_.view = View::Reader;
    state_.readerArticleId = article.id;
    state_.readerScroll = 0;
    ArticleId id = article.id;

    if (settings_.markReadOnOpen && !article.read) {
        db_.setArticleFlag(id, ArticleFlag::Read, true);
        if (Article* a = state_.findArticle(id)) a->read = true;
        if (Feed* f = state_.findFeed(article.feedId)) f->unreadCount = std::max(0, f->unreadCount - 1);
    }
    if (const Article* a = state_.readerArticle()) loader_.request(state_, *a, false);
}

void Controller::back() {
    if (state_.view == View::Reader) {
        state_.view = View::Browse;
        state_.readerArticleId.reset();
        state_.pinnedArticle.reset();
        return;
    }
    if (state_.focus == Focus::Articles) {
        state_.focus = Focus::Feeds;
    } else if (state_.focus == Focus::Feeds) {
        state_.focus = Focus::Categories;
    } else if (state_.articleScope) {
        state_.articleScope.reset();
        reloadArticles();
    }
}

void Controller::toggleCollapse() {
    if (state_.view != View::Browse || state_.focus != Focus::Categories) return;
    std::vector<CategoryRow> rows = state_.categoryRows();
    if (state_.categoryCursor >= rows.size() || !rows[state_.categoryCursor].id) return;
    const CategoryRow& row = rows[state_.categoryCursor];
    if (!row.hasChildren) return;
    db_.setCategoryCollapsed(*row.id, !row.collapsed);
    reloadFeeds();
}

void Controller::commitInput(gint64 now) {
    InputMode mode = state_.mode;
    std::string text = state_.input;
    std::optional<Target> target = state_.target;
    std::vector<CategoryRow> destinations;
    if (mode == InputMode::PickCategory) destinations = state_.pickerRows();
    state_.mode = InputMode::Normal;
    state_.input.clear();
    state_.target.reset();

    if (mode == InputMode::Search) {
        state_.search = text;
        state_.articleCursor = 0;
        reloadArticles();
        if (!text.empty()) {
            state_.setStatus(std::to_string(state_.articles.size()) + " matches for \"" + text + "\"", now);
        }
        if (state_.view == View::Browse) state_.focus = Focus::Articles;
    } else if (mode == InputMode::Subscribe) {
        subscribe(text, now);
    } else if (mode == InputMode::NewCategory) {
        std::string name = trimmed(text);
        if (name.empty()) {
            state_.setStatus("Name cannot be empty", now, true);
            return;
        }
        std::optional<CategoryId> parent;
        if (target) parent = target->id;
        db_.createCategory(name, parent);
        g_message("Created category %s", name.c_str());
        reloadFeeds();
        state_.setStatus("Created category " + name, now);
    } else if (mode == InputMode::Rename && target) {
        renameTarget(*target, trimmed(text), now);
    } else if (mode == InputMode::PickCategory && target) {
        if (state_.pickerCursor >= destinations.size()) return;
        const CategoryRow& destination = destinations[state_.pickerCursor];
        if (target->kind == TargetKind::Feed) {
            db_.assignFeedCategory(target->id, destination.id);
        } else {
            db_.moveCategory(target->id, destination.id);
        }
        reloadFeeds();
        state_.setStatus("Moved " + targetName(*target) + " to " + destination.name, now);
    }
}

std::string Controller::trimmed(const std::string& text) {
    std::string result = text;
    result.erase(0, result.find_first_not_of(" \t"));
    result.erase(result.find_last_not_of(" \t") + 1);
    return result;
}

std::optional<Target> Controller::focusedTarget() const {
    if (state_.view != View::Browse) return std::nullopt;
    if (state_.focus == Focus::Feeds) {
        if (const Feed* feed = state_.selectedFeed()) return Target{TargetKind::Feed, feed->id};
    } else if (state_.focus == Focus::Categories) {
        if (auto category = state_.selectedCategory()) return Target{TargetKind::Category, *category};
    }
    return std::nullopt;
}

std::string Controller::targetName(const Target& target) const {
    if (target.kind == TargetKind::Feed) {
        for (const auto& f : state_.feeds) {
            if (f.id == target.id) return f.title;
        }
    } else {
        for (const auto& c : state_.categories) {
            if (c.id == target.id) return c.name;
        }
    }
    return {};
}

void Controller::renameTarget(const Target& target, const std::string& name, gint64 now) {
    if (name.empty()) {
        state_.setStatus("Name cannot be empty", now, true);
        return;
    }
    if (target.kind == TargetKind::Feed) {
        db_.updateFeedTitle(target.id, name);
    } else {
        db_.renameCategory(target.id, name);
    }
    reloadFeeds();
    reloadArticles();
    state_.setStatus("Renamed to " + name, now);
}

void Controller::subscribe(const std::string& input, gint64 now) {
    std::string url = trimmed(input);
    if (url.empty()) return;
    std::string problem = UrlValidator::checkRemote(url);
    if (!problem.empty()) {
        state_.setStatus("Cannot subscribe: " + problem, now, true);
        return;
    }
    if (std::optional<Feed> existing = db_.findFeedByUrl(url)) {
        state_.setStatus("Already subscribed to " + existing->title, now);
        return;
    }
    FeedId id = db_.upsertFeed(url, url, state_.selectedCategory());
    g_message("Subscribed to %s", url.c_str());
    reloadFeeds();
    refreshFeed(id, now);
}

void Controller::confirmDelete(gint64 now) {
    state_.mode = InputMode::Normal;
    if (!state_.target) return;
    Target target = *state_.target;
    state_.target.reset();

    if (target.kind == TargetKind::Category) {
        std::string name = targetName(target);
        db_.deleteCategory(target.id);
        g_message("Deleted category %s", name.c_str());
        reloadFeeds();
        state_.setStatus("Deleted category " + name, now);
        return;
    }

    FeedId id = target.id;
    std::optional<Feed> feed = db_.getFeed(id);
    if (!feed) return;
    size_t removed = db_.deleteFeed(id);
    g_message("Deleted feed %s with %zu articles", feed->url.c_str(), removed);
    if (state_.articleScope == id) state_.articleScope.reset();
    for (auto it = state_.content.begin(); it != state_.content.end();) {
        Article* a = state_.findArticle(it->first);
        it = (a && a->feedId == id) ? state_.content.erase(it) : std::next(it);
    }
    reloadFeeds();
    reloadArticles();
    state_.setStatus("Deleted " + feed->title + " (" + std::to_string(removed) + " articles)", now);
}

const Article* Controller::currentArticle() const {
    if (state_.view == View::Reader) return state_.readerArticle();
    if (state_.focus == Focus::Articles) return state_.selectedArticle();
    return nullptr;
}

std::optional<FeedId> Controller::currentFeed() const {
    if (state_.view == View::Reader) {
        if (const Article* a = state_.readerArticle()) return a->feedId;
        return std::nullopt;
    }
    if (state_.focus == Focus::Feeds) {
        if (const Feed* f = state_.selectedFeed()) return f->id;
        return std::nullopt;
    }
    if (state_.focus == Focus::Articles) return state_.articleScope;
    return std::nullopt;
}

void Controller::toggleFlag(ArticleFlag flag, gint64 now) {
    const Article* article = currentArticle();
    if (!article) return;
    ArticleId id = article->id;
    bool value = flag == ArticleFlag::Read ? !article->read : !article->starred;
    db_.setArticleFlag(id, flag, value);
    if (Article* a = state_.findArticle(id)) {
        if (flag == ArticleFlag::Read) {
            a->read = value;
        } else {
            a->starred = value;
        }
    }
    if (flag == ArticleFlag::Read) {
        state_.feeds = db_.listFeeds();
    } else {
        state_.setStatus(value ? "Starred" : "Unstarred", now);
    }
}

void Controller::markAllRead(gint64 now) {
    std::optional<FeedId> scope = state_.view == View::Browse && state_.focus == Focus::Feeds
        ? currentFeed() : state_.articleScope;
    size_t changed = db_.markAllRead(scope);
    reloadFeeds();
    reloadArticles();
    state_.setStatus("Marked " + std::to_string(changed) + " articles read", now);
}

void Controller::openInBrowser(gint64 now) {
    const Article* article = currentArticle();
    if (!article || article->link.empty()) {
        state_.setStatus("Nothing to open", now);
        return;
    }
    std::string link = article->link;
    ArticleId id = article->id;
    bool wasRead = article->read;
    std::string problem = UrlValidator::checkForOpen(link);
    if (!problem.empty()) {
        g_message("Refusing to open %s: %s", link.c_str(), problem.c_str());
        state_.setStatus("Refusing to open link: " + problem, now, true);
        return;
    }

    gchar* argv[] = {const_cast<gchar*>(settings_.browser.c_str()), const_cast<gchar*>(link.c_str()), nullptr};
    GError* error = nullptr;
    auto flags = static_cast<GSpawnFlags>(G_SPAWN_SEARCH_PATH | G_SPAWN_STDOUT_TO_DEV_NULL |
                                          G_SPAWN_STDERR_TO_DEV_NULL);
    if (!g_spawn_async(nullptr, argv, nullptr, flags, nullptr, nullptr, nullptr, &error)) {
        std::string message = error ? error->message : "unknown error";
        g_clear_error(&error);
        g_warning("Cannot launch %s: %s", settings_.browser.c_str(), message.c_str());
        state_.setStatus("Cannot launch " + settings_.browser + ": " + message, now, true);
        return;
    }
    if (settings_.markReadOnOpen && !wasRead) {
        db_.setArticleFlag(id, ArticleFlag::Read, true);
        if (Article* a = state_.findArticle(id)) a->read = true;
        state_.feeds = db_.listFeeds();
    }
    state_.setStatus("Opened in browser", now);
}

void Controller::exportSubscriptions(gint64 now) {
    if (settings_.exportPath.empty()) return;
    try {
        OpmlDocument document = exportOpml(db_);
        Opml::writeFile(settings_.exportPath, document);
        state_.setStatus("Exported " + std::to_string(Opml::countFeeds(document.outlines)) + " feeds to " +
                         settings_.exportPath, now);
    } catch (const OpmlError& e) {
        g_warning("OPML export failed: %s", e.what());
        state_.setStatus(std::string("Export failed: ") + e.what(), now, true);
    }
}

}
