#pragma once
#include "app/AppEvent.hpp"
#include "app/AppState.hpp"
#include "app/ContentLoader.hpp"
#include "app/RefreshCoordinator.hpp"
#include "storage/Database.hpp"
#include "ui/Command.hpp"
#include <glib.h>
#include <string>

namespace NewsDeck {

struct ControllerSettings {
    unsigned refreshIntervalMinutes = 0;
    bool markReadOnOpen = true;
    unsigned statusTimeoutSeconds = 5;
    std::string browser = "xdg-open";
    std::string exportPath;
    int failureThreshold = 5;      // refresh-all skips feeds failing this many times in a row
};

// Applies commands and background outcomes to the application state.
// Every entry point runs on the main loop thread.
class Controller {
public:
    Controller(AppState& state, Database& db, RefreshCoordinator& refresher, ContentLoader& loader,
               ControllerSettings settings);

    void loadFromStorage();

    void handleCommand(const Command& command, gint64 now);
    void handleEvent(AppEvent& event, gint64 now);
    void handleTick(gint64 now);

    void refreshAll(gint64 now);
    void refreshFeed(FeedId feedId, gint64 now);

    void setPageSize(size_t rows) { pageSize_ = rows ? rows : 1; }

private:
    friend struct EventVisitor;

    void onFeedFetched(const FeedFetched& event, gint64 now);
    void onContentExtracted(const ContentExtracted& event, gint64 now);
    void onBatchComplete(const RefreshBatchComplete& event, gint64 now);

    void dispatch(const Command& command, gint64 now);
    void move(long delta);
    void moveTo(bool bottom);
    void open();
    void back();
    void cycleFocus(bool forward);
    void openArticle(const Article& article);
    void toggleCollapse();
    void commitInput(gint64 now);
    void subscribe(const std::string& url, gint64 now);
    void confirmDelete(gint64 now);
    void renameTarget(const Target& target, const std::string& name, gint64 now);
    void toggleFlag(ArticleFlag flag, gint64 now);
    void markAllRead(gint64 now);
    void openInBrowser(gint64 now);
    void exportSubscriptions(gint64 now);

    const Article* currentArticle() const;
    std::optional<FeedId> currentFeed() const;
    std::optional<Target> focusedTarget() const;
    std::string targetName(const Target& target) const;
    static std::string trimmed(const std::string& text);
    void reloadFeeds();
    void reloadArticles();

    AppState& state_;
    Database& db_;
    RefreshCoordinator& refresher_;
    ContentLoader& loader_;
    ControllerSettings settings_;
    size_t pageSize_;
};

}
