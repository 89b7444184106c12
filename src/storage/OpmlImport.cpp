#include "storage/OpmlImport.hpp"
#include <glib.h>
#include <map>

namespace NewsDeck {

namespace {

void importOutlines(Database& db, const std::vector<OpmlOutline>& outlines,
                    std::optional<CategoryId> parent, ImportSummary& summary) {
    for (const auto& outline : outlines) {
        if (outline.isFeed()) {
            db.upsertFeed(outline.xmlUrl, outline.title, parent, outline.htmlUrl);
            ++summary.feeds;
            continue;
        }
        std::string name = outline.title.empty() ? "Untitled" : outline.title;
        CategoryId id = db.findOrCreateCategory(name, parent);
        ++summary.categories;
        importOutlines(db, outline.children, id, summary);
    }
}

OpmlOutline feedOutline(const Feed& feed) {
    OpmlOutline outline;
    outline.title = feed.title;
    outline.xmlUrl = feed.url;
    outline.htmlUrl = feed.htmlUrl;
    return outline;
}

struct Forest {
    std::multimap<std::optional<CategoryId>, const Category*> children;
    std::multimap<std::optional<CategoryId>, const Feed*> feeds;
};

std::vector<OpmlOutline> buildLevel(const Forest& forest, std::optional<CategoryId> parent) {
    std::vector<OpmlOutline> level;
    auto cats = forest.children.equal_range(parent);
    for (auto it = cats.first; it != cats.second; ++it) {
        OpmlOutline folder;
        folder.title = it->second->name;
        folder.children = buildLevel(forest, it->second->id);
        level.push_back(std::move(folder));
    }
    auto feeds = forest.feeds.equal_range(parent);
    for (auto it = feeds.first; it != feeds.second; ++it) {
        level.push_back(feedOutline(*it->second));
    }
    return level;
}

}

ImportSummary importOpml(Database& db, const OpmlDocument& document) {
    ImportSummary summary;
    importOutlines(db, document.outlines, std::nullopt, summary);
    g_message("Imported %zu feeds in %zu categories", summary.feeds, summary.categories);
    return summary;
}

OpmlDocument exportOpml(const Database& db) {
    std::vector<Category> categories = db.listCategories();
    std::vector<Feed> feeds = db.listFeeds();

    Forest forest;
    for (const auto& c : categories) forest.children.emplace(c.parentId, &c);
    for (const auto& f : feeds) forest.feeds.emplace(f.categoryId, &f);

    OpmlDocument document;
    document.title = "NewsDeck subscriptions";
    document.outlines = buildLevel(forest, std::nullopt);
    return document;
}

}
