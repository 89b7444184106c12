#include "app/AppState.hpp"
#include <algorithm>
#include <set>

namespace NewsDeck {

static void appendRows(const std::vector<Category>& categories, const std::map<CategoryId, int>& unread,
                       std::optional<CategoryId> parent, int depth, std::vector<CategoryRow>& rows,
                       bool expandAll = false, std::optional<CategoryId> skip = std::nullopt) {
    for (const auto& c : categories) {
        if (c.parentId != parent || c.id == skip) continue;
        CategoryRow row;
        row.id = c.id;
        row.name = c.name;
        row.depth = depth;
        row.collapsed = c.collapsed;
        row.hasChildren = std::any_of(categories.begin(), categories.end(),
                                      [&](const Category& other) { return other.parentId == c.id; });
        auto it = unread.find(c.id);
        row.unread = it == unread.end() ? 0 : it->second;
        rows.push_back(row);
        if (expandAll || !c.collapsed) appendRows(categories, unread, c.id, depth + 1, rows, expandAll, skip);
    }
}

std::vector<CategoryRow> AppState::categoryRows() const {
    std::map<CategoryId, int> direct;
    int total = 0;
    for (const auto& f : feeds) {
        total += f.unreadCount;
        if (f.categoryId) direct[*f.categoryId] += f.unreadCount;
    }
    // Roll unread counts up the tree.
    std::map<CategoryId, int> unread;
    for (const auto& c : categories) {
        int count = direct.count(c.id) ? direct[c.id] : 0;
        std::optional<CategoryId> node = c.id;
        std::set<CategoryId> seen;
        while (node && seen.insert(*node).second) {
            unread[*node] += count;
            auto parent = std::find_if(categories.begin(), categories.end(),
                                       [&](const Category& p) { return p.id == *node; });
            node = parent == categories.end() ? std::nullopt : parent->parentId;
        }
    }

    std::vector<CategoryRow> rows;
    CategoryRow all;
    all.name = "All feeds";
    all.unread = total;
    rows.push_back(all);
    appendRows(categories, unread, std::nullopt, 0, rows);
    return rows;
}

std::vector<CategoryRow> AppState::pickerRows() const {
    std::vector<CategoryRow> rows;
    CategoryRow none;
    none.name = "(no category)";
    rows.push_back(none);
    std::optional<CategoryId> skip;
    if (target && target->kind == TargetKind::Category) skip = target->id;
    appendRows(categories, {}, std::nullopt, 0, rows, true, skip);
    return rows;
}

std::optional<CategoryId> AppState::selectedCategory() const {
    std::vector<CategoryRow> rows = categoryRows();
    if (categoryCursor >= rows.size()) return std::nullopt;
    return rows[categoryCursor].id;
}

std::vector<const Feed*> AppState::visibleFeeds() const {
    std::vector<const Feed*> result;
    std::optional<CategoryId> root = selectedCategory();
    std::set<CategoryId> subtree;
    if (root) {
        subtree.insert(*root);
        bool grew = true;
        while (grew) {
            grew = false;
            for (const auto& c : categories) {
                if (c.parentId && subtree.count(*c.parentId) && subtree.insert(c.id).second) grew = true;
            }
        }
    }
    for (const auto& f : feeds) {
        if (!root || (f.categoryId && subtree.count(*f.categoryId))) result.push_back(&f);
    }
    return result;
}

const Feed* AppState::selectedFeed() const {
    std::vector<const Feed*> visible = visibleFeeds();
    return feedCursor < visible.size() ? visible[feedCursor] : nullptr;
}

const Article* AppState::selectedArticle() const {
    return articleCursor < articles.size() ? &articles[articleCursor] : nullptr;
}

const Article* AppState::readerArticle() const {
    if (!readerArticleId) return nullptr;
    for (const auto& a : articles) {
        if (a.id == *readerArticleId) return &a;
    }
    if (pinnedArticle && pinnedArticle->id == *readerArticleId) return &*pinnedArticle;
    return nullptr;
}

Article* AppState::findArticle(ArticleId id) {
    for (auto& a : articles) {
        if (a.id == id) return &a;
    }
    if (pinnedArticle && pinnedArticle->id == id) return &*pinnedArticle;
    return nullptr;
}

Feed* AppState::findFeed(FeedId id) {
    for (auto& f : feeds) {
        if (f.id == id) return &f;
    }
    return nullptr;
}

ContentState AppState::contentOf(ArticleId id) const {
    auto it = content.find(id);
    return it == content.end() ? ContentState{} : it->second;
}

static size_t clampIndex(size_t cursor, size_t count) {
    return count == 0 ? 0 : std::min(cursor, count - 1);
}

void AppState::clampCursors() {
    categoryCursor = clampIndex(categoryCursor, categoryRows().size());
    feedCursor = clampIndex(feedCursor, visibleFeeds().size());
    articleCursor = clampIndex(articleCursor, articles.size());
}

void AppState::setStatus(const std::string& message, gint64 now, bool error) {
    status = message;
    statusIsError = error;
    statusSetAt = now;
    needsRedraw = true;
}

}
