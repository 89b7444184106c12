#include "storage/Database.hpp"
#include "utils/Errors.hpp"
#include <sqlite3.h>
#include <glib.h>
#include <glib/gstdio.h>
#include <cerrno>
#include <cstring>
#include <ctime>

namespace NewsDeck {

namespace {

class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db), stmt_(nullptr) {
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw StorageError(std::string("prepare failed: ") + sqlite3_errmsg(db_));
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, std::int64_t value) {
        check(sqlite3_bind_int64(stmt_, index, value));
        return *this;
    }
    Statement& bind(int index, const std::string& value) {
        check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
        return *this;
    }
    Statement& bind(int index, std::optional<std::int64_t> value) {
        if (value) return bind(index, *value);
        check(sqlite3_bind_null(stmt_, index));
        return *this;
    }

    // True while a row is available.
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StorageError(std::string("query failed: ") + sqlite3_errmsg(db_));
    }

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    std::int64_t integer(int col) const { return sqlite3_column_int64(stmt_, col); }
    bool isNull(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }
    std::string text(int col) const {
        const unsigned char* value = sqlite3_column_text(stmt_, col);
        return value ? reinterpret_cast<const char*>(value) : "";
    }
    std::optional<std::int64_t> optionalInteger(int col) const {
        if (isNull(col)) return std::nullopt;
        return integer(col);
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) throw StorageError(std::string("bind failed: ") + sqlite3_errmsg(db_));
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db), done_(false) { run("BEGIN IMMEDIATE"); }
    ~Transaction() {
        if (!done_) sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
    }
    void commit() {
        run("COMMIT");
        done_ = true;
    }

private:
    void run(const char* sql) {
        char* error = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &error) != SQLITE_OK) {
            std::string message = error ? error : sqlite3_errmsg(db_);
            sqlite3_free(error);
            throw StorageError(std::string(sql) + " failed: " + message);
        }
    }

    sqlite3* db_;
    bool done_;
};

const char* const kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS categories (
    id INTEGER PRIMARY KEY,
    name TEXT NOT NULL,
    parent_id INTEGER REFERENCES categories(id) ON DELETE SET NULL,
    collapsed INTEGER NOT NULL DEFAULT 0
);
CREATE TABLE IF NOT EXISTS feeds (
    id INTEGER PRIMARY KEY,
    url TEXT UNIQUE NOT NULL,
    title TEXT NOT NULL,
    html_url TEXT NOT NULL DEFAULT '',
    category_id INTEGER REFERENCES categories(id) ON DELETE SET NULL,
    last_refreshed INTEGER NOT NULL DEFAULT 0,
    last_error TEXT,
    consecutive_failures INTEGER NOT NULL DEFAULT 0
);
CREATE TABLE IF NOT EXISTS articles (
    id INTEGER PRIMARY KEY,
    feed_id INTEGER NOT NULL REFERENCES feeds(id) ON DELETE CASCADE,
    guid TEXT NOT NULL,
    title TEXT NOT NULL,
    link TEXT NOT NULL DEFAULT '',
    published INTEGER NOT NULL DEFAULT 0,
    summary TEXT NOT NULL DEFAULT '',
    content TEXT,
    read INTEGER NOT NULL DEFAULT 0,
    starred INTEGER NOT NULL DEFAULT 0,
    fetched_at INTEGER NOT NULL,
    UNIQUE(feed_id, guid)
);
CREATE INDEX IF NOT EXISTS idx_articles_feed_published ON articles(feed_id, published DESC);
CREATE INDEX IF NOT EXISTS idx_articles_starred ON articles(starred);
CREATE INDEX IF NOT EXISTS idx_feeds_category ON feeds(category_id);
)SQL";

const char* const kArticleColumns =
    "SELECT id, feed_id, guid, title, link, published, summary, content, read, starred FROM articles";

Article readArticle(const Statement& st) {
    Article a;
    a.id = st.integer(0);
    a.feedId = st.integer(1);
    a.guid = st.text(2);
    a.title = st.text(3);
    a.link = st.text(4);
    a.published = st.integer(5);
    a.summary = st.text(6);
    if (!st.isNull(7)) a.content = st.text(7);
    a.read = st.integer(8) != 0;
    a.starred = st.integer(9) != 0;
    return a;
}

Feed readFeed(const Statement& st) {
    Feed f;
    f.id = st.integer(0);
    f.url = st.text(1);
    f.title = st.text(2);
    f.htmlUrl = st.text(3);
    f.categoryId = st.optionalInteger(4);
    f.lastRefreshed = st.integer(5);
    if (!st.isNull(6)) f.lastError = st.text(6);
    f.consecutiveFailures = static_cast<int>(st.integer(7));
    f.unreadCount = static_cast<int>(st.integer(8));
    return f;
}

const char* const kFeedQuery =
    "SELECT f.id, f.url, f.title, f.html_url, f.category_id, f.last_refreshed, f.last_error, "
    "f.consecutive_failures, "
    "(SELECT COUNT(*) FROM articles a WHERE a.feed_id = f.id AND a.read = 0) FROM feeds f";

std::string escapeLike(const std::string& text) {
    std::string out;
    for (char c : text) {
        if (c == '%' || c == '_' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

}

Database::Database(const std::string& path) : db_(nullptr) {
    int rc = sqlite3_open_v2(path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError("cannot open database " + path + ": " + message);
    }
    sqlite3_busy_timeout(db_, 5000);
    try {
        exec("PRAGMA foreign_keys = ON");
        if (path != ":memory:") exec("PRAGMA journal_mode = WAL");
        migrate();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    g_debug("Opened database %s", path.c_str());
}

Database::~Database() {
    if (db_) sqlite3_close(db_);
}

void Database::destroy(const std::string& path) {
    for (const char* suffix : {"", "-wal", "-shm"}) {
        std::string file = path + suffix;
        if (g_remove(file.c_str()) != 0 && errno != ENOENT) {
            throw StorageError("cannot remove " + file + ": " + g_strerror(errno));
        }
    }
    g_message("Removed database %s", path.c_str());
}

void Database::exec(const char* sql) {
    char* error = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : sqlite3_errmsg(db_);
        sqlite3_free(error);
        throw StorageError(message);
    }
}

void Database::migrate() {
    Transaction tx(db_);
    exec(kSchema);
    tx.commit();
}

FeedId Database::upsertFeed(const std::string& url, const std::string& title,
                            std::optional<CategoryId> categoryId, const std::string& htmlUrl) {
    Statement insert(db_,
        "INSERT INTO feeds (url, title, html_url, category_id) VALUES (?1, ?2, ?3, ?4) "
        "ON CONFLICT(url) DO UPDATE SET title = excluded.title, "
        "html_url = CASE WHEN excluded.html_url = '' THEN feeds.html_url ELSE excluded.html_url END, "
        "category_id = COALESCE(excluded.category_id, feeds.category_id)");
    insert.bind(1, url).bind(2, title.empty() ? url : title).bind(3, htmlUrl).bind(4, categoryId);
    insert.step();

    Statement select(db_, "SELECT id FROM feeds WHERE url = ?1");
    select.bind(1, url);
    if (!select.step()) throw StorageError("feed vanished after upsert: " + url);
    return select.integer(0);
}

std::vector<Feed> Database::listFeeds() const {
    std::string sql = std::string(kFeedQuery) + " ORDER BY f.title COLLATE NOCASE, f.id";
    Statement st(db_, sql.c_str());
    std::vector<Feed> feeds;
    while (st.step()) feeds.push_back(readFeed(st));
    return feeds;
}

std::optional<Feed> Database::getFeed(FeedId id) const {
    std::string sql = std::string(kFeedQuery) + " WHERE f.id = ?1";
    Statement st(db_, sql.c_str());
    st.bind(1, id);
    if (!st.step()) return std::nullopt;
    return readFeed(st);
}

std::optional<Feed> Database::findFeedByUrl(const std::string& url) const {
    std::string sql = std::string(kFeedQuery) + " WHERE f.url = ?1";
    Statement st(db_, sql.c_str());
    st.bind(1, url);
    if (!st.step()) return std::nullopt;
    return readFeed(st);
}

size_t Database::deleteFeed(FeedId id) {
    Transaction tx(db_);
    size_t removed = countArticles(id);
    Statement st(db_, "DELETE FROM feeds WHERE id = ?1");
    st.bind(1, id);
    st.step();
    tx.commit();
    return removed;
}

void Database::updateFeedUrl(FeedId id, const std::string& url) {
    Statement st(db_, "UPDATE feeds SET url = ?2 WHERE id = ?1");
    st.bind(1, id).bind(2, url);
    st.step();
}

void Database::updateFeedTitle(FeedId id, const std::string& title) {
    Statement st(db_, "UPDATE feeds SET title = ?2 WHERE id = ?1");
    st.bind(1, id).bind(2, title);
    st.step();
}

void Database::assignFeedCategory(FeedId id, std::optional<CategoryId> categoryId) {
    Statement st(db_, "UPDATE feeds SET category_id = ?2 WHERE id = ?1");
    st.bind(1, id).bind(2, categoryId);
    st.step();
}

void Database::recordRefreshSuccess(FeedId id, std::int64_t refreshedAt) {
    Statement st(db_,
        "UPDATE feeds SET last_refreshed = ?2, last_error = NULL, consecutive_failures = 0 WHERE id = ?1");
    st.bind(1, id).bind(2, refreshedAt);
    st.step();
}

void Database::recordRefreshFailure(FeedId id, const std::string& error) {
    Statement st(db_,
        "UPDATE feeds SET last_error = ?2, consecutive_failures = consecutive_failures + 1 WHERE id = ?1");
    st.bind(1, id).bind(2, error);
    st.step();
}

size_t Database::upsertArticles(FeedId feedId, const std::vector<ArticleDraft>& drafts) {
    Transaction tx(db_);
    Statement insert(db_,
        "INSERT INTO articles (feed_id, guid, title, link, published, summary, fetched_at) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7) ON CONFLICT(feed_id, guid) DO NOTHING");
    Statement update(db_,
        "UPDATE articles SET title = ?3, link = ?4, "
        "published = CASE WHEN ?5 > 0 THEN ?5 ELSE published END, summary = ?6 "
        "WHERE feed_id = ?1 AND guid = ?2");

    std::int64_t now = static_cast<std::int64_t>(time(nullptr));
    size_t inserted = 0;
    for (const auto& draft : drafts) {
        if (draft.guid.empty()) continue;
        insert.reset();
        insert.bind(1, feedId).bind(2, draft.guid).bind(3, draft.title).bind(4, draft.link)
              .bind(5, draft.published).bind(6, draft.summary).bind(7, now);
        insert.step();
        if (sqlite3_changes(db_) == 1) {
            ++inserted;
            continue;
        }
        update.reset();
        update.bind(1, feedId).bind(2, draft.guid).bind(3, draft.title).bind(4, draft.link)
              .bind(5, draft.published).bind(6, draft.summary);
        update.step();
    }
    tx.commit();
    return inserted;
}

std::vector<Article> Database::listArticles(const ArticleFilter& filter) const {
    std::string sql = kArticleColumns;
    sql += " WHERE 1 = 1";
    if (filter.feedId) sql += " AND feed_id = ?1";
    if (!filter.search.empty()) sql += " AND (title LIKE ?2 ESCAPE '\\' OR summary LIKE ?2 ESCAPE '\\')";
    if (filter.unreadOnly) sql += " AND read = 0";
    if (filter.starredOnly) sql += " AND starred = 1";
    sql += " ORDER BY published DESC, id DESC";

    Statement st(db_, sql.c_str());
    if (filter.feedId) st.bind(1, *filter.feedId);
    if (!filter.search.empty()) st.bind(2, "%" + escapeLike(filter.search) + "%");

    std::vector<Article> articles;
    while (st.step()) articles.push_back(readArticle(st));
    return articles;
}

std::optional<Article> Database::getArticle(ArticleId id) const {
    std::string sql = std::string(kArticleColumns) + " WHERE id = ?1";
    Statement st(db_, sql.c_str());
    st.bind(1, id);
    if (!st.step()) return std::nullopt;
    return readArticle(st);
}

size_t Database::countArticles(std::optional<FeedId> feedId) const {
    Statement st(db_, feedId ? "SELECT COUNT(*) FROM articles WHERE feed_id = ?1"
                             : "SELECT COUNT(*) FROM articles");
    if (feedId) st.bind(1, *feedId);
    st.step();
    return static_cast<size_t>(st.integer(0));
}

void Database::setArticleFlag(ArticleId id, ArticleFlag flag, bool value) {
    Statement st(db_, flag == ArticleFlag::Read ? "UPDATE articles SET read = ?2 WHERE id = ?1"
                                                : "UPDATE articles SET starred = ?2 WHERE id = ?1");
    st.bind(1, id).bind(2, static_cast<std::int64_t>(value ? 1 : 0));
    st.step();
}

void Database::setArticleContent(ArticleId id, const std::string& content) {
    Statement st(db_, "UPDATE articles SET content = ?2 WHERE id = ?1");
    st.bind(1, id).bind(2, content);
    st.step();
}

size_t Database::markAllRead(std::optional<FeedId> feedId) {
    Statement st(db_, feedId ? "UPDATE articles SET read = 1 WHERE read = 0 AND feed_id = ?1"
                             : "UPDATE articles SET read = 1 WHERE read = 0");
    if (feedId) st.bind(1, *feedId);
    st.step();
    return static_cast<size_t>(sqlite3_changes(db_));
}

CategoryId Database::createCategory(const std::string& name, std::optional<CategoryId> parentId) {
    Statement st(db_, "INSERT INTO categories (name, parent_id) VALUES (?1, ?2)");
    st.bind(1, name).bind(2, parentId);
    st.step();
    return sqlite3_last_insert_rowid(db_);
}

CategoryId Database::findOrCreateCategory(const std::string& name, std::optional<CategoryId> parentId) {
    Statement st(db_, parentId ? "SELECT id FROM categories WHERE name = ?1 AND parent_id = ?2"
                               : "SELECT id FROM categories WHERE name = ?1 AND parent_id IS NULL");
    st.bind(1, name);
    if (parentId) st.bind(2, *parentId);
    if (st.step()) return st.integer(0);
    return createCategory(name, parentId);
}

void Database::renameCategory(CategoryId id, const std::string& name) {
    Statement st(db_, "UPDATE categories SET name = ?2 WHERE id = ?1");
    st.bind(1, id).bind(2, name);
    st.step();
}

std::optional<CategoryId> Database::parentOf(CategoryId id) const {
    Statement st(db_, "SELECT parent_id FROM categories WHERE id = ?1");
    st.bind(1, id);
    if (!st.step()) throw StorageError("no such category: " + std::to_string(id));
    return st.optionalInteger(0);
}

void Database::moveCategory(CategoryId id, std::optional<CategoryId> parentId) {
    for (auto ancestor = parentId; ancestor; ancestor = parentOf(*ancestor)) {
        if (*ancestor == id) throw StorageError("moving category would create a cycle");
    }
    Statement st(db_, "UPDATE categories SET parent_id = ?2 WHERE id = ?1");
    st.bind(1, id).bind(2, parentId);
    st.step();
}

void Database::setCategoryCollapsed(CategoryId id, bool collapsed) {
    Statement st(db_, "UPDATE categories SET collapsed = ?2 WHERE id = ?1");
    st.bind(1, id).bind(2, static_cast<std::int64_t>(collapsed ? 1 : 0));
    st.step();
}

void Database::deleteCategory(CategoryId id) {
    Transaction tx(db_);
    std::optional<CategoryId> parent = parentOf(id);

    Statement feeds(db_, "UPDATE feeds SET category_id = NULL WHERE category_id = ?1");
    feeds.bind(1, id);
    feeds.step();

    Statement children(db_, "UPDATE categories SET parent_id = ?2 WHERE parent_id = ?1");
    children.bind(1, id).bind(2, parent);
    children.step();

    Statement remove(db_, "DELETE FROM categories WHERE id = ?1");
    remove.bind(1, id);
    remove.step();
    tx.commit();
}

std::vector<Category> Database::listCategories() const {
    Statement st(db_, "SELECT id, name, parent_id, collapsed FROM categories ORDER BY name COLLATE NOCASE, id");
    std::vector<Category> categories;
    while (st.step()) {
        Category c;
        c.id = st.integer(0);
        c.name = st.text(1);
        c.parentId = st.optionalInteger(2);
        c.collapsed = st.integer(3) != 0;
        categories.push_back(c);
    }
    return categories;
}

}
