#include "app/Controller.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>

using namespace NewsDeck;
using namespace NewsDeck::Testing;

static ArticleDraft draft(const std::string& guid, const std::string& title, std::int64_t published) {
    ArticleDraft d;
    d.guid = guid;
    d.title = title;
    d.link = "https://example.org/" + guid;
    d.summary = "Summary of " + title;
    d.published = published;
    return d;
}

class TestController : public testing::Test {
protected:
    TestController()
        : channel(std::make_shared<EventChannel>()),
          fetchPool(channel, 10),
          contentPool(channel, 2),
          fetcher(std::make_shared<FakeFeedFetcher>()),
          extractor(std::make_shared<FakeContentExtractor>()),
          refresher(fetchPool, channel, fetcher),
          loader(contentPool, extractor, std::nullopt),
          db(":memory:"),
          controller(state, db, refresher, loader, settings()) {
        alpha = db.upsertFeed("https://alpha.example/feed", "Alpha");
        beta = db.upsertFeed("https://beta.example/feed", "Beta");
        db.upsertArticles(alpha, {draft("a1", "Rust news", 300), draft("a2", "Kernel release", 200)});
        db.upsertArticles(beta, {draft("b1", "Gardening tips", 100)});
        controller.loadFromStorage();
        now = g_get_monotonic_time();
    }

    static ControllerSettings settings() {
        ControllerSettings s;
        s.statusTimeoutSeconds = 5;
        s.exportPath = "";
        return s;
    }

    void press(CommandKind kind, const std::string& text = "") {
        controller.handleCommand(Command{kind, text}, now);
    }

    void type(const std::string& text) {
        for (char c : text) press(CommandKind::InputChar, std::string(1, c));
    }

    bool pumpOne() {
        auto event = channel->receive(kWait);
        if (!event) return false;
        controller.handleEvent(*event, now);
        return true;
    }

    bool pumpUntilBatchComplete() {
        state.lastBatch.reset();
        while (!state.lastBatch) {
            if (!pumpOne()) return false;
        }
        return true;
    }

    std::shared_ptr<EventChannel> channel;
    TaskPool fetchPool;
    TaskPool contentPool;
    std::shared_ptr<FakeFeedFetcher> fetcher;
    std::shared_ptr<FakeContentExtractor> extractor;
    RefreshCoordinator refresher;
    ContentLoader loader;
    Database db;
    AppState state;
    Controller controller;
    FeedId alpha = 0;
    FeedId beta = 0;
    gint64 now = 0;
};

TEST_F(TestController, loadsFeedsSortedByTitle)
{
    ASSERT_EQ(2u, state.feeds.size());
    EXPECT_EQ("Alpha", state.feeds[0].title);
    EXPECT_EQ(2, state.feeds[0].unreadCount);
    EXPECT_EQ(3u, state.articles.size());
    EXPECT_EQ(Focus::Feeds, state.focus);
}

TEST_F(TestController, openingArticleMarksReadAndShowsReader)
{
    extractor->succeed("https://example.org/a1", "The full story of Rust news.");

    press(CommandKind::Open);
    EXPECT_EQ(Focus::Articles, state.focus);
    EXPECT_EQ(alpha, state.articleScope.value_or(0));
    ASSERT_EQ(2u, state.articles.size());

    press(CommandKind::Open);
    EXPECT_EQ(View::Reader, state.view);
    ASSERT_TRUE(state.readerArticle());
    ArticleId id = state.readerArticle()->id;
    EXPECT_TRUE(db.getArticle(id)->read);
    EXPECT_EQ(1, state.findFeed(alpha)->unreadCount);
    EXPECT_EQ(ContentPhase::Loading, state.contentOf(id).phase);

    ASSERT_TRUE(pumpOne());
    EXPECT_EQ(ContentPhase::Loaded, state.contentOf(id).phase);
    EXPECT_EQ("The full story of Rust news.", db.getArticle(id)->content.value_or(""));

    press(CommandKind::Back);
    EXPECT_EQ(View::Browse, state.view);
    EXPECT_FALSE(state.readerArticleId);
}

TEST_F(TestController, failedExtractionKeepsSummaryAndReportsStatus)
{
    press(CommandKind::Open);
    press(CommandKind::Open);
    ASSERT_TRUE(pumpOne());

    const Article* article = state.readerArticle();
    ASSERT_TRUE(article);
    EXPECT_EQ(ContentPhase::Failed, state.contentOf(article->id).phase);
    EXPECT_EQ("Summary of Rust news", ContentLoader::displayBody(state, *article));
    EXPECT_EQ("Full text unavailable, showing summary", state.status);
    EXPECT_TRUE(state.statusIsError);
    EXPECT_EQ(View::Reader, state.view);
}

TEST_F(TestController, searchFiltersArticles)
{
    press(CommandKind::StartSearch);
    EXPECT_EQ(InputMode::Search, state.mode);
    type("kernel");
    press(CommandKind::InputCommit);

    EXPECT_EQ(InputMode::Normal, state.mode);
    EXPECT_EQ("kernel", state.search);
    ASSERT_EQ(1u, state.articles.size());
    EXPECT_EQ("Kernel release", state.articles[0].title);
    EXPECT_EQ(Focus::Articles, state.focus);

    press(CommandKind::StartSearch);
    press(CommandKind::InputCancel);
    EXPECT_EQ("kernel", state.search);
}

TEST_F(TestController, backspaceRemovesWholeCharacter)
{
    press(CommandKind::StartSearch);
    press(CommandKind::InputChar, "c");
    press(CommandKind::InputChar, "\xC3\xA9");
    press(CommandKind::InputBackspace);
    EXPECT_EQ("c", state.input);
}

TEST_F(TestController, deleteNeedsConfirmation)
{
    press(CommandKind::Delete);
    EXPECT_EQ(InputMode::ConfirmDelete, state.mode);
    press(CommandKind::Deny);
    EXPECT_EQ(InputMode::Normal, state.mode);
    EXPECT_TRUE(db.getFeed(alpha));

    press(CommandKind::Delete);
    press(CommandKind::Confirm);
    EXPECT_FALSE(db.getFeed(alpha));
    EXPECT_EQ(0u, db.countArticles(alpha));
    ASSERT_EQ(1u, state.feeds.size());
    EXPECT_EQ(1u, state.articles.size());
    EXPECT_NE(std::string::npos, state.status.find("2 articles"));
}

TEST_F(TestController, resultForDeletedFeedIsDropped)
{
    fetcher->serve("https://alpha.example/feed", rssDocument("Alpha", {{"late", "Late"}}), 50);
    controller.refreshFeed(alpha, now);
    press(CommandKind::Delete);
    press(CommandKind::Confirm);

    ASSERT_TRUE(pumpUntilBatchComplete());
    EXPECT_FALSE(db.getFeed(alpha));
    EXPECT_EQ(0u, db.countArticles(alpha));
    EXPECT_FALSE(refresher.isInFlight(alpha));
}

TEST_F(TestController, refreshAllSkipsRepeatedlyFailingFeeds)
{
    for (int i = 0; i < 5; ++i) db.recordRefreshFailure(beta, "Network: refused");
    fetcher->serve("https://alpha.example/feed", rssDocument("Alpha", {}));

    controller.refreshAll(now);
    EXPECT_NE(std::string::npos, state.status.find("1 failing feeds skipped"));
    EXPECT_TRUE(refresher.isInFlight(alpha));
    EXPECT_FALSE(refresher.isInFlight(beta));
    ASSERT_TRUE(pumpUntilBatchComplete());
    EXPECT_EQ(1u, state.lastBatch->total);

    // A single-feed refresh still tries it.
    controller.refreshFeed(beta, now);
    EXPECT_TRUE(refresher.isInFlight(beta));
    ASSERT_TRUE(pumpUntilBatchComplete());
    EXPECT_EQ(6, db.getFeed(beta)->consecutiveFailures);
}

TEST_F(TestController, successfulRefreshResetsFailures)
{
    db.recordRefreshFailure(beta, "Timeout: timed out");
    fetcher->serve("https://beta.example/feed", rssDocument("Beta", {{"b2", "Seeds"}}));

    controller.refreshFeed(beta, now);
    ASSERT_TRUE(pumpUntilBatchComplete());

    std::optional<Feed> feed = db.getFeed(beta);
    EXPECT_EQ(0, feed->consecutiveFailures);
    EXPECT_FALSE(feed->lastError);
    EXPECT_EQ(2u, db.countArticles(beta));
    EXPECT_EQ(4u, state.articles.size());
}

TEST_F(TestController, subscribeRejectsNonHttpUrl)
{
    press(CommandKind::StartSubscribe);
    type("ftp://files.example/feed");
    press(CommandKind::InputCommit);

    EXPECT_TRUE(state.statusIsError);
    EXPECT_EQ(2u, db.listFeeds().size());
}

TEST_F(TestController, subscribeAddsFeedAndRefreshesIt)
{
    fetcher->serve("https://gamma.example/rss", rssDocument("Gamma", {{"g1", "Hello"}}));

    press(CommandKind::StartSubscribe);
    type("https://gamma.example/rss");
    press(CommandKind::InputCommit);
    EXPECT_EQ(3u, state.feeds.size());
    ASSERT_TRUE(pumpUntilBatchComplete());

    bool found = false;
    for (const auto& feed : db.listFeeds()) {
        if (feed.url != "https://gamma.example/rss") continue;
        found = true;
        EXPECT_EQ("Gamma", feed.title);
        EXPECT_EQ(1u, db.countArticles(feed.id));
    }
    EXPECT_TRUE(found);
}

TEST_F(TestController, subscribeRejectsPrivateAndLocalHosts)
{
    for (const char* url : {"http://192.168.1.1/feed", "http://localhost/feed", "http://[::1]/feed"}) {
        press(CommandKind::StartSubscribe);
        type(url);
        press(CommandKind::InputCommit);
        EXPECT_TRUE(state.statusIsError) << url;
    }
    EXPECT_EQ(2u, db.listFeeds().size());
    EXPECT_FALSE(refresher.hasActiveBatch());
}

TEST_F(TestController, subscribeToExistingFeedKeepsTitleAndCategory)
{
    CategoryId imported = db.createCategory("Imported", std::nullopt);
    db.createCategory("Other", std::nullopt);
    FeedId delta = db.upsertFeed("https://delta.example/feed", "Delta Weekly", imported);
    controller.loadFromStorage();

    press(CommandKind::PrevFocus);
    ASSERT_EQ(Focus::Categories, state.focus);
    state.categoryCursor = 2;
    ASSERT_EQ("Other", state.categoryRows()[2].name);

    press(CommandKind::StartSubscribe);
    type("https://delta.example/feed");
    press(CommandKind::InputCommit);

    std::optional<Feed> feed = db.getFeed(delta);
    ASSERT_TRUE(feed);
    EXPECT_EQ("Delta Weekly", feed->title);
    EXPECT_EQ(imported, feed->categoryId.value_or(0));
    EXPECT_EQ("Already subscribed to Delta Weekly", state.status);
    EXPECT_FALSE(refresher.isInFlight(delta));
    EXPECT_EQ(3u, db.listFeeds().size());
}

TEST_F(TestController, browserRefusesUnsafeLinks)
{
    ArticleDraft local = draft("b9", "Local file", 400);
    local.link = "file:///etc/passwd";
    ArticleDraft shell = draft("b8", "Shell", 350);
    shell.link = "https://evil.example/$(reboot)";
    db.upsertArticles(beta, {local, shell});
    controller.loadFromStorage();

    press(CommandKind::NextFocus);
    ASSERT_EQ(Focus::Articles, state.focus);
    for (size_t i = 0; i < 2; ++i) {
        state.articleCursor = i;
        ArticleId id = state.selectedArticle()->id;
        state.status.clear();
        press(CommandKind::OpenInBrowser);
        EXPECT_TRUE(state.statusIsError);
        EXPECT_EQ(0u, state.status.find("Refusing to open link"));
        EXPECT_FALSE(db.getArticle(id)->read);
    }
}

TEST_F(TestController, createRenameAndDeleteCategory)
{
    press(CommandKind::PrevFocus);
    press(CommandKind::NewCategory);
    EXPECT_EQ(InputMode::NewCategory, state.mode);
    type("Tech");
    press(CommandKind::InputCommit);
    ASSERT_EQ(1u, state.categories.size());
    EXPECT_EQ("Tech", state.categories[0].name);
    EXPECT_FALSE(state.categories[0].parentId);

    // A new category goes under the selected one.
    state.categoryCursor = 1;
    press(CommandKind::NewCategory);
    type("Kernels");
    press(CommandKind::InputCommit);
    ASSERT_EQ(2u, state.categories.size());
    CategoryId tech = 0;
    for (const auto& c : state.categories) {
        if (c.name == "Tech") tech = c.id;
    }
    for (const auto& c : state.categories) {
        if (c.name == "Kernels") EXPECT_EQ(tech, c.parentId.value_or(0));
    }

    ASSERT_EQ("Tech", state.categoryRows()[1].name);
    press(CommandKind::Rename);
    EXPECT_EQ(InputMode::Rename, state.mode);
    EXPECT_EQ("Tech", state.input);
    for (int i = 0; i < 4; ++i) press(CommandKind::InputBackspace);
    type("Science");
    press(CommandKind::InputCommit);
    EXPECT_EQ("Science", state.categoryRows()[1].name);

    press(CommandKind::Delete);
    EXPECT_EQ(InputMode::ConfirmDelete, state.mode);
    press(CommandKind::Confirm);
    ASSERT_EQ(1u, state.categories.size());
    EXPECT_EQ("Kernels", state.categories[0].name);
    EXPECT_FALSE(state.categories[0].parentId);
}

TEST_F(TestController, emptyCategoryNameIsRejected)
{
    press(CommandKind::NewCategory);
    type("   ");
    press(CommandKind::InputCommit);
    EXPECT_TRUE(state.categories.empty());
    EXPECT_EQ("Name cannot be empty", state.status);
    EXPECT_TRUE(state.statusIsError);
}

TEST_F(TestController, renameFeed)
{
    press(CommandKind::Rename);
    EXPECT_EQ("Alpha", state.input);
    press(CommandKind::InputChar, "!");
    press(CommandKind::InputCommit);
    EXPECT_EQ("Alpha!", db.getFeed(alpha)->title);
    EXPECT_EQ("Alpha!", state.findFeed(alpha)->title);
}

TEST_F(TestController, moveFeedIntoCategory)
{
    CategoryId tech = db.createCategory("Tech", std::nullopt);
    controller.loadFromStorage();

    press(CommandKind::MoveToCategory);
    EXPECT_EQ(InputMode::PickCategory, state.mode);
    ASSERT_EQ(2u, state.pickerRows().size());
    press(CommandKind::MoveDown);
    press(CommandKind::MoveDown);
    EXPECT_EQ(1u, state.pickerCursor);
    press(CommandKind::InputCommit);

    EXPECT_EQ(InputMode::Normal, state.mode);
    EXPECT_EQ(tech, db.getFeed(alpha)->categoryId.value_or(0));
    EXPECT_EQ("Moved Alpha to Tech", state.status);

    // Row zero takes it out again.
    press(CommandKind::MoveToCategory);
    press(CommandKind::InputCommit);
    EXPECT_FALSE(db.getFeed(alpha)->categoryId);
}

TEST_F(TestController, moveCategoryToTopLevel)
{
    CategoryId tech = db.createCategory("Tech", std::nullopt);
    CategoryId kernels = db.createCategory("Kernels", tech);
    controller.loadFromStorage();

    press(CommandKind::PrevFocus);
    state.categoryCursor = 2;
    ASSERT_EQ(kernels, state.selectedCategory().value_or(0));
    press(CommandKind::MoveToCategory);
    ASSERT_EQ(InputMode::PickCategory, state.mode);
    press(CommandKind::InputCommit);

    for (const auto& c : db.listCategories()) {
        if (c.id == kernels) EXPECT_FALSE(c.parentId);
    }
}

TEST_F(TestController, pickerHidesMovingSubtree)
{
    CategoryId tech = db.createCategory("Tech", std::nullopt);
    db.createCategory("Kernels", tech);
    db.createCategory("News", std::nullopt);
    controller.loadFromStorage();

    press(CommandKind::PrevFocus);
    state.categoryCursor = 2;
    ASSERT_EQ(tech, state.selectedCategory().value_or(0));
    press(CommandKind::MoveToCategory);

    std::vector<CategoryRow> rows = state.pickerRows();
    ASSERT_EQ(2u, rows.size());
    EXPECT_EQ("News", rows[1].name);
    press(CommandKind::MoveDown);
    press(CommandKind::InputCommit);
    EXPECT_EQ("Moved Tech to News", state.status);
}

TEST_F(TestController, starredOnlyToggle)
{
    press(CommandKind::NextFocus);
    ArticleId id = state.selectedArticle()->id;
    press(CommandKind::ToggleStar);

    press(CommandKind::ToggleStarredOnly);
    EXPECT_TRUE(state.starredOnly);
    EXPECT_EQ(Focus::Articles, state.focus);
    ASSERT_EQ(1u, state.articles.size());
    EXPECT_EQ(id, state.articles[0].id);

    press(CommandKind::ToggleStarredOnly);
    EXPECT_FALSE(state.starredOnly);
    EXPECT_EQ(3u, state.articles.size());
}

TEST_F(TestController, unreadOnlyToggle)
{
    press(CommandKind::NextFocus);
    press(CommandKind::ToggleRead);

    press(CommandKind::ToggleUnreadOnly);
    EXPECT_TRUE(state.unreadOnly);
    EXPECT_EQ(2u, state.articles.size());
    for (const auto& article : state.articles) EXPECT_FALSE(article.read);

    press(CommandKind::ToggleUnreadOnly);
    EXPECT_EQ(3u, state.articles.size());
}

TEST_F(TestController, readerKeepsArticleThatLeavesSearchResults)
{
    press(CommandKind::StartSearch);
    type("rust");
    press(CommandKind::InputCommit);
    ASSERT_EQ(1u, state.articles.size());
    press(CommandKind::Open);
    ASSERT_EQ(View::Reader, state.view);
    ArticleId id = *state.readerArticleId;

    fetcher->serve("https://alpha.example/feed",
                   rssDocument("Alpha", {{"a1", "Compiler digest"}, {"a2", "Kernel release"}}));
    controller.refreshFeed(alpha, now);
    ASSERT_TRUE(pumpUntilBatchComplete());

    EXPECT_TRUE(state.articles.empty());
    EXPECT_EQ(View::Reader, state.view);
    ASSERT_TRUE(state.readerArticle());
    EXPECT_EQ(id, state.readerArticle()->id);
    EXPECT_EQ("Compiler digest", state.readerArticle()->title);

    press(CommandKind::Back);
    EXPECT_EQ(View::Browse, state.view);
    EXPECT_FALSE(state.pinnedArticle);
}

TEST_F(TestController, starAndReadToggles)
{
    press(CommandKind::NextFocus);
    ASSERT_EQ(Focus::Articles, state.focus);
    ArticleId id = state.selectedArticle()->id;

    press(CommandKind::ToggleStar);
    EXPECT_TRUE(db.getArticle(id)->starred);
    EXPECT_EQ("Starred", state.status);
    press(CommandKind::ToggleRead);
    EXPECT_TRUE(db.getArticle(id)->read);
    press(CommandKind::ToggleRead);
    EXPECT_FALSE(db.getArticle(id)->read);
}

TEST_F(TestController, markAllReadInSelectedFeed)
{
    press(CommandKind::MarkAllRead);

    EXPECT_EQ(0, state.findFeed(alpha)->unreadCount);
    EXPECT_EQ(1, state.findFeed(beta)->unreadCount);
}

TEST_F(TestController, movementStaysInBounds)
{
    press(CommandKind::MoveUp);
    EXPECT_EQ(0u, state.feedCursor);
    press(CommandKind::Bottom);
    EXPECT_EQ(1u, state.feedCursor);
    press(CommandKind::MoveDown);
    EXPECT_EQ(1u, state.feedCursor);
    press(CommandKind::PrevFocus);
    EXPECT_EQ(Focus::Categories, state.focus);
}

TEST_F(TestController, statusExpiresOnTick)
{
    state.setStatus("Hello", now);
    controller.handleTick(now + 4 * G_USEC_PER_SEC);
    EXPECT_EQ("Hello", state.status);
    controller.handleTick(now + 5 * G_USEC_PER_SEC);
    EXPECT_TRUE(state.status.empty());
}

TEST_F(TestController, tickStartsAutomaticRefresh)
{
    ControllerSettings s = settings();
    s.refreshIntervalMinutes = 1;
    Controller automatic(state, db, refresher, loader, s);
    state.lastRefreshAll = now;

    automatic.handleTick(now + 30 * G_USEC_PER_SEC);
    EXPECT_FALSE(refresher.hasActiveBatch());

    gint64 later = now + 61 * G_USEC_PER_SEC;
    automatic.handleTick(later);
    EXPECT_TRUE(refresher.hasActiveBatch());
    EXPECT_EQ(later, state.lastRefreshAll);
    EXPECT_EQ(2u, state.refreshPending);

    state.lastBatch.reset();
    while (!state.lastBatch) {
        auto event = channel->receive(kWait);
        ASSERT_TRUE(event);
        automatic.handleEvent(*event, later);
    }
    EXPECT_EQ(0u, state.refreshPending);
}

TEST_F(TestController, quitSetsFlag)
{
    press(CommandKind::Quit);
    EXPECT_TRUE(state.quit);
}
