#include "app/EventLoop.hpp"
#include "TestSupport.hpp"
#include <glib-unix.h>
#include <gtest/gtest.h>
#include <deque>
#include <fcntl.h>
#include <stdexcept>
#include <unistd.h>

using namespace NewsDeck;
using namespace NewsDeck::Testing;

// Key source backed by a pipe. Each byte written becomes one key; keys
// queued with inject() are returned by poll() without making the fd readable.
class PipeInput : public TerminalInput {
public:
    PipeInput() {
        GError* error = nullptr;
        if (!g_unix_open_pipe(fds_, FD_CLOEXEC, &error) || !g_unix_set_fd_nonblocking(fds_[0], TRUE, &error)) {
            std::string message = error ? error->message : "pipe failed";
            g_clear_error(&error);
            throw std::runtime_error(message);
        }
    }

    ~PipeInput() override {
        ::close(fds_[0]);
        closeWriter();
    }

    int fd() const override { return fds_[0]; }

    std::optional<KeyEvent> poll() override {
        if (!injected_.empty()) {
            KeyEvent event = injected_.front();
            injected_.pop_front();
            return event;
        }
        unsigned char byte = 0;
        if (::read(fds_[0], &byte, 1) != 1) return std::nullopt;
        KeyEvent event;
        event.raw = byte;
        if (g_ascii_isprint(byte)) {
            event.key = Key::Char;
            event.text = std::string(1, static_cast<char>(byte));
        }
        return event;
    }

    void write(const std::string& bytes) {
        ASSERT_EQ(static_cast<ssize_t>(bytes.size()), ::write(fds_[1], bytes.data(), bytes.size()));
    }

    void inject(const KeyEvent& event) { injected_.push_back(event); }

    void closeWriter() {
        if (fds_[1] < 0) return;
        ::close(fds_[1]);
        fds_[1] = -1;
    }

private:
    gint fds_[2] = {-1, -1};
    std::deque<KeyEvent> injected_;
};

class RecordingView : public TerminalView {
public:
    void render(const AppState& state) override {
        ++renders;
        lastStatus = state.status;
    }
    size_t pageSize() const override { return 20; }

    int renders = 0;
    std::string lastStatus;
};

class TestEventLoop : public testing::Test {
public:
    TestEventLoop()
        : channel(std::make_shared<EventChannel>()),
          fetchPool(channel, 4),
          contentPool(channel, 1),
          fetcher(std::make_shared<FakeFeedFetcher>()),
          extractor(std::make_shared<FakeContentExtractor>()),
          refresher(fetchPool, channel, fetcher),
          loader(contentPool, extractor, std::nullopt),
          db(":memory:"),
          controller(state, db, refresher, loader, settings()),
          loop(state, controller, *channel, input, view, 10) {
        alpha = db.upsertFeed("https://alpha.example/feed", "Alpha");
        beta = db.upsertFeed("https://beta.example/feed", "Beta");
        controller.loadFromStorage();
    }

    static ControllerSettings settings() {
        ControllerSettings s;
        s.statusTimeoutSeconds = 0;
        return s;
    }

    struct Guard {
        EventLoop* loop;
        bool expired = false;
    };

    struct Watch {
        TestEventLoop* test;
        bool (*done)(const TestEventLoop&);
        bool fired = false;
    };

    // Runs the loop until done() holds after some dispatch, or five seconds
    // pass. Returns false on timeout.
    bool runUntil(bool (*done)(const TestEventLoop&)) {
        Watch watch{this, done};
        guint poller = g_timeout_add(5, [](gpointer data) -> gboolean {
            auto* w = static_cast<Watch*>(data);
            if (!w->done(*w->test)) return G_SOURCE_CONTINUE;
            w->fired = true;
            w->test->loop.quit();
            return G_SOURCE_REMOVE;
        }, &watch);
        Guard guard{&loop};
        guint stopper = g_timeout_add(5000, [](gpointer data) -> gboolean {
            auto* g = static_cast<Guard*>(data);
            g->expired = true;
            g->loop->quit();
            return G_SOURCE_REMOVE;
        }, &guard);

        loop.run();

        if (!watch.fired) g_source_remove(poller);
        if (!guard.expired) g_source_remove(stopper);
        return !guard.expired;
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
    PipeInput input;
    RecordingView view;
    EventLoop loop;
    FeedId alpha = 0;
    FeedId beta = 0;
};

TEST_F(TestEventLoop, keysAreAppliedUntilQuit)
{
    input.write("j");
    input.write("\x01");
    input.write("Z");
    input.write("q");

    ASSERT_TRUE(runUntil([](const TestEventLoop&) { return false; }));

    EXPECT_TRUE(state.quit);
    EXPECT_EQ(1u, state.feedCursor);
    EXPECT_EQ(Focus::Feeds, state.focus);
    EXPECT_EQ(InputMode::Normal, state.mode);
    EXPECT_GE(view.renders, 1);
}

TEST_F(TestEventLoop, workerResultsArriveThroughChannel)
{
    fetcher->serve("https://alpha.example/feed", rssDocument("Alpha", {{"a1", "One"}, {"a2", "Two"}}));
    fetcher->serve("https://beta.example/feed", rssDocument("Beta", {{"b1", "Three"}}));
    controller.refreshAll(g_get_monotonic_time());

    ASSERT_TRUE(runUntil([](const TestEventLoop& t) { return t.state.lastBatch.has_value(); }));

    EXPECT_EQ(2u, state.lastBatch->total);
    EXPECT_EQ(2u, state.lastBatch->succeeded);
    EXPECT_EQ(0u, state.refreshPending);
    EXPECT_EQ(3u, state.articles.size());
    EXPECT_EQ(2u, db.countArticles(alpha));
    EXPECT_GE(view.renders, 2);
}

TEST_F(TestEventLoop, tickExpiresStatus)
{
    state.setStatus("Hello", g_get_monotonic_time());

    ASSERT_TRUE(runUntil([](const TestEventLoop& t) { return t.state.status.empty() && t.view.renders >= 2; }));

    EXPECT_TRUE(view.lastStatus.empty());
}

TEST_F(TestEventLoop, tickPicksUpKeysWithoutReadableInput)
{
    KeyEvent resize;
    resize.key = Key::Resize;
    input.inject(resize);
    KeyEvent down;
    down.key = Key::Down;
    input.inject(down);

    ASSERT_TRUE(runUntil([](const TestEventLoop& t) { return t.view.renders >= 2; }));

    EXPECT_EQ(1u, state.feedCursor);
}

TEST_F(TestEventLoop, closedInputEndsLoop)
{
    input.closeWriter();

    ASSERT_TRUE(runUntil([](const TestEventLoop&) { return false; }));

    EXPECT_TRUE(state.quit);
}
