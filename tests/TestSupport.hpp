#pragma once
#include "app/EventChannel.hpp"
#include "services/ContentExtractor.hpp"
#include "services/FeedFetcher.hpp"
#include <glib.h>
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace NewsDeck {
namespace Testing {

inline std::string rssDocument(const std::string& title, const std::vector<std::pair<std::string, std::string>>& items) {
    std::string xml = "<?xml version=\"1.0\"?><rss version=\"2.0\"><channel><title>" + title +
                      "</title><link>https://example.org/</link>";
    for (const auto& item : items) {
        xml += "<item><guid>" + item.first + "</guid><title>" + item.second + "</title><link>https://example.org/" +
               item.first + "</link><description>Summary of " + item.second + "</description></item>";
    }
    xml += "</channel></rss>";
    return xml;
}

// Serves canned documents by URL; unknown URLs fail with a network error.
class FakeFeedFetcher : public FeedFetcher {
public:
    struct Reply {
        bool success = true;
        ErrorKind kind = ErrorKind::Network;
        std::string body;
        std::string contentType = "application/rss+xml";
        unsigned delayMs = 0;
    };

    void serve(const std::string& url, const std::string& body, unsigned delayMs = 0) {
        Reply reply;
        reply.body = body;
        reply.delayMs = delayMs;
        replies_[url] = reply;
    }

    void fail(const std::string& url, ErrorKind kind, unsigned delayMs = 0) {
        Reply reply;
        reply.success = false;
        reply.kind = kind;
        reply.delayMs = delayMs;
        replies_[url] = reply;
    }

    FetchOutcome fetch(const std::string& url) override {
        int now = ++running_;
        int peak = peak_.load();
        while (now > peak && !peak_.compare_exchange_weak(peak, now)) {}
        ++calls_;

        FetchOutcome outcome;
        auto it = replies_.find(url);
        if (it == replies_.end()) {
            outcome.error = {ErrorKind::Network, "no route to " + url, 0};
        } else {
            if (it->second.delayMs) g_usleep(it->second.delayMs * 1000);
            if (it->second.success) {
                outcome.success = true;
                outcome.document = {url, it->second.body, it->second.contentType};
            } else {
                outcome.error = {it->second.kind, it->second.kind == ErrorKind::Timeout ? "timed out" : "refused", 0};
            }
        }
        --running_;
        return outcome;
    }

    ParseOutcome parse(const RawDocument& document) override {
        return FeedParser::parse(document.body);
    }

    int peak() const { return peak_.load(); }
    int calls() const { return calls_.load(); }

private:
    std::map<std::string, Reply> replies_;
    std::atomic<int> running_{0};
    std::atomic<int> peak_{0};
    std::atomic<int> calls_{0};
};

// Extraction results by URL. When held, extract() blocks until release().
class FakeContentExtractor : public ContentExtractor {
public:
    void succeed(const std::string& url, const std::string& text) { texts_[url] = text; }

    void hold() {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held_ = false;
        }
        cv_.notify_all();
    }

    ExtractOutcome extract(const std::string& articleUrl, const std::optional<std::string>& /*apiKey*/) override {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !held_; });
        }
        ++calls_;
        ExtractOutcome outcome;
        auto it = texts_.find(articleUrl);
        if (it == texts_.end()) {
            outcome.error = {ErrorKind::Extraction, "service unavailable", 503};
        } else {
            outcome.success = true;
            outcome.text = it->second;
        }
        return outcome;
    }

    int calls() const { return calls_.load(); }

private:
    std::map<std::string, std::string> texts_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool held_ = false;
    std::atomic<int> calls_{0};
};

class ThrowingFeedFetcher : public FeedFetcher {
public:
    FetchOutcome fetch(const std::string& url) override {
        throw std::runtime_error("fetcher exploded on " + url);
    }
    ParseOutcome parse(const RawDocument& document) override { return FeedParser::parse(document.body); }
};

inline constexpr guint64 kWait = 5 * G_USEC_PER_SEC;

}
}
