#pragma once
#include "utils/Errors.hpp"
#include "utils/FeedParser.hpp"
#include <string>

namespace NewsDeck {

struct RawDocument {
    std::string url;            // final URL after redirects
    std::string body;
    std::string contentType;
};

struct FetchOutcome {
    bool success = false;
    RawDocument document;
    TaskError error;
};

// Called from worker threads; implementations must not share mutable state
// between calls.
class FeedFetcher {
public:
    virtual ~FeedFetcher() = default;

    virtual FetchOutcome fetch(const std::string& url) = 0;
    virtual ParseOutcome parse(const RawDocument& document) = 0;
};

struct RetrievedFeed {
    bool success = false;
    std::string resolvedUrl;    // set when the feed was found through a web page
    ParsedFeed feed;
    TaskError error;
};

// fetch then parse, following the page's advertised feed link once when the
// URL points at an HTML page.
RetrievedFeed retrieveFeed(FeedFetcher& fetcher, const std::string& url);

class HttpFeedFetcher : public FeedFetcher {
public:
    HttpFeedFetcher(std::string userAgent, long timeoutSeconds);

    FetchOutcome fetch(const std::string& url) override;
    ParseOutcome parse(const RawDocument& document) override;

    // Delay before the first retry, doubled for each further retry.
    void setBackoffBase(unsigned long microseconds) { backoffBase_ = microseconds; }

    static constexpr int MaxRetries = 3;
    static constexpr size_t MaxBodySize = 10 * 1024 * 1024;

private:
    static bool retryable(int statusCode);

    std::string userAgent_;
    long timeoutSeconds_;
    unsigned long backoffBase_;
};

}
