#include "services/FeedFetcher.hpp"
#include "utils/HttpClient.hpp"
#include "utils/HtmlParser.hpp"
#include <glib.h>

namespace NewsDeck {

RetrievedFeed retrieveFeed(FeedFetcher& fetcher, const std::string& url) {
    RetrievedFeed result;
    FetchOutcome fetched = fetcher.fetch(url);
    if (!fetched.success) {
        result.error = fetched.error;
        return result;
    }

    ParseOutcome parsed = fetcher.parse(fetched.document);
    if (!parsed.success && parsed.isHtml) {
        std::string href = HtmlParser::findFeedLink(fetched.document.body);
        if (href.empty()) {
            result.error = {ErrorKind::Parse, "web page does not advertise a feed", 0};
            return result;
        }
        std::string discovered = HtmlParser::resolveUrl(fetched.document.url, href);
        g_debug("Autodiscovered feed %s from %s", discovered.c_str(), url.c_str());

        fetched = fetcher.fetch(discovered);
        if (!fetched.success) {
            result.error = fetched.error;
            return result;
        }
        parsed = fetcher.parse(fetched.document);
        if (parsed.success) result.resolvedUrl = discovered;
    }

    if (!parsed.success) {
        result.error = parsed.error;
        return result;
    }
    result.success = true;
    result.feed = std::move(parsed.feed);
    return result;
}

HttpFeedFetcher::HttpFeedFetcher(std::string userAgent, long timeoutSeconds)
    : userAgent_(std::move(userAgent)), timeoutSeconds_(timeoutSeconds), backoffBase_(2 * G_USEC_PER_SEC) {}

bool HttpFeedFetcher::retryable(int statusCode) {
    return statusCode == 429 || statusCode >= 500;
}

FetchOutcome HttpFeedFetcher::fetch(const std::string& url) {
    FetchOutcome outcome;
    HttpClient client;
    client.setUserAgent(userAgent_);
    client.setTimeout(timeoutSeconds_);
    client.setMaxBodySize(MaxBodySize);
    client.setHeader("Accept", "application/rss+xml, application/atom+xml, application/xml;q=0.9, text/html;q=0.8, */*;q=0.5");

    HttpClient::Response response;
    for (int attempt = 0;; ++attempt) {
        response = client.get(url);
        if (response.success || !retryable(response.statusCode) || attempt >= MaxRetries) break;
        unsigned long delay = backoffBase_ << attempt;
        g_debug("Retrying %s after HTTP %d (attempt %d, %lu ms)", url.c_str(), response.statusCode,
                attempt + 1, delay / 1000);
        g_usleep(delay);
    }

    if (!response.success) {
        ErrorKind kind = response.timedOut ? ErrorKind::Timeout : ErrorKind::Network;
        outcome.error = {kind, response.error, response.statusCode};
        return outcome;
    }

    outcome.success = true;
    outcome.document.url = response.effectiveUrl;
    outcome.document.body = std::move(response.body);
    auto type = response.headers.find("content-type");
    if (type != response.headers.end()) outcome.document.contentType = type->second;
    return outcome;
}

ParseOutcome HttpFeedFetcher::parse(const RawDocument& document) {
    ParseOutcome outcome = FeedParser::parse(document.body);
    if (!outcome.success && document.contentType.find("text/html") != std::string::npos) {
        outcome.isHtml = true;
    }
    return outcome;
}

}
