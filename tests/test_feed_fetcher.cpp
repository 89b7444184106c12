#include "services/FeedFetcher.hpp"
#include "utils/HttpClient.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>

using namespace NewsDeck;
using namespace NewsDeck::Testing;

TEST(TestFeedFetcher, retrievesFeedDirectly)
{
    FakeFeedFetcher fetcher;
    fetcher.serve("https://a.example/feed", rssDocument("A", {{"1", "One"}, {"2", "Two"}}));

    RetrievedFeed result = retrieveFeed(fetcher, "https://a.example/feed");

    ASSERT_TRUE(result.success);
    EXPECT_EQ("A", result.feed.title);
    EXPECT_EQ(2u, result.feed.articles.size());
    EXPECT_TRUE(result.resolvedUrl.empty());
}

TEST(TestFeedFetcher, followsAdvertisedFeedOfWebPage)
{
    FakeFeedFetcher fetcher;
    fetcher.serve("https://blog.example/posts/",
                  "<!DOCTYPE html><html><head><link rel=\"alternate\" type=\"application/rss+xml\" "
                  "href=\"/index.xml\"></head><body>hi</body></html>");
    fetcher.serve("https://blog.example/index.xml", rssDocument("Blog", {{"p", "Post"}}));

    RetrievedFeed result = retrieveFeed(fetcher, "https://blog.example/posts/");

    ASSERT_TRUE(result.success);
    EXPECT_EQ("https://blog.example/index.xml", result.resolvedUrl);
    EXPECT_EQ("Blog", result.feed.title);
    EXPECT_EQ(2, fetcher.calls());
}

TEST(TestFeedFetcher, webPageWithoutFeedIsParseError)
{
    FakeFeedFetcher fetcher;
    fetcher.serve("https://plain.example/", "<!DOCTYPE html><html><head><title>x</title></head></html>");

    RetrievedFeed result = retrieveFeed(fetcher, "https://plain.example/");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(ErrorKind::Parse, result.error.kind);
}

TEST(TestFeedFetcher, passesFetchErrorsThrough)
{
    FakeFeedFetcher fetcher;
    fetcher.fail("https://slow.example/feed", ErrorKind::Timeout);

    RetrievedFeed result = retrieveFeed(fetcher, "https://slow.example/feed");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(ErrorKind::Timeout, result.error.kind);
}

TEST(TestFeedFetcher, httpFetcherReportsRefusedConnectionAsNetworkError)
{
    HttpClient::globalInit();
    HttpFeedFetcher fetcher("NewsDeck-test", 5);
    fetcher.setBackoffBase(1000);

    FetchOutcome outcome = fetcher.fetch("http://127.0.0.1:9/feed.xml");

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(ErrorKind::Network, outcome.error.kind);
    EXPECT_FALSE(outcome.error.message.empty());
}

TEST(TestFeedFetcher, headerNamesAreLowerCasedByteSafe)
{
    std::map<std::string, std::string> headers;

    HttpClient::parseHeaderLine("Content-Type:  application/rss+xml\r\n", headers);
    HttpClient::parseHeaderLine("X-\xC3\x84rger: yes\r\n", headers);
    HttpClient::parseHeaderLine("HTTP/1.1 200 OK\r\n", headers);

    EXPECT_EQ("application/rss+xml", headers["content-type"]);
    EXPECT_EQ("yes", headers["x-\xC3\x84rger"]);
    EXPECT_EQ(2u, headers.size());
}
