#include "utils/HtmlParser.hpp"
#include <gtest/gtest.h>

using namespace NewsDeck;

TEST(TestHtmlParser, findsAdvertisedFeed)
{
    const std::string html = R"(<html><head>
<link rel="stylesheet" href="/style.css">
<link rel="alternate" type="application/atom+xml" href="/atom.xml">
</head><body></body></html>)";

    EXPECT_EQ("/atom.xml", HtmlParser::findFeedLink(html));
}

TEST(TestHtmlParser, fallsBackToFeedLikeHref)
{
    EXPECT_EQ("https://example.org/rss", HtmlParser::findFeedLink(
        "<html><head><link rel=\"x\" href=\"https://example.org/rss\"></head></html>"));
    EXPECT_EQ("", HtmlParser::findFeedLink("<html><head><title>None</title></head></html>"));
}

TEST(TestHtmlParser, resolvesRelativeUrls)
{
    EXPECT_EQ("https://example.org/feed.xml", HtmlParser::resolveUrl("https://example.org/blog/post", "/feed.xml"));
    EXPECT_EQ("https://example.org/blog/feed.xml", HtmlParser::resolveUrl("https://example.org/blog/post", "feed.xml"));
    EXPECT_EQ("https://cdn.example/f", HtmlParser::resolveUrl("https://example.org/", "//cdn.example/f"));
    EXPECT_EQ("http://other.example/x", HtmlParser::resolveUrl("https://example.org/", "http://other.example/x"));
    EXPECT_EQ("https://example.org/feed", HtmlParser::resolveUrl("https://example.org", "feed"));
}

TEST(TestHtmlParser, htmlToTextSeparatesBlocksAndSkipsScripts)
{
    std::string text = HtmlParser::htmlToText(
        "<p>First   paragraph</p><script>var x = 1;</script><div>Second <em>one</em></div>");

    EXPECT_EQ("First paragraph\n\nSecond one", text);
}

TEST(TestHtmlParser, htmlToTextPassesPlainTextThrough)
{
    EXPECT_EQ("just text", HtmlParser::htmlToText("  just text \n"));
}
