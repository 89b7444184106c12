#pragma once
#include <string>
#include <libxml/HTMLparser.h>
#include <libxml/xpath.h>

namespace NewsDeck {

class HtmlParser {
public:
    HtmlParser();
    ~HtmlParser();
    HtmlParser(const HtmlParser&) = delete;
    HtmlParser& operator=(const HtmlParser&) = delete;

    bool parse(const std::string& html);
    std::string getAttribute(const std::string& xpath, const std::string& attr);

    // Plain text of an HTML fragment with block elements separated by blank lines.
    static std::string htmlToText(const std::string& html);
    // href of the first <link rel="alternate"> that advertises an RSS or Atom feed.
    static std::string findFeedLink(const std::string& html);
    static std::string resolveUrl(const std::string& base, const std::string& href);

private:
    htmlDocPtr doc_;
    xmlXPathContextPtr xpathCtx_;
    void cleanup();
};

}
