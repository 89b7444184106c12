#pragma once
#include <string>
#include <vector>

namespace NewsDeck {

// A folder outline (no xmlUrl) maps to a category, a feed outline to a subscription.
struct OpmlOutline {
    std::string title;
    std::string xmlUrl;
    std::string htmlUrl;
    std::vector<OpmlOutline> children;

    bool isFeed() const { return !xmlUrl.empty(); }
};

struct OpmlDocument {
    std::string title;
    std::vector<OpmlOutline> outlines;
};

namespace Opml {

// Throws OpmlError on malformed input.
OpmlDocument decode(const std::string& bytes);
std::string encode(const OpmlDocument& document);

OpmlDocument readFile(const std::string& path);
// Written atomically through a temporary file.
void writeFile(const std::string& path, const OpmlDocument& document);

size_t countFeeds(const std::vector<OpmlOutline>& outlines);

}

}
