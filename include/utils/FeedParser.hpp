#pragma once
#include "storage/Models.hpp"
#include "utils/Errors.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace NewsDeck {

struct ParsedFeed {
    std::string title;
    std::string htmlUrl;
    std::vector<ArticleDraft> articles;
};

struct ParseOutcome {
    bool success = false;
    bool isHtml = false;      // document was a web page rather than a feed
    ParsedFeed feed;
    TaskError error;
};

namespace FeedParser {

// Parses RSS 2.0, RSS 1.0 (RDF) and Atom documents.
ParseOutcome parse(const std::string& document);

std::string canonicalLink(const std::string& link);
// Dedup key of an entry: its own id, else its canonical link, else a content hash.
std::string entryGuid(const std::string& id, const std::string& link, const std::string& title,
                      std::int64_t published);
// RFC 3339 or RFC 822; 0 when unparseable.
std::int64_t parseDate(const std::string& text);
std::string sanitizeUtf8(const std::string& input);

}

}
