#include "utils/FeedParser.hpp"
#include "utils/HtmlParser.hpp"
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <curl/curl.h>
#include <glib.h>
#include <cstring>

namespace NewsDeck {
namespace FeedParser {

std::string sanitizeUtf8(const std::string& input) {
    std::string result;
    result.reserve(input.size());
    const char* p = input.c_str();
    while (*p) {
        unsigned char c = static_cast<unsigned char>(*p);
        if (c < 0x80) {
            // Control characters other than newline and tab can corrupt the terminal.
            if (c >= 0x20 || c == '\n' || c == '\t') result += *p;
            p++;
        } else if ((c & 0xE0) == 0xC0 && p[1]) {
            if ((p[1] & 0xC0) == 0x80) {
                result.append(p, 2);
                p += 2;
            } else {
                p++;
            }
        } else if ((c & 0xF0) == 0xE0 && p[1] && p[2]) {
            if ((p[1] & 0xC0) == 0x80 && (p[2] & 0xC0) == 0x80) {
                result.append(p, 3);
                p += 3;
            } else {
                p++;
            }
        } else if ((c & 0xF8) == 0xF0 && p[1] && p[2] && p[3]) {
            if ((p[1] & 0xC0) == 0x80 && (p[2] & 0xC0) == 0x80 && (p[3] & 0xC0) == 0x80) {
                result.append(p, 4);
                p += 4;
            } else {
                p++;
            }
        } else {
            p++;
        }
    }
    return result;
}

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

static std::string nodeText(xmlNodePtr node) {
    xmlChar* content = xmlNodeGetContent(node);
    if (!content) return "";
    std::string result(reinterpret_cast<char*>(content));
    xmlFree(content);
    return trim(result);
}

static std::string prop(xmlNodePtr node, const char* name) {
    xmlChar* value = xmlGetProp(node, reinterpret_cast<const xmlChar*>(name));
    if (!value) return "";
    std::string result(reinterpret_cast<char*>(value));
    xmlFree(value);
    return trim(result);
}

static bool named(xmlNodePtr node, const char* name) {
    return node->type == XML_ELEMENT_NODE && strcmp(reinterpret_cast<const char*>(node->name), name) == 0;
}

static std::string nsPrefix(xmlNodePtr node) {
    return node->ns && node->ns->prefix ? reinterpret_cast<const char*>(node->ns->prefix) : "";
}

std::string canonicalLink(const std::string& link) {
    std::string result = trim(link);
    size_t hash = result.find('#');
    if (hash != std::string::npos) result.erase(hash);
    return result;
}

std::string entryGuid(const std::string& id, const std::string& link, const std::string& title,
                      std::int64_t published) {
    std::string trimmed = trim(id);
    if (!trimmed.empty()) return trimmed;
    std::string canonical = canonicalLink(link);
    if (!canonical.empty()) return canonical;

    std::string input = link + "|" + title + "|" + (published ? std::to_string(published) : "");
    gchar* digest = g_compute_checksum_for_string(G_CHECKSUM_SHA256, input.c_str(), -1);
    std::string result(digest);
    g_free(digest);
    return result;
}

std::int64_t parseDate(const std::string& text) {
    std::string value = trim(text);
    if (value.empty()) return 0;

    GTimeZone* utc = g_time_zone_new_utc();
    GDateTime* dt = g_date_time_new_from_iso8601(value.c_str(), utc);
    g_time_zone_unref(utc);
    if (dt) {
        std::int64_t seconds = g_date_time_to_unix(dt);
        g_date_time_unref(dt);
        return seconds;
    }
    time_t parsed = curl_getdate(value.c_str(), nullptr);
    return parsed < 0 ? 0 : static_cast<std::int64_t>(parsed);
}

static ArticleDraft parseEntry(xmlNodePtr entry, bool atom) {
    std::string id, link, title, summary, content, date, updated;

    for (xmlNodePtr child = entry->children; child; child = child->next) {
        if (child->type != XML_ELEMENT_NODE) continue;
        std::string name(reinterpret_cast<const char*>(child->name));
        std::string ns = nsPrefix(child);

        if (name == "title" && ns.empty()) {
            title = nodeText(child);
        } else if (name == "link" && ns.empty()) {
            if (atom) {
                std::string rel = prop(child, "rel");
                if ((rel.empty() || rel == "alternate") && link.empty()) link = prop(child, "href");
            } else {
                link = nodeText(child);
            }
        } else if (name == "guid" || (name == "id" && atom)) {
            id = nodeText(child);
            if (!atom && link.empty() && prop(child, "isPermaLink") != "false" && id.rfind("http", 0) == 0) {
                link = id;
            }
        } else if (name == "description" || name == "summary") {
            summary = nodeText(child);
        } else if ((name == "encoded" && ns == "content") || (name == "content" && atom && ns.empty())) {
            content = nodeText(child);
        } else if (name == "pubDate" || name == "published" || (name == "date" && ns == "dc")) {
            date = nodeText(child);
        } else if (name == "updated") {
            updated = nodeText(child);
        }
    }

    ArticleDraft draft;
    if (title.find('<') != std::string::npos) title = HtmlParser::htmlToText(title);
    draft.title = sanitizeUtf8(title.empty() ? "Untitled" : title);
    if (draft.title.empty()) draft.title = "Untitled";
    draft.link = canonicalLink(link);
    draft.published = parseDate(date.empty() ? updated : date);
    draft.summary = sanitizeUtf8(HtmlParser::htmlToText(summary.empty() ? content : summary));
    draft.guid = entryGuid(id, draft.link, draft.title, draft.published);
    return draft;
}

static bool looksLikeHtml(const std::string& document) {
    std::string head = document.substr(0, 2048);
    for (auto& c : head) c = static_cast<char>(g_ascii_tolower(c));
    return head.find("<html") != std::string::npos || head.find("<!doctype html") != std::string::npos;
}

ParseOutcome parse(const std::string& document) {
    ParseOutcome outcome;
    outcome.error.kind = ErrorKind::Parse;

    xmlDocPtr doc = xmlReadMemory(document.c_str(), static_cast<int>(document.size()), nullptr, nullptr,
                                  XML_PARSE_RECOVER | XML_PARSE_NOERROR | XML_PARSE_NOWARNING | XML_PARSE_NONET);
    xmlNodePtr root = doc ? xmlDocGetRootElement(doc) : nullptr;
    if (!root) {
        if (doc) xmlFreeDoc(doc);
        outcome.isHtml = looksLikeHtml(document);
        outcome.error.message = outcome.isHtml ? "document is a web page, not a feed" : "document is not well-formed XML";
        return outcome;
    }

    ParsedFeed& feed = outcome.feed;
    if (named(root, "rss")) {
        for (xmlNodePtr channel = root->children; channel; channel = channel->next) {
            if (!named(channel, "channel")) continue;
            for (xmlNodePtr child = channel->children; child; child = child->next) {
                if (named(child, "title") && nsPrefix(child).empty()) feed.title = sanitizeUtf8(nodeText(child));
                else if (named(child, "link") && nsPrefix(child).empty()) feed.htmlUrl = nodeText(child);
                else if (named(child, "item")) feed.articles.push_back(parseEntry(child, false));
            }
        }
        outcome.success = true;
    } else if (named(root, "RDF")) {
        for (xmlNodePtr child = root->children; child; child = child->next) {
            if (named(child, "channel")) {
                for (xmlNodePtr c = child->children; c; c = c->next) {
                    if (named(c, "title")) feed.title = sanitizeUtf8(nodeText(c));
                    else if (named(c, "link")) feed.htmlUrl = nodeText(c);
                }
            } else if (named(child, "item")) {
                feed.articles.push_back(parseEntry(child, false));
            }
        }
        outcome.success = true;
    } else if (named(root, "feed")) {
        for (xmlNodePtr child = root->children; child; child = child->next) {
            if (named(child, "title")) {
                feed.title = sanitizeUtf8(nodeText(child));
            } else if (named(child, "link")) {
                std::string rel = prop(child, "rel");
                if (rel.empty() || rel == "alternate") feed.htmlUrl = prop(child, "href");
            } else if (named(child, "entry")) {
                feed.articles.push_back(parseEntry(child, true));
            }
        }
        outcome.success = true;
    } else if (named(root, "html") || looksLikeHtml(document)) {
        outcome.isHtml = true;
        outcome.error.message = "document is a web page, not a feed";
    } else {
        outcome.error.message = std::string("unrecognised root element <") +
                                reinterpret_cast<const char*>(root->name) + ">";
    }

    xmlFreeDoc(doc);
    return outcome;
}

}
}
