#include "utils/HtmlParser.hpp"
#include <libxml/parser.h>
#include <libxml/xpathInternals.h>
#include <cstring>

namespace NewsDeck {

HtmlParser::HtmlParser() : doc_(nullptr), xpathCtx_(nullptr) {}
HtmlParser::~HtmlParser() { cleanup(); }

void HtmlParser::cleanup() {
    if (xpathCtx_) { xmlXPathFreeContext(xpathCtx_); xpathCtx_ = nullptr; }
    if (doc_) { xmlFreeDoc(doc_); doc_ = nullptr; }
}

bool HtmlParser::parse(const std::string& html) {
    cleanup();
    doc_ = htmlReadMemory(html.c_str(), static_cast<int>(html.size()), nullptr, "UTF-8",
                          HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET);
    if (!doc_) return false;
    xpathCtx_ = xmlXPathNewContext(doc_);
    return xpathCtx_ != nullptr;
}

std::string HtmlParser::getAttribute(const std::string& xpath, const std::string& attr) {
    if (!xpathCtx_) return "";
    xmlXPathObjectPtr result = xmlXPathEvalExpression(reinterpret_cast<const xmlChar*>(xpath.c_str()), xpathCtx_);
    if (!result) return "";
    std::string value;
    if (result->nodesetval && result->nodesetval->nodeNr > 0) {
        xmlChar* attrVal = xmlGetProp(result->nodesetval->nodeTab[0], reinterpret_cast<const xmlChar*>(attr.c_str()));
        if (attrVal) { value = reinterpret_cast<char*>(attrVal); xmlFree(attrVal); }
    }
    xmlXPathFreeObject(result);
    return value;
}

static bool isBlockElement(const char* name) {
    static const char* const blocks[] = {
        "p", "div", "br", "li", "ul", "ol", "h1", "h2", "h3", "h4", "h5", "h6",
        "blockquote", "pre", "tr", "section", "article", "figure", "hr"
    };
    for (const char* b : blocks) {
        if (strcmp(name, b) == 0) return true;
    }
    return false;
}

static void collectText(xmlNodePtr node, std::string& out) {
    for (xmlNodePtr n = node; n; n = n->next) {
        if (n->type == XML_TEXT_NODE || n->type == XML_CDATA_SECTION_NODE) {
            const char* text = reinterpret_cast<const char*>(n->content);
            if (!text) continue;
            for (const char* p = text; *p; ++p) {
                char c = (*p == '\n' || *p == '\t' || *p == '\r') ? ' ' : *p;
                if (c == ' ' && (out.empty() || out.back() == ' ' || out.back() == '\n')) continue;
                out += c;
            }
        } else if (n->type == XML_ELEMENT_NODE) {
            const char* name = reinterpret_cast<const char*>(n->name);
            if (strcmp(name, "script") == 0 || strcmp(name, "style") == 0) continue;
            bool block = isBlockElement(name);
            if (block && !out.empty() && out.back() != '\n') {
                while (!out.empty() && out.back() == ' ') out.pop_back();
                out += "\n\n";
            }
            collectText(n->children, out);
            if (block && !out.empty() && out.back() != '\n') {
                while (!out.empty() && out.back() == ' ') out.pop_back();
                out += "\n\n";
            }
        }
    }
}

std::string HtmlParser::htmlToText(const std::string& html) {
    if (html.find('<') == std::string::npos && html.find('&') == std::string::npos) {
        size_t start = html.find_first_not_of(" \t\n\r");
        size_t end = html.find_last_not_of(" \t\n\r");
        return (start == std::string::npos) ? "" : html.substr(start, end - start + 1);
    }
    htmlDocPtr doc = htmlReadMemory(html.c_str(), static_cast<int>(html.size()), nullptr, "UTF-8",
                                    HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING |
                                    HTML_PARSE_NONET | HTML_PARSE_NOIMPLIED);
    if (!doc) return "";
    std::string out;
    collectText(doc->children, out);
    xmlFreeDoc(doc);

    // Collapse runs of blank lines down to a single paragraph break.
    std::string collapsed;
    int newlines = 0;
    for (char c : out) {
        if (c == '\n') {
            if (++newlines > 2) continue;
        } else {
            newlines = 0;
        }
        collapsed += c;
    }
    size_t start = collapsed.find_first_not_of(" \n");
    size_t end = collapsed.find_last_not_of(" \n");
    return (start == std::string::npos) ? "" : collapsed.substr(start, end - start + 1);
}

std::string HtmlParser::findFeedLink(const std::string& html) {
    HtmlParser parser;
    if (!parser.parse(html)) return "";
    std::string href = parser.getAttribute(
        "//link[@rel='alternate' and (contains(@type,'rss') or contains(@type,'atom'))]", "href");
    if (href.empty()) {
        href = parser.getAttribute(
            "//link[contains(translate(@href,'RSS','rss'),'rss') or contains(translate(@href,'FEED','feed'),'feed')]",
            "href");
    }
    return href;
}

std::string HtmlParser::resolveUrl(const std::string& base, const std::string& href) {
    if (href.rfind("http://", 0) == 0 || href.rfind("https://", 0) == 0) return href;
    size_t s = base.find("://");
    std::string scheme = "https";
    std::string host = base;
    if (s != std::string::npos) {
        scheme = base.substr(0, s);
        size_t start = s + 3;
        size_t end = base.find('/', start);
        host = (end == std::string::npos) ? base.substr(start) : base.substr(start, end - start);
    }
    if (href.rfind("//", 0) == 0) return scheme + ":" + href;
    if (href.rfind("/", 0) == 0) return scheme + "://" + host + href;
    size_t hostStart = (s == std::string::npos) ? 0 : s + 3;
    size_t pos = base.rfind('/');
    std::string basepath = (pos == std::string::npos || pos < hostStart) ? base + "/" : base.substr(0, pos + 1);
    return basepath + href;
}

}
