#include "utils/Opml.hpp"
#include "utils/Errors.hpp"
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <glib.h>
#include <cstring>

namespace NewsDeck {
namespace Opml {

static std::string attr(xmlNodePtr node, const char* name) {
    xmlChar* value = xmlGetProp(node, reinterpret_cast<const xmlChar*>(name));
    if (!value) return "";
    std::string result(reinterpret_cast<char*>(value));
    xmlFree(value);
    return result;
}

static bool isElement(xmlNodePtr node, const char* name) {
    return node->type == XML_ELEMENT_NODE && strcmp(reinterpret_cast<const char*>(node->name), name) == 0;
}

static OpmlOutline readOutline(xmlNodePtr node) {
    OpmlOutline outline;
    outline.xmlUrl = attr(node, "xmlUrl");
    outline.htmlUrl = attr(node, "htmlUrl");
    outline.title = attr(node, "title");
    if (outline.title.empty()) outline.title = attr(node, "text");
    if (outline.title.empty()) outline.title = outline.xmlUrl;

    if (!outline.isFeed()) {
        for (xmlNodePtr child = node->children; child; child = child->next) {
            if (isElement(child, "outline")) outline.children.push_back(readOutline(child));
        }
    }
    return outline;
}

OpmlDocument decode(const std::string& bytes) {
    xmlDocPtr doc = xmlReadMemory(bytes.c_str(), static_cast<int>(bytes.size()), nullptr, nullptr,
                                  XML_PARSE_NOERROR | XML_PARSE_NOWARNING | XML_PARSE_NONET);
    if (!doc) throw OpmlError("OPML document is not well-formed XML");

    xmlNodePtr root = xmlDocGetRootElement(doc);
    if (!root || !isElement(root, "opml")) {
        xmlFreeDoc(doc);
        throw OpmlError("missing <opml> root element");
    }

    OpmlDocument document;
    for (xmlNodePtr section = root->children; section; section = section->next) {
        if (isElement(section, "head")) {
            for (xmlNodePtr h = section->children; h; h = h->next) {
                if (!isElement(h, "title")) continue;
                xmlChar* text = xmlNodeGetContent(h);
                if (text) {
                    document.title = reinterpret_cast<char*>(text);
                    xmlFree(text);
                }
            }
        } else if (isElement(section, "body")) {
            for (xmlNodePtr child = section->children; child; child = child->next) {
                if (isElement(child, "outline")) document.outlines.push_back(readOutline(child));
            }
        }
    }
    xmlFreeDoc(doc);
    return document;
}

static void writeOutline(xmlNodePtr parent, const OpmlOutline& outline) {
    xmlNodePtr node = xmlNewChild(parent, nullptr, BAD_CAST "outline", nullptr);
    xmlNewProp(node, BAD_CAST "text", BAD_CAST outline.title.c_str());
    xmlNewProp(node, BAD_CAST "title", BAD_CAST outline.title.c_str());
    if (outline.isFeed()) {
        xmlNewProp(node, BAD_CAST "type", BAD_CAST "rss");
        xmlNewProp(node, BAD_CAST "xmlUrl", BAD_CAST outline.xmlUrl.c_str());
        if (!outline.htmlUrl.empty()) xmlNewProp(node, BAD_CAST "htmlUrl", BAD_CAST outline.htmlUrl.c_str());
        return;
    }
    for (const auto& child : outline.children) writeOutline(node, child);
}

std::string encode(const OpmlDocument& document) {
    xmlDocPtr doc = xmlNewDoc(BAD_CAST "1.0");
    xmlNodePtr root = xmlNewNode(nullptr, BAD_CAST "opml");
    xmlNewProp(root, BAD_CAST "version", BAD_CAST "2.0");
    xmlDocSetRootElement(doc, root);

    xmlNodePtr head = xmlNewChild(root, nullptr, BAD_CAST "head", nullptr);
    // xmlNewTextChild escapes the title; xmlNewChild would not.
    xmlNewTextChild(head, nullptr, BAD_CAST "title",
                    BAD_CAST(document.title.empty() ? "NewsDeck subscriptions" : document.title.c_str()));
    xmlNodePtr body = xmlNewChild(root, nullptr, BAD_CAST "body", nullptr);
    for (const auto& outline : document.outlines) writeOutline(body, outline);

    xmlChar* buffer = nullptr;
    int size = 0;
    xmlDocDumpFormatMemoryEnc(doc, &buffer, &size, "UTF-8", 1);
    std::string result = buffer ? std::string(reinterpret_cast<char*>(buffer), size) : "";
    if (buffer) xmlFree(buffer);
    xmlFreeDoc(doc);
    return result;
}

OpmlDocument readFile(const std::string& path) {
    gchar* contents = nullptr;
    gsize length = 0;
    GError* error = nullptr;
    if (!g_file_get_contents(path.c_str(), &contents, &length, &error)) {
        std::string message = error ? error->message : "unknown error";
        if (error) g_error_free(error);
        throw OpmlError("cannot read " + path + ": " + message);
    }
    std::string bytes(contents, length);
    g_free(contents);
    return decode(bytes);
}

void writeFile(const std::string& path, const OpmlDocument& document) {
    std::string bytes = encode(document);
    GError* error = nullptr;
    if (!g_file_set_contents(path.c_str(), bytes.c_str(), static_cast<gssize>(bytes.size()), &error)) {
        std::string message = error ? error->message : "unknown error";
        if (error) g_error_free(error);
        throw OpmlError("cannot write " + path + ": " + message);
    }
}

size_t countFeeds(const std::vector<OpmlOutline>& outlines) {
    size_t count = 0;
    for (const auto& o : outlines) count += o.isFeed() ? 1 : countFeeds(o.children);
    return count;
}

}
}
