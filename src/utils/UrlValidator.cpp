#include "utils/UrlValidator.hpp"
#include <gio/gio.h>
#include <glib.h>
#include <cstring>

namespace NewsDeck {

static bool isRestrictedAddress(GInetAddress* address) {
    if (g_inet_address_get_is_loopback(address) || g_inet_address_get_is_any(address) ||
        g_inet_address_get_is_link_local(address) || g_inet_address_get_is_site_local(address)) {
        return true;
    }
    if (g_inet_address_get_family(address) != G_SOCKET_FAMILY_IPV6) return false;

    const guint8* bytes = g_inet_address_to_bytes(address);
    if ((bytes[0] & 0xfe) == 0xfc) return true;   // fc00::/7 unique local

    static const guint8 mappedPrefix[12] = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xff, 0xff};
    if (memcmp(bytes, mappedPrefix, sizeof(mappedPrefix)) != 0) return false;
    GInetAddress* v4 = g_inet_address_new_from_bytes(bytes + 12, G_SOCKET_FAMILY_IPV4);
    bool restricted = isRestrictedAddress(v4);
    g_object_unref(v4);
    return restricted;
}

bool UrlValidator::isRestrictedHost(const std::string& rawHost) {
    std::string host = rawHost;
    if (host.size() > 2 && host.front() == '[' && host.back() == ']') host = host.substr(1, host.size() - 2);
    size_t zone = host.find('%');
    if (zone != std::string::npos) host.erase(zone);
    while (!host.empty() && host.back() == '.') host.pop_back();
    if (host.empty()) return true;

    gchar* lower = g_ascii_strdown(host.c_str(), -1);
    bool local = strcmp(lower, "localhost") == 0 || g_str_has_suffix(lower, ".localhost");
    g_free(lower);
    if (local) return true;

    GInetAddress* address = g_inet_address_new_from_string(host.c_str());
    if (!address) {
        // Bare numbers such as 2130706433 are still read as IPv4 by resolvers.
        return host.find_first_not_of("0123456789.") == std::string::npos;
    }
    bool restricted = isRestrictedAddress(address);
    g_object_unref(address);
    return restricted;
}

std::string UrlValidator::checkRemote(const std::string& url) {
    GError* error = nullptr;
    GUri* uri = g_uri_parse(url.c_str(), G_URI_FLAGS_NONE, &error);
    if (!uri) {
        std::string message = error ? error->message : "unparsable";
        g_clear_error(&error);
        return "Invalid URL: " + message;
    }
    std::string scheme = g_uri_get_scheme(uri) ? g_uri_get_scheme(uri) : "";
    std::string host = g_uri_get_host(uri) ? g_uri_get_host(uri) : "";
    g_uri_unref(uri);

    gchar* lowerScheme = g_ascii_strdown(scheme.c_str(), -1);
    scheme = lowerScheme;
    g_free(lowerScheme);
    if (scheme != "http" && scheme != "https") return "Unsupported scheme: " + scheme + " (only http/https allowed)";
    if (host.empty()) return "URL has no host";
    if (isRestrictedHost(host)) return "URL points to a restricted address";
    return "";
}

std::string UrlValidator::checkForOpen(const std::string& url) {
    for (unsigned char c : url) {
        if (c < 32 || c == 127) return "URL contains invalid control characters";
    }
    if (url.find("\xE2\x80\xA8") != std::string::npos || url.find("\xE2\x80\xA9") != std::string::npos) {
        return "URL contains Unicode line separator characters";
    }
    for (const char* encoded : {"%0A", "%0a", "%0D", "%0d"}) {
        if (url.find(encoded) != std::string::npos) return "URL contains encoded control characters";
    }
    if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) return "URL must use http or https scheme";
    if (url.find_first_of("`$;|<>(){}\\") != std::string::npos) return "URL contains potentially unsafe characters";
    return checkRemote(url);
}

}
