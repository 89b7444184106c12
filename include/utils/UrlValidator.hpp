#pragma once
#include <string>

namespace NewsDeck {

// Checks for URLs that come from users or from feed content. Each check
// returns an empty string when the URL is acceptable, otherwise the reason.
class UrlValidator {
public:
    // http(s) with a host that is not localhost, loopback, private,
    // link-local or unspecified.
    static std::string checkRemote(const std::string& url);

    // checkRemote plus the characters an external launcher must never see.
    static std::string checkForOpen(const std::string& url);

    static bool isRestrictedHost(const std::string& host);
};

}
