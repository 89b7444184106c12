#include "services/ContentExtractor.hpp"
#include "utils/FeedParser.hpp"
#include "utils/HttpClient.hpp"
#include "utils/UrlValidator.hpp"
#include <glib.h>
#include <cstring>
#include <mutex>
#include <sstream>
#include <vector>

namespace NewsDeck {

static const char* const kSemanticSelectors =
    "article, .entry-content, .post-content, .article-content, .post-body, main .content, main";
static const char* const kFallbackSelector = ".container";
static const gint64 kMinRequestInterval = G_USEC_PER_SEC / 10;

static std::mutex rateMutex;
static gint64 lastRequest = 0;

HttpContentExtractor::HttpContentExtractor(std::string baseUrl, std::string userAgent, long timeoutSeconds)
    : baseUrl_(std::move(baseUrl)), userAgent_(std::move(userAgent)), timeoutSeconds_(timeoutSeconds),
      backoffBase_(G_USEC_PER_SEC) {
    while (!baseUrl_.empty() && baseUrl_.back() == '/') baseUrl_.pop_back();
}

void HttpContentExtractor::acquireRateSlot() {
    std::lock_guard<std::mutex> lock(rateMutex);
    gint64 now = g_get_monotonic_time();
    if (lastRequest != 0 && now - lastRequest < kMinRequestInterval) {
        g_usleep(static_cast<gulong>(kMinRequestInterval - (now - lastRequest)));
    }
    lastRequest = g_get_monotonic_time();
}

static bool isLoopback(const std::string& host) {
    if (host == "localhost" || host == "::1" || host == "[::1]") return true;
    return g_hostname_is_ip_address(host.c_str()) && host.rfind("127.", 0) == 0;
}

bool HttpContentExtractor::isAcceptableBaseUrl(const std::string& baseUrl) {
    GUri* uri = g_uri_parse(baseUrl.c_str(), G_URI_FLAGS_NONE, nullptr);
    if (!uri) return false;
    std::string scheme = g_uri_get_scheme(uri) ? g_uri_get_scheme(uri) : "";
    std::string host = g_uri_get_host(uri) ? g_uri_get_host(uri) : "";
    g_uri_unref(uri);
    if (scheme == "https") return !host.empty();
    return scheme == "http" && isLoopback(host);
}

bool HttpContentExtractor::isArticleUrl(const std::string& url) {
    return UrlValidator::checkRemote(url).empty();
}

static bool isArchiveLink(const std::string& line) {
    static const char* const months[] = {"January", "February", "March", "April", "May", "June", "July",
                                         "August", "September", "October", "November", "December"};
    size_t start = line.find_first_not_of(" \t");
    if (start == std::string::npos || line[start] != '*') return false;
    for (const char* month : months) {
        size_t pos = line.find(std::string("[") + month + " ");
        if (pos == std::string::npos) continue;
        size_t year = pos + strlen(month) + 2;
        if (year + 4 <= line.size() && g_ascii_isdigit(line[year]) && g_ascii_isdigit(line[year + 3])) return true;
    }
    return false;
}

std::string HttpContentExtractor::stripBoilerplate(const std::string& text) {
    std::vector<std::string> kept;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        size_t first = line.find_first_not_of(" \t\r");
        std::string trimmed = first == std::string::npos ? "" : line.substr(first);
        while (!trimmed.empty() && (trimmed.back() == ' ' || trimmed.back() == '\r')) trimmed.pop_back();

        if (trimmed.rfind("[Skip to content]", 0) == 0) continue;
        if (trimmed == "Loading Comments..." || trimmed == "Write a Comment..." ||
            trimmed.rfind("Email (Required)", 0) == 0 || trimmed == "%d") continue;
        if (trimmed.find("Proudly powered by WordPress") != std::string::npos) continue;
        if (trimmed == "Menu") continue;
        kept.push_back(line);
    }

    // Runs of three or more month-archive links are sidebar navigation.
    std::vector<std::string> result;
    size_t runStart = 0, runLength = 0;
    for (const auto& l : kept) {
        if (isArchiveLink(l)) {
            if (runLength == 0) runStart = result.size();
            ++runLength;
            result.push_back(l);
            continue;
        }
        if (runLength >= 3) result.resize(runStart);
        runLength = 0;
        result.push_back(l);
    }
    if (runLength >= 3) result.resize(runStart);

    std::string joined;
    for (size_t i = 0; i < result.size(); ++i) {
        if (i) joined += '\n';
        joined += result[i];
    }
    return joined;
}

HttpContentExtractor::Attempt HttpContentExtractor::fetchWithRetry(const std::string& url, const char* selector,
                                                                   const std::optional<std::string>& apiKey) {
    HttpClient client;
    client.setUserAgent(userAgent_);
    client.setTimeout(timeoutSeconds_);
    client.setMaxBodySize(MaxBodySize);
    client.setHeader("Accept", "text/plain");
    if (selector) client.setHeader("X-Target-Selector", selector);
    bool official = url.rfind("https://r.jina.ai/", 0) == 0 || url.rfind("https://api.jina.ai/", 0) == 0;
    if (apiKey && official) client.setHeader("Authorization", "Bearer " + *apiKey);

    for (int attempt = 0;; ++attempt) {
        acquireRateSlot();
        HttpClient::Response response = client.get(url);
        if (response.success) {
            if (response.body.size() < MinContentLength) return {false, true, response.body, {}};
            return {true, false, FeedParser::sanitizeUtf8(response.body), {}};
        }
        if (response.statusCode == 422) return {false, true, "", {}};

        bool transient = !response.tooLarge && (response.statusCode == 0 || response.statusCode >= 500);
        if (!transient || attempt >= 3) {
            ErrorKind kind = response.timedOut ? ErrorKind::Timeout : ErrorKind::Extraction;
            return {false, false, "", {kind, response.error, response.statusCode}};
        }
        unsigned long delay = backoffBase_ << attempt;
        g_debug("Retrying extraction of %s in %lu ms: %s", url.c_str(), delay / 1000, response.error.c_str());
        g_usleep(delay);
    }
}

ExtractOutcome HttpContentExtractor::extract(const std::string& articleUrl,
                                             const std::optional<std::string>& apiKey) {
    ExtractOutcome outcome;
    if (!isArticleUrl(articleUrl)) {
        outcome.error = {ErrorKind::Extraction, "article has no usable link", 0};
        return outcome;
    }
    if (!isAcceptableBaseUrl(baseUrl_)) {
        g_warning("Rejecting extractor base URL %s: https required", baseUrl_.c_str());
        outcome.error = {ErrorKind::Extraction, "extractor base URL must use https", 0};
        return outcome;
    }

    std::string url = baseUrl_ + "/" + articleUrl;
    const char* chain[] = {kSemanticSelectors, kFallbackSelector};
    for (const char* selector : chain) {
        Attempt attempt = fetchWithRetry(url, selector, apiKey);
        if (attempt.success) {
            outcome.success = true;
            outcome.text = stripBoilerplate(attempt.text);
            return outcome;
        }
        if (!attempt.tryNext) {
            outcome.error = attempt.error;
            return outcome;
        }
        g_debug("Selector \"%s\" gave no content for %s", selector, articleUrl.c_str());
    }

    Attempt attempt = fetchWithRetry(url, nullptr, apiKey);
    if (attempt.success || attempt.tryNext) {
        if (attempt.text.empty()) {
            outcome.error = {ErrorKind::Extraction, "service returned no content", 0};
            return outcome;
        }
        outcome.success = true;
        outcome.text = stripBoilerplate(FeedParser::sanitizeUtf8(attempt.text));
        return outcome;
    }
    outcome.error = attempt.error;
    return outcome;
}

}
