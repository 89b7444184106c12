#pragma once
#include "utils/Errors.hpp"
#include <optional>
#include <string>

namespace NewsDeck {

struct ExtractOutcome {
    bool success = false;
    std::string text;
    TaskError error;
};

// Called from worker threads.
class ContentExtractor {
public:
    virtual ~ContentExtractor() = default;

    virtual ExtractOutcome extract(const std::string& articleUrl,
                                   const std::optional<std::string>& apiKey) = 0;
};

// Readable text through a reader service that takes the article URL as path
// (GET <base>/<article-url>) and honours an X-Target-Selector header.
class HttpContentExtractor : public ContentExtractor {
public:
    HttpContentExtractor(std::string baseUrl, std::string userAgent, long timeoutSeconds);

    ExtractOutcome extract(const std::string& articleUrl,
                           const std::optional<std::string>& apiKey) override;

    void setBackoffBase(unsigned long microseconds) { backoffBase_ = microseconds; }

    static bool isAcceptableBaseUrl(const std::string& baseUrl);
    static bool isArticleUrl(const std::string& url);
    static std::string stripBoilerplate(const std::string& text);

    static constexpr size_t MinContentLength = 200;
    static constexpr size_t MaxBodySize = 5 * 1024 * 1024;

private:
    struct Attempt {
        bool success;
        bool tryNext;       // response too short or selector rejected
        std::string text;
        TaskError error;
    };

    Attempt fetchWithRetry(const std::string& url, const char* selector,
                           const std::optional<std::string>& apiKey);
    static void acquireRateSlot();

    std::string baseUrl_;
    std::string userAgent_;
    long timeoutSeconds_;
    unsigned long backoffBase_;
};

}
