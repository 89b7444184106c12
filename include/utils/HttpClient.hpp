#pragma once
#include <string>
#include <map>
#include <vector>

namespace NewsDeck {

class HttpClient {
public:
    HttpClient();
    ~HttpClient() = default;

    struct Response {
        int statusCode;
        std::string body;
        std::map<std::string, std::string> headers;
        bool success;
        bool timedOut;
        bool tooLarge;
        std::string error;
        std::string effectiveUrl;
    };

    // curl_global_init is not thread-safe; call once from main before any worker starts.
    static void globalInit();
    static void globalCleanup();

    Response get(const std::string& url);
    void setUserAgent(const std::string& userAgent);
    void setTimeout(long timeoutSeconds);
    void setMaxBodySize(size_t bytes);
    void setHeader(const std::string& name, const std::string& value);

    // Adds one "Name: value" line to headers, lower-casing the name.
    static void parseHeaderLine(const std::string& line, std::map<std::string, std::string>& headers);

private:
    struct BodySink {
        std::string* body;
        size_t limit;
        bool overflow;
    };

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);
    std::string userAgent_;
    long timeout_;
    size_t maxBodySize_;
    std::vector<std::string> requestHeaders_;
};

}
