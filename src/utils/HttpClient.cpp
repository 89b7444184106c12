#include "utils/HttpClient.hpp"
#include <curl/curl.h>
#include <glib.h>
#include <algorithm>

namespace NewsDeck {

HttpClient::HttpClient()
    : userAgent_("NewsDeck/0.1 (+terminal feed reader)"), timeout_(30), maxBodySize_(10 * 1024 * 1024) {}

void HttpClient::globalInit() { curl_global_init(CURL_GLOBAL_ALL); }

void HttpClient::globalCleanup() { curl_global_cleanup(); }

size_t HttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* sink = static_cast<BodySink*>(userp);
    size_t total = size * nmemb;
    if (sink->body->size() + total > sink->limit) {
        sink->overflow = true;
        return 0;
    }
    sink->body->append(static_cast<char*>(contents), total);
    return total;
}

void HttpClient::parseHeaderLine(const std::string& line, std::map<std::string, std::string>& headers) {
    size_t pos = line.find(':');
    if (pos == std::string::npos) return;
    std::string key = line.substr(0, pos);
    for (char& c : key) c = g_ascii_tolower(c);
    std::string val = line.substr(pos + 1);
    val.erase(0, val.find_first_not_of(" \t"));
    val.erase(val.find_last_not_of(" \t\r\n") + 1);
    headers[key] = val;
}

size_t HttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    parseHeaderLine(std::string(buffer, size * nitems), *headers);
    return size * nitems;
}

HttpClient::Response HttpClient::get(const std::string& url) {
    Response response{0, "", {}, false, false, false, "", url};
    CURL* curl = curl_easy_init();
    if (!curl) { response.error = "CURL init failed"; return response; }

    BodySink sink{&response.body, maxBodySize_, false};
    struct curl_slist* headerList = nullptr;
    for (const auto& h : requestHeaders_) headerList = curl_slist_append(headerList, h.c_str());

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent_.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, std::min(timeout_, 10L));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(maxBodySize_));
    if (headerList) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        long httpCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
        response.statusCode = static_cast<int>(httpCode);
        char* effective = nullptr;
        if (curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
            response.effectiveUrl = effective;
        }
        response.success = (httpCode >= 200 && httpCode < 300);
        if (!response.success) response.error = "HTTP status " + std::to_string(httpCode);
    } else {
        response.timedOut = (res == CURLE_OPERATION_TIMEDOUT);
        response.tooLarge = sink.overflow || res == CURLE_FILESIZE_EXCEEDED;
        response.error = response.tooLarge ? "response too large" : curl_easy_strerror(res);
    }
    if (headerList) curl_slist_free_all(headerList);
    curl_easy_cleanup(curl);
    return response;
}

void HttpClient::setUserAgent(const std::string& ua) { userAgent_ = ua; }
void HttpClient::setTimeout(long t) { timeout_ = t; }
void HttpClient::setMaxBodySize(size_t bytes) { maxBodySize_ = bytes; }

void HttpClient::setHeader(const std::string& name, const std::string& value) {
    requestHeaders_.push_back(name + ": " + value);
}

}
