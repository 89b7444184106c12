#pragma once
#include <optional>
#include <string>

namespace NewsDeck {

enum class LogLevel {
    Warning,
    Info,
    Debug
};

class Config {
public:
    static Config& getInstance();
    explicit Config(std::string path);

    static std::string defaultConfigDir();
    const std::string& path() const { return path_; }

    // Refresh cadence; 0 disables automatic refresh.
    unsigned getRefreshIntervalMinutes() const { return refreshIntervalMinutes_; }
    void setRefreshIntervalMinutes(unsigned minutes) { refreshIntervalMinutes_ = minutes; }

    bool getMarkReadOnOpen() const { return markReadOnOpen_; }
    void setMarkReadOnOpen(bool value) { markReadOnOpen_ = value; }

    long getFetchTimeoutSeconds() const { return fetchTimeoutSeconds_; }
    long getExtractTimeoutSeconds() const { return extractTimeoutSeconds_; }
    unsigned getStatusTimeoutSeconds() const { return statusTimeoutSeconds_; }

    const std::string& getExtractorBaseUrl() const { return extractorBaseUrl_; }
    void setExtractorBaseUrl(const std::string& url) { extractorBaseUrl_ = url; }

    // JINA_API_KEY in the environment wins over the file.
    std::optional<std::string> getApiKey() const;
    void setApiKey(const std::string& key) { apiKey_ = key; }

    std::string getDatabasePath() const;
    void setDatabasePath(const std::string& path) { databasePath_ = path; }

    const std::string& getBrowser() const { return browser_; }
    const std::string& getUserAgent() const { return userAgent_; }

    LogLevel getLogLevel() const { return logLevel_; }
    void setLogLevel(LogLevel level) { logLevel_ = level; }

    void load();
    void save() const;

private:
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void resetDefaults();

    std::string path_;
    unsigned refreshIntervalMinutes_ = 0;
    bool markReadOnOpen_ = true;
    long fetchTimeoutSeconds_ = 30;
    long extractTimeoutSeconds_ = 20;
    unsigned statusTimeoutSeconds_ = 5;
    std::string extractorBaseUrl_;
    std::string apiKey_;
    std::string databasePath_;
    std::string browser_;
    std::string userAgent_;
    LogLevel logLevel_ = LogLevel::Info;
};

}
