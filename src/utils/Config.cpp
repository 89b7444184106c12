#include "utils/Config.hpp"
#include <json-glib/json-glib.h>
#include <cstdlib>
#include <cstring>

namespace NewsDeck {

Config& Config::getInstance() {
    static Config instance(defaultConfigDir() + "/config.json");
    return instance;
}

Config::Config(std::string path) : path_(std::move(path)) {
    resetDefaults();
}

std::string Config::defaultConfigDir() {
    const char* xdg = getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/newsdeck";
    return std::string(g_get_home_dir()) + "/.config/newsdeck";
}

void Config::resetDefaults() {
    refreshIntervalMinutes_ = 0;
    markReadOnOpen_ = true;
    fetchTimeoutSeconds_ = 30;
    extractTimeoutSeconds_ = 20;
    statusTimeoutSeconds_ = 5;
    extractorBaseUrl_ = "https://r.jina.ai";
    apiKey_.clear();
    databasePath_.clear();
    browser_ = "xdg-open";
    userAgent_ = "NewsDeck/0.1 (+terminal feed reader)";
    logLevel_ = LogLevel::Info;
}

std::optional<std::string> Config::getApiKey() const {
    const char* env = getenv("JINA_API_KEY");
    if (env && *env) return std::string(env);
    if (!apiKey_.empty()) return apiKey_;
    return std::nullopt;
}

std::string Config::getDatabasePath() const {
    if (!databasePath_.empty()) return databasePath_;
    gchar* dir = g_path_get_dirname(path_.c_str());
    std::string result = std::string(dir) + "/newsdeck.db";
    g_free(dir);
    return result;
}

static std::string stringMember(JsonObject* obj, const char* name, const std::string& fallback) {
    if (!json_object_has_member(obj, name)) return fallback;
    const char* value = json_object_get_string_member(obj, name);
    return value ? value : fallback;
}

static gint64 intMember(JsonObject* obj, const char* name, gint64 fallback, gint64 minimum) {
    if (!json_object_has_member(obj, name)) return fallback;
    gint64 value = json_object_get_int_member(obj, name);
    return value < minimum ? fallback : value;
}

void Config::load() {
    resetDefaults();

    gchar* dir = g_path_get_dirname(path_.c_str());
    g_mkdir_with_parents(dir, 0700);
    g_free(dir);

    JsonParser* parser = json_parser_new();
    GError* error = nullptr;

    if (!json_parser_load_from_file(parser, path_.c_str(), &error)) {
        bool missing = error && g_error_matches(error, G_FILE_ERROR, G_FILE_ERROR_NOENT);
        if (!missing) g_warning("Ignoring unreadable config %s: %s", path_.c_str(), error ? error->message : "?");
        if (error) g_error_free(error);
        g_object_unref(parser);
        if (missing) save();
        return;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
        g_warning("Config %s is not a JSON object, using defaults", path_.c_str());
        g_object_unref(parser);
        return;
    }

    JsonObject* obj = json_node_get_object(root);

    refreshIntervalMinutes_ = static_cast<unsigned>(intMember(obj, "refreshIntervalMinutes", 0, 0));
    if (json_object_has_member(obj, "markReadOnOpen"))
        markReadOnOpen_ = json_object_get_boolean_member(obj, "markReadOnOpen");
    fetchTimeoutSeconds_ = intMember(obj, "fetchTimeoutSeconds", 30, 1);
    extractTimeoutSeconds_ = intMember(obj, "extractTimeoutSeconds", 20, 1);
    statusTimeoutSeconds_ = static_cast<unsigned>(intMember(obj, "statusTimeoutSeconds", 5, 1));
    extractorBaseUrl_ = stringMember(obj, "extractorBaseUrl", extractorBaseUrl_);
    apiKey_ = stringMember(obj, "jinaApiKey", "");
    databasePath_ = stringMember(obj, "databasePath", "");
    browser_ = stringMember(obj, "browser", browser_);
    userAgent_ = stringMember(obj, "userAgent", userAgent_);

    std::string level = stringMember(obj, "logLevel", "info");
    if (level == "debug") logLevel_ = LogLevel::Debug;
    else if (level == "warning") logLevel_ = LogLevel::Warning;
    else logLevel_ = LogLevel::Info;

    g_object_unref(parser);
}

void Config::save() const {
    JsonBuilder* builder = json_builder_new();
    json_builder_begin_object(builder);

    json_builder_set_member_name(builder, "refreshIntervalMinutes");
    json_builder_add_int_value(builder, refreshIntervalMinutes_);
    json_builder_set_member_name(builder, "markReadOnOpen");
    json_builder_add_boolean_value(builder, markReadOnOpen_);
    json_builder_set_member_name(builder, "fetchTimeoutSeconds");
    json_builder_add_int_value(builder, fetchTimeoutSeconds_);
    json_builder_set_member_name(builder, "extractTimeoutSeconds");
    json_builder_add_int_value(builder, extractTimeoutSeconds_);
    json_builder_set_member_name(builder, "statusTimeoutSeconds");
    json_builder_add_int_value(builder, statusTimeoutSeconds_);
    json_builder_set_member_name(builder, "extractorBaseUrl");
    json_builder_add_string_value(builder, extractorBaseUrl_.c_str());
    json_builder_set_member_name(builder, "jinaApiKey");
    json_builder_add_string_value(builder, apiKey_.c_str());
    json_builder_set_member_name(builder, "databasePath");
    json_builder_add_string_value(builder, databasePath_.c_str());
    json_builder_set_member_name(builder, "browser");
    json_builder_add_string_value(builder, browser_.c_str());
    json_builder_set_member_name(builder, "userAgent");
    json_builder_add_string_value(builder, userAgent_.c_str());
    json_builder_set_member_name(builder, "logLevel");
    json_builder_add_string_value(builder, logLevel_ == LogLevel::Debug ? "debug"
                                           : logLevel_ == LogLevel::Warning ? "warning" : "info");

    json_builder_end_object(builder);

    JsonGenerator* gen = json_generator_new();
    json_generator_set_pretty(gen, TRUE);
    JsonNode* rootNode = json_builder_get_root(builder);
    json_generator_set_root(gen, rootNode);

    GError* error = nullptr;
    if (!json_generator_to_file(gen, path_.c_str(), &error)) {
        g_warning("Failed to write config %s: %s", path_.c_str(), error ? error->message : "?");
    }
    if (error) g_error_free(error);

    json_node_unref(rootNode);
    g_object_unref(gen);
    g_object_unref(builder);
}

}
