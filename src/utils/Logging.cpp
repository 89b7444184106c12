#include "utils/Logging.hpp"
#include <glib.h>
#include <cstdio>
#include <mutex>

namespace NewsDeck {

namespace {

std::mutex logMutex;
FILE* logFile = nullptr;
LogLevel threshold = LogLevel::Info;

bool enabled(GLogLevelFlags level) {
    if (level & (G_LOG_LEVEL_ERROR | G_LOG_LEVEL_CRITICAL | G_LOG_LEVEL_WARNING)) return true;
    if (level & (G_LOG_LEVEL_MESSAGE | G_LOG_LEVEL_INFO)) return threshold != LogLevel::Warning;
    return threshold == LogLevel::Debug;
}

GLogWriterOutput fileWriter(GLogLevelFlags level, const GLogField* fields, gsize nFields, gpointer) {
    if (!enabled(level)) return G_LOG_WRITER_HANDLED;

    std::lock_guard<std::mutex> lock(logMutex);
    if (!logFile) return g_log_writer_default(level, fields, nFields, nullptr);

    gchar* line = g_log_writer_format_fields(level, fields, nFields, FALSE);
    GDateTime* now = g_date_time_new_now_local();
    gchar* stamp = g_date_time_format(now, "%Y-%m-%d %H:%M:%S");
    fprintf(logFile, "%s %s\n", stamp, line);
    fflush(logFile);
    g_free(stamp);
    g_date_time_unref(now);
    g_free(line);
    return G_LOG_WRITER_HANDLED;
}

}

void initLogging(const std::string& path, LogLevel level) {
    {
        std::lock_guard<std::mutex> lock(logMutex);
        threshold = level;
        gchar* dir = g_path_get_dirname(path.c_str());
        g_mkdir_with_parents(dir, 0700);
        g_free(dir);
        logFile = fopen(path.c_str(), "a");
    }
    g_log_set_writer_func(fileWriter, nullptr, nullptr);
    if (!logFile) g_warning("Cannot open log file %s, logging to stderr", path.c_str());
}

void shutdownLogging() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile) {
        fclose(logFile);
        logFile = nullptr;
    }
}

}
