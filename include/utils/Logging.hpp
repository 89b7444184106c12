#pragma once
#include "utils/Config.hpp"
#include <string>

namespace NewsDeck {

// Routes GLib structured logging into an append-only file so log output never
// lands on the curses screen. Falls back to GLib's default writer if the file
// cannot be opened.
void initLogging(const std::string& path, LogLevel level);
void shutdownLogging();

}
