/**
 * @file console.cpp
 * @brief Line-oriented console logging shared by all scanner components
 */

#include "console.h"
#include <atomic>
#include <iostream>
#include <mutex>

namespace logging {

namespace {

std::atomic<int> g_level{static_cast<int>(Level::Info)};
std::mutex g_write_mutex;

void write_line(Level lvl, const char* tag, const std::string& message) {
    if (static_cast<int>(lvl) < g_level.load()) return;
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::ostream& out = (lvl >= Level::Warn) ? std::cerr : std::cout;
    out << "[" << tag << "] " << message << "\n";
}

} // namespace

void set_level(Level lvl) {
    g_level.store(static_cast<int>(lvl));
}

Level level() {
    return static_cast<Level>(g_level.load());
}

bool parse_level(const std::string& name, Level& out) {
    if (name == "debug") out = Level::Debug;
    else if (name == "info") out = Level::Info;
    else if (name == "warn" || name == "warning") out = Level::Warn;
    else if (name == "error") out = Level::Error;
    else if (name == "off") out = Level::Off;
    else return false;
    return true;
}

void debug(const std::string& message) { write_line(Level::Debug, "debug", message); }
void info(const std::string& message)  { write_line(Level::Info, "info", message); }
void warn(const std::string& message)  { write_line(Level::Warn, "warn", message); }
void error(const std::string& message) { write_line(Level::Error, "error", message); }

} // namespace logging
