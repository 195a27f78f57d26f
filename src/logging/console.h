#pragma once
#include <string>

namespace logging {

// Console progress and warning lines. Each call writes one whole line under
// a lock so output from worker threads never interleaves mid-line.
// debug and info go to stdout, warn and error to stderr.

enum class Level {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

/// Set the minimum level that is printed (default Info).
void set_level(Level level);
Level level();

/**
 * @brief Parse "debug", "info", "warn", "error" or "off"
 * @param name Level name
 * @param out Parsed level
 * @return false if the name is not recognized
 */
bool parse_level(const std::string& name, Level& out);

void debug(const std::string& message);
void info(const std::string& message);
void warn(const std::string& message);
void error(const std::string& message);

} // namespace logging
