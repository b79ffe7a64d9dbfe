#pragma once

#include <ftl/result.hpp>
#include <functional>
#include <string>
#include <cstdio>

namespace ftl::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Receives every message at or above the current level instead of stderr.
// Pass an empty function to restore stderr output.
using Sink = std::function<void(Level, const std::string&)>;
void set_sink(Sink sink);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Inverse of level_name ("warning" is accepted for Warn)
Result<Level> parse_level(const std::string& name);

} // namespace ftl::log
