#pragma once

#include <weft/result.hpp>
#include <string>
#include <cstdio>

namespace weft::log {

enum Level { Trace, Debug, Info, Warn, Error, Off };

void set_level(Level lvl);
Level get_level();
bool enabled(Level lvl);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Messages go to stderr unless redirected; nullptr restores stderr.
void set_sink(std::FILE* sink);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

// Accepts the names returned by level_name(), case-insensitive.
Result<Level> parse_level(const std::string& name);

} // namespace weft::log
