#include <weft/log.hpp>
#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace weft::log {

static Level s_level = Warn;
static std::FILE* s_sink = nullptr;
static bool s_color_initialized = false;
static bool s_color_enabled = false;

static std::FILE* sink() {
    return s_sink ? s_sink : stderr;
}

static void init_color() {
    if (!s_color_initialized) {
        s_color_enabled = isatty(fileno(sink()));
        s_color_initialized = true;
    }
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

bool enabled(Level lvl) {
    return lvl != Off && lvl >= s_level;
}

void set_color_enabled(bool enabled) {
    s_color_enabled = enabled;
    s_color_initialized = true;
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

void set_sink(std::FILE* f) {
    s_sink = f;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
        case Off:   return "off";
    }
    return "unknown";
}

Result<Level> parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](char c) {
                       return static_cast<char>(
                           std::tolower(static_cast<unsigned char>(c)));
                   });
    for (Level lvl : {Trace, Debug, Info, Warn, Error, Off}) {
        if (lower == level_name(lvl)) return Result<Level>::ok(lvl);
    }
    return WeftError{WeftError::InvalidArg,
        "unknown log level '" + name + "'",
        "expected one of: trace, debug, info, warn, error, off"};
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";
        case Debug: return "\033[36m";
        case Info:  return "\033[32m";
        case Warn:  return "\033[33m";
        case Error: return "\033[31m";
        case Off:   return "";
    }
    return "";
}

static void write(Level lvl, const char* fmt, va_list args) {
    if (!enabled(lvl)) return;
    init_color();

    std::FILE* out = sink();
    if (s_color_enabled) {
        std::fprintf(out, "%sweft %s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(out, "weft %s: ", level_name(lvl));
    }

    std::vfprintf(out, fmt, args);
    std::fputc('\n', out);
}

#define WEFT_LOG_FORWARD(lvl) \
    va_list args; \
    va_start(args, fmt); \
    write(lvl, fmt, args); \
    va_end(args)

void trace(const char* fmt, ...) { WEFT_LOG_FORWARD(Trace); }
void debug(const char* fmt, ...) { WEFT_LOG_FORWARD(Debug); }
void info(const char* fmt, ...)  { WEFT_LOG_FORWARD(Info); }
void warn(const char* fmt, ...)  { WEFT_LOG_FORWARD(Warn); }
void error(const char* fmt, ...) { WEFT_LOG_FORWARD(Error); }

#undef WEFT_LOG_FORWARD

} // namespace weft::log
