#include <rcat/log.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <mutex>

#include <unistd.h>

namespace rcat::log {

static std::atomic<Level> s_level{Info};
static bool s_color_initialized = false;
static bool s_color_enabled = false;
static std::mutex s_emit_mutex;

static void init_color() {
    if (!s_color_initialized) {
        s_color_enabled = isatty(fileno(stderr));
        s_color_initialized = true;
    }
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level.load();
}

bool enabled(Level lvl) {
    return lvl >= s_level;
}

void set_color_enabled(bool on) {
    std::lock_guard<std::mutex> lock(s_emit_mutex);
    s_color_enabled = on;
    s_color_initialized = true;
}

bool is_color_enabled() {
    std::lock_guard<std::mutex> lock(s_emit_mutex);
    init_color();
    return s_color_enabled;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
    }
    return "unknown";
}

Result<Level> parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        if (lower == level_name(lvl)) return Result<Level>::ok(lvl);
    }
    return RcatError{RcatError::Config,
        "unknown log level '" + name + "'",
        "expected one of: trace, debug, info, warn, error"};
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
    }
    return "";
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (!enabled(lvl)) return;

    // Format outside the lock; one fprintf per line keeps lines whole.
    char stack_buf[512];
    va_list copy;
    va_copy(copy, args);
    int n = std::vsnprintf(stack_buf, sizeof(stack_buf), fmt, copy);
    va_end(copy);
    if (n < 0) return;

    std::string body;
    if (static_cast<size_t>(n) < sizeof(stack_buf)) {
        body.assign(stack_buf, static_cast<size_t>(n));
    } else {
        body.resize(static_cast<size_t>(n) + 1);
        std::vsnprintf(&body[0], body.size(), fmt, args);
        body.resize(static_cast<size_t>(n));
    }

    std::lock_guard<std::mutex> lock(s_emit_mutex);
    init_color();
    if (s_color_enabled) {
        std::fprintf(stderr, "%s%s\033[0m: %s\n", level_color(lvl), level_name(lvl), body.c_str());
    } else {
        std::fprintf(stderr, "%s: %s\n", level_name(lvl), body.c_str());
    }
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Error, fmt, args);
    va_end(args);
}

} // namespace rcat::log
