#pragma once

#include <rcat/result.hpp>
#include <string>

namespace rcat::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// True when a message at `lvl` would be emitted.
bool enabled(Level lvl);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// All output goes to stderr; stdout carries the aggregated stream.
// Safe to call from worker threads.
void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

// Map "trace" / "debug" / "info" / "warn" / "error" (case-insensitive) to a level.
Result<Level> parse_level(const std::string& name);

} // namespace rcat::log
