#pragma once

#include <string>
#include <cstdio>

namespace depot::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Parse "trace", "debug", "info", "warn" or "error". Returns false if unknown.
bool parse_level(const std::string& name, Level& out);

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Destination for diagnostics that belong to the caller of an operation
// (conflict warnings, requester chains) rather than to the process log.
class Sink {
public:
    virtual ~Sink() = default;
    virtual void write(Level lvl, const std::string& message) = 0;
};

// Sink that forwards every message to the process logger above.
Sink& default_sink();

} // namespace depot::log
