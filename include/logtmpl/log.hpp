#pragma once

#include <functional>
#include <optional>
#include <string>

namespace logtmpl::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Color is on by default when stderr is a terminal
void set_color_enabled(bool enabled);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Receives every message at or above the threshold instead of stderr.
// An empty sink restores the default stderr output.
using Sink = std::function<void(Level, const std::string&)>;
void set_sink(Sink sink);

// Returns the name string for a level
const char* level_name(Level lvl);

// Inverse of level_name(); nullopt for unknown names
std::optional<Level> parse_level(const std::string& name);

} // namespace logtmpl::log
