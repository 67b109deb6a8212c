#pragma once
/**
 * @file log.hpp
 * @brief Level-gated key=value diagnostics for rfidlink.
 *
 * Every line is shell-friendly: "level=warn op=set_count reason=timeout".
 * Output goes to std::cerr unless a sink is installed (tests capture it).
 * The threshold is process-wide; the engine is single-threaded by contract.
 */

#include <functional>
#include <string>

namespace rfidlink {

enum class LogLevel : int { Error = 0, Warn = 1, Info = 2, Debug = 3, Trace = 4 };

using LogSink = std::function<void(LogLevel, const std::string&)>;

void     set_log_level(LogLevel lvl);
LogLevel log_level();

/// Replace the output sink. Pass an empty function to restore std::cerr.
void set_log_sink(LogSink sink);

/// "error", "warn", "info", "debug", "trace".
const char* log_level_name(LogLevel lvl);

/// Parse a level name; false on unknown names.
bool parse_log_level(const std::string& name, LogLevel& out);

inline bool log_enabled(LogLevel lvl) {
  return static_cast<int>(lvl) <= static_cast<int>(log_level());
}

/// Emit "level=<name> <text>" if @p lvl passes the threshold.
void log_line(LogLevel lvl, const std::string& text);

} // namespace rfidlink
