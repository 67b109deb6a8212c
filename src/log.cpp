// ============================================================================
// log.cpp — implementation for rfidlink/log.hpp
// ============================================================================

#include "rfidlink/log.hpp"

#include <iostream>
#include <utility>

namespace rfidlink {

static LogLevel g_level = LogLevel::Info;
static LogSink  g_sink;

void set_log_level(LogLevel lvl) { g_level = lvl; }

LogLevel log_level() { return g_level; }

void set_log_sink(LogSink sink) { g_sink = std::move(sink); }

const char* log_level_name(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::Error: return "error";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Info:  return "info";
    case LogLevel::Debug: return "debug";
    case LogLevel::Trace: return "trace";
  }
  return "info";
}

bool parse_log_level(const std::string& name, LogLevel& out) {
  if (name == "error") { out = LogLevel::Error; return true; }
  if (name == "warn")  { out = LogLevel::Warn;  return true; }
  if (name == "info")  { out = LogLevel::Info;  return true; }
  if (name == "debug") { out = LogLevel::Debug; return true; }
  if (name == "trace") { out = LogLevel::Trace; return true; }
  return false;
}

void log_line(LogLevel lvl, const std::string& text) {
  if (!log_enabled(lvl)) return;
  const std::string line = std::string("level=") + log_level_name(lvl) + " " + text;
  if (g_sink) { g_sink(lvl, line); return; }
  std::cerr << line << "\n";
}

} // namespace rfidlink
