#include "kintree/core/common/logger.hpp"

#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>

#ifndef _WIN32
#include <unistd.h>
#include <cstdio>
#endif

namespace kintree::core {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Warn};
std::atomic<LogSink> g_sink{nullptr};
std::once_flag g_env_once;

void initLevelFromEnv() {
  std::call_once(g_env_once, [] {
    const char* env = std::getenv("KINTREE_LOG_LEVEL");
    LogLevel level = LogLevel::Warn;
    if (env != nullptr && parseLogLevel(env, &level)) {
      g_level.store(level);
    }
  });
}

bool stderrIsColorTerminal() {
#ifdef _WIN32
  return false;
#else
  static const bool color =
      std::getenv("NO_COLOR") == nullptr && isatty(fileno(stderr)) != 0;
  return color;
#endif
}

const char* colorFor(LogLevel level) {
  switch (level) {
    case LogLevel::Error: return "\x1b[31m";
    case LogLevel::Warn: return "\x1b[33m";
    case LogLevel::Info: return "\x1b[36m";
    case LogLevel::Debug: return "\x1b[90m";
  }
  return "\x1b[0m";
}

void stderrSink(LogLevel level, const std::string& msg) {
  const bool color = stderrIsColorTerminal();
  if (color) std::cerr << colorFor(level);
  std::cerr << "[kintree][" << logLevelToString(level) << "] " << msg;
  if (color) std::cerr << "\x1b[0m";
  std::cerr << '\n';
}

}  // namespace

const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Error: return "ERROR";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Info: return "INFO";
    case LogLevel::Debug: return "DEBUG";
  }
  return "UNKNOWN";
}

bool parseLogLevel(std::string_view text, LogLevel* out) {
  if (!out) return false;
  std::string lower;
  lower.reserve(text.size());
  for (char c : text) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower == "error") { *out = LogLevel::Error; return true; }
  if (lower == "warn" || lower == "warning") { *out = LogLevel::Warn; return true; }
  if (lower == "info") { *out = LogLevel::Info; return true; }
  if (lower == "debug") { *out = LogLevel::Debug; return true; }
  return false;
}

void setLogLevel(LogLevel level) {
  initLevelFromEnv();
  g_level.store(level);
}

LogLevel getLogLevel() {
  initLevelFromEnv();
  return g_level.load();
}

void setLogSink(LogSink sink) {
  g_sink.store(sink);
}

LogSink getLogSink() {
  return g_sink.load();
}

bool shouldLog(LogLevel level) {
  return static_cast<int>(level) <= static_cast<int>(getLogLevel());
}

void log(LogLevel level, const std::string& msg) {
  if (!shouldLog(level)) return;
  const LogSink sink = g_sink.load();
  (sink ? sink : &stderrSink)(level, msg);
}

void log(LogLevel level, const char* msg) {
  log(level, msg ? std::string(msg) : std::string());
}

}  // namespace kintree::core
