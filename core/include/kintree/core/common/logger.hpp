#pragma once
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>

namespace kintree::core {

enum class LogLevel : std::uint8_t {
  Error = 0,
  Warn = 1,
  Info = 2,
  Debug = 3
};

using LogSink = void(*)(LogLevel, const std::string&);

// The initial level is Warn, or the value of KINTREE_LOG_LEVEL (error|warn|info|debug)
// read on first use.
void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// nullptr restores the default stderr sink.
void setLogSink(LogSink sink);
LogSink getLogSink();

bool shouldLog(LogLevel level);
void log(LogLevel level, const std::string& msg);
void log(LogLevel level, const char* msg);

const char* logLevelToString(LogLevel level);

// Case-insensitive; accepts the names printed by logLevelToString.
bool parseLogLevel(std::string_view text, LogLevel* out);

// Collects a message with operator<< and emits it on destruction.
// Formatting is skipped entirely when the level is filtered out.
class LogLine {
public:
  explicit LogLine(LogLevel level) : level_(level), enabled_(shouldLog(level)) {}
  ~LogLine() {
    if (enabled_) log(level_, oss_.str());
  }

  LogLine(const LogLine&) = delete;
  LogLine& operator=(const LogLine&) = delete;

  template <typename T>
  LogLine& operator<<(const T& v) {
    if (enabled_) oss_ << v;
    return *this;
  }

private:
  LogLevel level_;
  bool enabled_;
  std::ostringstream oss_;
};

}  // namespace kintree::core
