#pragma once

#include <mutex>
#include <ostream>
#include <string_view>

namespace tdkg {

enum class LogLevel : int {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kNone = 4,
};

const char* ToString(LogLevel level);
LogLevel ParseLogLevel(std::string_view text);

// Process-wide line logger. Lines below the configured level are discarded
// before formatting.
class Logger {
 public:
  static Logger& Instance();

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void SetLevel(LogLevel level);
  LogLevel level() const;

  // The stream must outlive every subsequent Log call. nullptr restores
  // std::clog.
  void SetSink(std::ostream* sink);

  bool Enabled(LogLevel level) const;
  void Log(LogLevel level, std::string_view component, std::string_view message);

 private:
  Logger();

  mutable std::mutex mu_;
  LogLevel level_ = LogLevel::kInfo;
  std::ostream* sink_;
};

}  // namespace tdkg
