#include "tdkg/common/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace tdkg {
namespace {

std::string Timestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

  std::tm tm_utc{};
  gmtime_r(&seconds, &tm_utc);

  std::ostringstream out;
  out << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
      << std::setw(3) << millis.count() << 'Z';
  return out.str();
}

}  // namespace

const char* ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
    case LogLevel::kNone:
      return "NONE";
  }
  return "UNKNOWN";
}

LogLevel ParseLogLevel(std::string_view text) {
  if (text == "DEBUG" || text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "INFO" || text == "info") {
    return LogLevel::kInfo;
  }
  if (text == "WARN" || text == "warn") {
    return LogLevel::kWarn;
  }
  if (text == "ERROR" || text == "error") {
    return LogLevel::kError;
  }
  if (text == "NONE" || text == "none") {
    return LogLevel::kNone;
  }
  throw std::invalid_argument("unknown log level: " + std::string(text));
}

Logger& Logger::Instance() {
  static Logger instance;
  return instance;
}

Logger::Logger() : sink_(&std::clog) {}

void Logger::SetLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mu_);
  level_ = level;
}

LogLevel Logger::level() const {
  std::lock_guard<std::mutex> lock(mu_);
  return level_;
}

void Logger::SetSink(std::ostream* sink) {
  std::lock_guard<std::mutex> lock(mu_);
  sink_ = sink != nullptr ? sink : &std::clog;
}

bool Logger::Enabled(LogLevel level) const {
  std::lock_guard<std::mutex> lock(mu_);
  return level != LogLevel::kNone && level >= level_;
}

void Logger::Log(LogLevel level, std::string_view component, std::string_view message) {
  if (!Enabled(level)) {
    return;
  }

  std::ostringstream line;
  line << Timestamp() << " [" << ToString(level) << "] " << component << ": " << message
       << '\n';

  std::lock_guard<std::mutex> lock(mu_);
  *sink_ << line.str();
  sink_->flush();
}

}  // namespace tdkg
