#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace chatguard {

enum class LogLevel { kInfo, kWarning, kError, kCritical };

std::string ToString(LogLevel level);

struct LogRecord {
  LogLevel level = LogLevel::kInfo;
  std::string event_type;
  // {event_type, timestamp, user_id, details}
  nlohmann::json entry;
};

// Structured security log. Records are handed to a sink one at a time; the
// default sink prints colored one-line JSON to stderr.
class SecurityLog {
 public:
  using Sink = std::function<void(const LogRecord&)>;

  SecurityLog();
  explicit SecurityLog(Sink sink);

  SecurityLog(const SecurityLog&) = delete;
  SecurityLog& operator=(const SecurityLog&) = delete;

  // Empty `user_id` is logged as null. Never throws.
  void Write(LogLevel level,
             std::string_view event_type,
             std::string_view user_id,
             nlohmann::json details) const noexcept;

  static Sink ConsoleSink();

 private:
  Sink sink_;
  mutable std::mutex mutex_;
};

std::string UtcTimestamp();

}  // namespace chatguard
