#include "SecurityLog.hpp"

#include <rang.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace chatguard {

std::string ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarning:
      return "WARNING";
    case LogLevel::kError:
      return "ERROR";
    case LogLevel::kCritical:
      return "CRITICAL";
  }
  return "INFO";
}

std::string UtcTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm utc{};
#if defined(_WIN32)
  gmtime_s(&utc, &t);
#else
  gmtime_r(&t, &utc);
#endif
  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << 'Z';
  return out.str();
}

SecurityLog::SecurityLog() : sink_(ConsoleSink()) {}

SecurityLog::SecurityLog(Sink sink) : sink_(std::move(sink)) {}

void SecurityLog::Write(LogLevel level,
                        std::string_view event_type,
                        std::string_view user_id,
                        nlohmann::json details) const noexcept {
  if (!sink_) {
    return;
  }
  try {
    LogRecord record;
    record.level = level;
    record.event_type = std::string(event_type);
    record.entry = {{"event_type", record.event_type},
                    {"timestamp", UtcTimestamp()},
                    {"user_id", nullptr},
                    {"details", std::move(details)}};
    if (!user_id.empty()) {
      record.entry["user_id"] = std::string(user_id);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    sink_(record);
  } catch (const std::exception& ex) {
    std::cerr << "[ChatGuard] Failed to write security log entry: " << ex.what() << "\n";
  } catch (...) {
    std::cerr << "[ChatGuard] Failed to write security log entry: non-standard exception\n";
  }
}

SecurityLog::Sink SecurityLog::ConsoleSink() {
  return [](const LogRecord& record) {
    switch (record.level) {
      case LogLevel::kInfo:
        std::cerr << rang::fg::gray;
        break;
      case LogLevel::kWarning:
        std::cerr << rang::fg::yellow;
        break;
      case LogLevel::kError:
        std::cerr << rang::fg::red;
        break;
      case LogLevel::kCritical:
        std::cerr << rang::style::bold << rang::fg::red;
        break;
    }
    std::cerr << "[ChatGuard][" << ToString(record.level) << "] " << rang::style::reset
              << rang::fg::reset
              << record.entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
              << "\n";
  };
}

}  // namespace chatguard
