#include "Severity.hpp"

#include <algorithm>
#include <cctype>

namespace chatguard {

int Rank(Severity severity) {
  switch (severity) {
    case Severity::kSafe:
      return 0;
    case Severity::kLow:
      return 10;
    case Severity::kMedium:
      return 20;
    case Severity::kHigh:
      return 30;
    case Severity::kCritical:
      return 40;
  }
  return 0;
}

Severity MaxSeverity(Severity a, Severity b) { return b > a ? b : a; }

std::string ToString(Severity severity) {
  switch (severity) {
    case Severity::kSafe:
      return "safe";
    case Severity::kLow:
      return "low";
    case Severity::kMedium:
      return "medium";
    case Severity::kHigh:
      return "high";
    case Severity::kCritical:
      return "critical";
  }
  return "unknown";
}

std::string ToString(Action action) {
  switch (action) {
    case Action::kAllow:
      return "allow";
    case Action::kWarn:
      return "warn";
    case Action::kBlock:
      return "block";
    case Action::kEscalate:
      return "escalate";
  }
  return "unknown";
}

std::optional<Severity> ParseSeverity(std::string_view text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "safe") return Severity::kSafe;
  if (lower == "low") return Severity::kLow;
  if (lower == "medium") return Severity::kMedium;
  if (lower == "high") return Severity::kHigh;
  if (lower == "critical") return Severity::kCritical;
  return std::nullopt;
}

}  // namespace chatguard
