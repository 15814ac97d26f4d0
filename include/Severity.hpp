#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace chatguard {

// Risk assigned to one piece of text. Ordering goes through Rank(), never
// through the enumerator values.
enum class Severity { kSafe, kLow, kMedium, kHigh, kCritical };

// Operational consequence of a Severity. See ActionFor() in ActionPolicy.hpp.
enum class Action { kAllow, kWarn, kBlock, kEscalate };

int Rank(Severity severity);

inline bool operator<(Severity a, Severity b) { return Rank(a) < Rank(b); }
inline bool operator>(Severity a, Severity b) { return Rank(a) > Rank(b); }
inline bool operator<=(Severity a, Severity b) { return Rank(a) <= Rank(b); }
inline bool operator>=(Severity a, Severity b) { return Rank(a) >= Rank(b); }

Severity MaxSeverity(Severity a, Severity b);

std::string ToString(Severity severity);
std::string ToString(Action action);

std::optional<Severity> ParseSeverity(std::string_view text);

}  // namespace chatguard
