#include "ActionPolicy.hpp"

namespace chatguard {

Action ActionFor(Severity severity) {
  switch (severity) {
    case Severity::kSafe:
    case Severity::kLow:
      return Action::kAllow;
    case Severity::kMedium:
      return Action::kWarn;
    case Severity::kHigh:
      return Action::kBlock;
    case Severity::kCritical:
      return Action::kEscalate;
  }
  return Action::kBlock;
}

}  // namespace chatguard
