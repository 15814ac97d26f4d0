#include "Verdict.hpp"

#include <algorithm>

namespace chatguard {

Verdict::Verdict(Severity severity,
                 Action action,
                 std::string reason,
                 double confidence,
                 std::vector<std::string> patterns)
    : severity_(severity),
      action_(action),
      reason_(std::move(reason)),
      confidence_(std::clamp(confidence, 0.0, 1.0)),
      patterns_(std::move(patterns)) {}

nlohmann::json ToJson(const Verdict& verdict) {
  return {{"severity", ToString(verdict.severity())},
          {"action", ToString(verdict.action())},
          {"reason", verdict.reason()},
          {"confidence", verdict.confidence()},
          {"patterns", verdict.patterns()}};
}

}  // namespace chatguard
