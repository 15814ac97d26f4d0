#pragma once

#include "Severity.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace chatguard {

// Result of classifying one text blob. Built once, read-only afterwards.
class Verdict {
 public:
  Verdict(Severity severity,
          Action action,
          std::string reason,
          double confidence,
          std::vector<std::string> patterns);

  Severity severity() const { return severity_; }
  Action action() const { return action_; }
  const std::string& reason() const { return reason_; }
  double confidence() const { return confidence_; }
  const std::vector<std::string>& patterns() const { return patterns_; }

 private:
  Severity severity_;
  Action action_;
  std::string reason_;
  double confidence_;
  std::vector<std::string> patterns_;
};

nlohmann::json ToJson(const Verdict& verdict);

}  // namespace chatguard
