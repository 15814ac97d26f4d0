#pragma once

#include "GuardrailConfig.hpp"
#include "PatternLibrary.hpp"
#include "SecurityLog.hpp"
#include "Verdict.hpp"

#include <map>
#include <regex>
#include <string>
#include <string_view>

namespace chatguard {

// Who/what a piece of text belongs to. Only used for log entries; it never
// changes a verdict.
struct ClassifyContext {
  std::string user_id;
  std::map<std::string, std::string> attributes;
};

// Turns one text blob into a Verdict. Implementations hold no mutable state
// and may be called from any number of threads at once.
class Classifier {
 public:
  virtual ~Classifier() = default;

  virtual Verdict Classify(std::string_view text, const ClassifyContext& context) const = 0;
};

// Monotonic non-decreasing in `signals`, clamped to [0, 1].
double SignalConfidence(size_t signals, double base, double step);

// Trimmed, lower-cased copy of `text`.
std::string NormalizeText(std::string_view text);

class InputClassifier : public Classifier {
 public:
  static constexpr const char* kLengthGuardId = "guard.input_length";

  InputClassifier(const RuleTable& rules, const GuardrailConfig& config, const SecurityLog& log);

  Verdict Classify(std::string_view text, const ClassifyContext& context) const override;

 private:
  const RuleTable& rules_;
  size_t length_limit_;
  const SecurityLog& log_;
};

class OutputClassifier : public Classifier {
 public:
  static constexpr const char* kCertaintyGuardId = "guard.excessive_certainty";

  OutputClassifier(const RuleTable& rules, const GuardrailConfig& config, const SecurityLog& log);

  Verdict Classify(std::string_view text, const ClassifyContext& context) const override;

  // Occurrences of absolute-claim markers (definitely, guarantee, never, ...).
  size_t CountCertaintyMarkers(const std::string& normalized) const;

 private:
  const RuleTable& rules_;
  int certainty_threshold_;
  std::regex certainty_markers_;
  const SecurityLog& log_;
};

}  // namespace chatguard
