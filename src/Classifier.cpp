#include "Classifier.hpp"

#include "ActionPolicy.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace chatguard {
namespace {

constexpr double kInputConfidenceBase = 0.7;
constexpr double kInputConfidenceStep = 0.3;
constexpr double kOutputConfidenceBase = 0.8;
constexpr double kOutputConfidenceStep = 0.2;

bool IsBlank(std::string_view text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

// UTF-8 code points; continuation bytes are not counted.
size_t CountCharacters(std::string_view text) {
  return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](unsigned char c) {
    return (c & 0xC0) != 0x80;
  }));
}

// Everything that fired while scanning one text.
struct Findings {
  Severity severity = Severity::kSafe;
  std::vector<std::string> patterns;
  std::vector<std::string> reasons;

  void Add(const std::string& id, Severity tier, const std::string& reason) {
    severity = MaxSeverity(severity, tier);
    patterns.push_back(id);
    reasons.push_back(reason);
  }

  Verdict ToVerdict(const std::string& safe_reason, double base, double step) const {
    std::string reason;
    for (const auto& r : reasons) {
      if (!reason.empty()) {
        reason.append("; ");
      }
      reason.append(r);
    }
    if (reason.empty()) {
      reason = safe_reason;
    }
    return Verdict(severity, ActionFor(severity), std::move(reason),
                   SignalConfidence(patterns.size(), base, step), patterns);
  }
};

Findings Scan(const RuleTable& rules, const std::string& normalized) {
  Findings findings;
  for (const Rule* rule : rules.Match(normalized)) {
    findings.Add(rule->id, rule->severity,
                 rule->group + " (" + ToString(rule->severity) + "): " + rule->explanation);
  }
  return findings;
}

Verdict EmptyVerdict(const std::string& reason) {
  return Verdict(Severity::kLow, ActionFor(Severity::kLow), reason, 1.0, {});
}

void Report(const SecurityLog& log,
            const char* event_type,
            const Verdict& verdict,
            const ClassifyContext& context) {
  if (verdict.severity() == Severity::kSafe) {
    return;
  }
  nlohmann::json details = {{"severity", ToString(verdict.severity())},
                            {"action", ToString(verdict.action())},
                            {"patterns", verdict.patterns().size()},
                            {"reason", verdict.reason()}};
  if (!context.attributes.empty()) {
    details["context"] = context.attributes;
  }
  log.Write(LogLevel::kWarning, event_type, context.user_id, std::move(details));
}

}  // namespace

double SignalConfidence(size_t signals, double base, double step) {
  const double value = base + step * static_cast<double>(signals);
  return std::clamp(value, 0.0, 1.0);
}

std::string NormalizeText(std::string_view text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  std::string out(text.substr(begin, end - begin));
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

InputClassifier::InputClassifier(const RuleTable& rules,
                                 const GuardrailConfig& config,
                                 const SecurityLog& log)
    : rules_(rules), length_limit_(config.input_length_limit), log_(log) {}

Verdict InputClassifier::Classify(std::string_view text, const ClassifyContext& context) const {
  if (IsBlank(text)) {
    Verdict verdict = EmptyVerdict("empty input");
    Report(log_, "input_check", verdict, context);
    return verdict;
  }

  Findings findings = Scan(rules_, NormalizeText(text));
  if (CountCharacters(text) > length_limit_) {
    findings.Add(kLengthGuardId, Severity::kMedium, "input length exceeds safe limits");
  }

  Verdict verdict =
      findings.ToVerdict("input appears safe", kInputConfidenceBase, kInputConfidenceStep);
  Report(log_, "input_check", verdict, context);
  return verdict;
}

OutputClassifier::OutputClassifier(const RuleTable& rules,
                                   const GuardrailConfig& config,
                                   const SecurityLog& log)
    : rules_(rules),
      certainty_threshold_(config.certainty_word_threshold),
      certainty_markers_("(definitely|certainly|guarantee|promise|sure|always|never)",
                         std::regex::ECMAScript | std::regex::icase | std::regex::optimize),
      log_(log) {}

size_t OutputClassifier::CountCertaintyMarkers(const std::string& normalized) const {
  return static_cast<size_t>(std::distance(
      std::sregex_iterator(normalized.begin(), normalized.end(), certainty_markers_),
      std::sregex_iterator()));
}

Verdict OutputClassifier::Classify(std::string_view text, const ClassifyContext& context) const {
  if (IsBlank(text)) {
    Verdict verdict = EmptyVerdict("empty output");
    Report(log_, "output_check", verdict, context);
    return verdict;
  }

  const std::string normalized = NormalizeText(text);
  Findings findings = Scan(rules_, normalized);
  const size_t markers = CountCertaintyMarkers(normalized);
  if (markers > static_cast<size_t>(certainty_threshold_)) {
    findings.Add(kCertaintyGuardId, Severity::kMedium,
                 "excessive confidence in uncertain predictions (" + std::to_string(markers) +
                     " certainty markers)");
  }

  Verdict verdict =
      findings.ToVerdict("output appears safe", kOutputConfidenceBase, kOutputConfidenceStep);
  Report(log_, "output_check", verdict, context);
  return verdict;
}

}  // namespace chatguard
