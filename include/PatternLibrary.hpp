#pragma once

#include "Severity.hpp"

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace chatguard {

// Uncompiled rule as written in the default tables or a rules file.
struct RuleSpec {
  std::string id;
  std::string group;
  Severity severity = Severity::kSafe;
  std::string pattern;
  std::string explanation;
};

struct Rule {
  std::string id;
  std::string group;
  Severity severity = Severity::kSafe;
  std::string explanation;
  std::regex regex;

  bool Matches(const std::string& text) const;
};

// Ordered, immutable set of compiled rules. Construction compiles every
// pattern case-insensitively and throws std::invalid_argument on the first
// bad spec; after that the table is only read, so it can be shared between
// threads without locking.
class RuleTable {
 public:
  RuleTable() = default;
  explicit RuleTable(const std::vector<RuleSpec>& specs);

  const std::vector<Rule>& rules() const { return rules_; }
  size_t size() const { return rules_.size(); }

  // Rules matching `text`, in table order.
  std::vector<const Rule*> Match(const std::string& text) const;

 private:
  std::vector<Rule> rules_;
};

enum class Direction { kInput, kOutput };

std::string ToString(Direction direction);

class PatternLibrary {
 public:
  PatternLibrary(const std::vector<RuleSpec>& input_specs,
                 const std::vector<RuleSpec>& output_specs);

  // Library built from DefaultInputRules() and DefaultOutputRules().
  static PatternLibrary Default();

  const RuleTable& input() const { return input_; }
  const RuleTable& output() const { return output_; }
  const RuleTable& For(Direction direction) const;

 private:
  RuleTable input_;
  RuleTable output_;
};

// Request-side groups: harmful (all tiers), inappropriate, spam.
std::vector<RuleSpec> DefaultInputRules();

// Response-side groups: unsafe (all tiers), compliance, misinformation.
std::vector<RuleSpec> DefaultOutputRules();

// Reads a JSON array of {id, group, severity, pattern, explanation}.
// Patterns are not compiled here; that happens when a RuleTable is built.
std::optional<std::vector<RuleSpec>> LoadRuleSpecs(std::string_view path,
                                                   std::string* error_out = nullptr);

}  // namespace chatguard
