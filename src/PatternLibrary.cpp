#include "PatternLibrary.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>
#include <unordered_set>

namespace chatguard {
namespace {

RuleSpec Spec(std::string group,
              std::string name,
              Severity severity,
              std::string pattern,
              std::string explanation) {
  RuleSpec spec;
  spec.id = group + "." + name;
  spec.group = std::move(group);
  spec.severity = severity;
  spec.pattern = std::move(pattern);
  spec.explanation = std::move(explanation);
  return spec;
}

Rule Compile(const RuleSpec& spec) {
  if (spec.id.empty()) {
    throw std::invalid_argument("Rule has no id (pattern: " + spec.pattern + ")");
  }
  if (spec.pattern.empty()) {
    throw std::invalid_argument("Rule " + spec.id + " has an empty pattern");
  }
  Rule rule;
  rule.id = spec.id;
  rule.group = spec.group;
  rule.severity = spec.severity;
  rule.explanation = spec.explanation.empty() ? spec.id : spec.explanation;
  try {
    rule.regex = std::regex(spec.pattern, std::regex::ECMAScript | std::regex::icase |
                                              std::regex::optimize);
  } catch (const std::regex_error& ex) {
    throw std::invalid_argument("Rule " + spec.id + " has an invalid pattern '" + spec.pattern +
                                "': " + ex.what());
  }
  return rule;
}

}  // namespace

bool Rule::Matches(const std::string& text) const { return std::regex_search(text, regex); }

RuleTable::RuleTable(const std::vector<RuleSpec>& specs) {
  std::unordered_set<std::string> seen;
  rules_.reserve(specs.size());
  for (const auto& spec : specs) {
    if (!seen.insert(spec.id).second) {
      throw std::invalid_argument("Duplicate rule id: " + spec.id);
    }
    rules_.push_back(Compile(spec));
  }
}

std::vector<const Rule*> RuleTable::Match(const std::string& text) const {
  std::vector<const Rule*> matched;
  for (const auto& rule : rules_) {
    if (rule.Matches(text)) {
      matched.push_back(&rule);
    }
  }
  return matched;
}

std::string ToString(Direction direction) {
  return direction == Direction::kInput ? "input" : "output";
}

PatternLibrary::PatternLibrary(const std::vector<RuleSpec>& input_specs,
                               const std::vector<RuleSpec>& output_specs)
    : input_(input_specs), output_(output_specs) {}

PatternLibrary PatternLibrary::Default() {
  return PatternLibrary(DefaultInputRules(), DefaultOutputRules());
}

const RuleTable& PatternLibrary::For(Direction direction) const {
  return direction == Direction::kInput ? input_ : output_;
}

std::vector<RuleSpec> DefaultInputRules() {
  const std::string harmful = "harmful";
  const std::string inappropriate = "inappropriate";
  const std::string spam = "spam";
  return {
      Spec(harmful, "attack_terms", Severity::kCritical,
           R"re((hack|exploit|bypass|inject|sql|script|xss))re",
           "request to attack or break into systems"),
      Spec(harmful, "credentials", Severity::kCritical,
           R"re((password|token|api[_\s]?key|secret))re",
           "request involving credentials or secrets"),
      Spec(harmful, "destructive_sql", Severity::kCritical,
           R"re((delete|drop|truncate|alter)\s+(table|database))re",
           "destructive database command"),
      Spec(harmful, "code_execution", Severity::kCritical,
           R"re((exec|execute|eval|system|shell|cmd))re",
           "command execution request"),

      Spec(harmful, "fraud", Severity::kHigh,
           R"re((fraud|scam|money\s+laundering|illegal))re",
           "fraud or illegal activity"),
      Spec(harmful, "discrimination", Severity::kHigh,
           R"re((discriminat\w+|racist|sexist|harassment))re",
           "discrimination or harassment"),
      Spec(harmful, "sensitive_data", Severity::kHigh,
           R"re((personal\s+information|social\s+security|credit\s+card))re",
           "request for sensitive personal data"),
      Spec(harmful, "forged_documents", Severity::kHigh,
           R"re((fake|forged|counterfeit)\s+(document|license|permit))re",
           "forged documents"),

      Spec(harmful, "unreported_cash", Severity::kMedium,
           R"re((off\s*the\s*books|under\s*the\s*table|cash\s*only))re",
           "unreported cash dealings"),
      Spec(harmful, "evasion", Severity::kMedium,
           R"re((avoid|evade)\s+(tax|regulation|law))re",
           "evading tax or regulation"),
      Spec(harmful, "market_abuse", Severity::kMedium,
           R"re((insider\s+information|market\s+manipulation))re",
           "insider information or market manipulation"),
      Spec(harmful, "bribery", Severity::kMedium,
           R"re((brib\w+|kickback|payoff))re",
           "bribery or kickbacks"),

      Spec(harmful, "pressure", Severity::kLow,
           R"re((urgent|emergency|immediate|asap)\s*.{0,20}(respond|reply|answer))re",
           "pressure for an immediate answer"),
      Spec(harmful, "repetition", Severity::kLow,
           R"re(repeatedly\s+.{0,10}(ask|request|demand))re",
           "repeated demands"),

      Spec(inappropriate, "illegal_activity", Severity::kHigh,
           R"re((illegal|unlawful|criminal)\s+(activity|practice|scheme))re",
           "illegal activity"),
      Spec(inappropriate, "housing_discrimination", Severity::kHigh,
           R"re((housing|rental)\s+(discrimination|bias))re",
           "housing discrimination"),
      Spec(inappropriate, "private_details", Severity::kHigh,
           R"re((personal|private)\s+.{0,10}(information|data|details))re",
           "request for private details"),
      Spec(inappropriate, "screening_bypass", Severity::kHigh,
           R"re((bypass|circumvent|avoid)\s+(screening|background\s+check))re",
           "bypassing tenant screening"),

      Spec(spam, "repeated_characters", Severity::kMedium, R"re((.)\1{10})re",
           "repeated characters"),
      Spec(spam, "call_to_action", Severity::kMedium,
           R"re((visit|click|buy|sell)\s+.{0,20}(now|today|here))re",
           "promotional call to action"),
      Spec(spam, "earnings_bait", Severity::kMedium,
           R"re((earn|make)\s+\$?\d+.{0,20}(quickly|fast|easy))re",
           "quick earnings bait"),
      Spec(spam, "urgency", Severity::kMedium,
           R"re((limited\s+time|act\s+now|don't\s+miss))re",
           "artificial urgency"),
  };
}

std::vector<RuleSpec> DefaultOutputRules() {
  const std::string unsafe = "unsafe";
  const std::string compliance = "compliance";
  const std::string misinformation = "misinformation";
  return {
      Spec(unsafe, "guaranteed_returns", Severity::kCritical,
           R"re((guarantee|promise|certain).{0,30}(profit|return|investment))re",
           "guaranteed investment returns"),
      Spec(unsafe, "illegal_advice", Severity::kCritical,
           R"re((illegal|unlawful|fraudulent)\s+(advice|recommendation))re",
           "illegal advice"),
      Spec(unsafe, "skipped_inspection", Severity::kCritical,
           R"re((no\s+inspection|skip\s+inspection|avoid\s+inspection))re",
           "advice to skip inspection"),
      Spec(unsafe, "falsified_documents", Severity::kCritical,
           R"re((fake|forge|falsify)\s+(document|signature|information))re",
           "falsified documents"),

      Spec(unsafe, "discrimination", Severity::kHigh,
           R"re((discriminat\w+|bias|prejudice)\s+.{0,20}(tenant|buyer|seller))re",
           "discriminatory advice"),
      Spec(unsafe, "concealed_defects", Severity::kHigh,
           R"re((hide|conceal|omit)\s+.{0,20}(defect|problem|issue))re",
           "concealing defects"),
      Spec(unsafe, "deception", Severity::kHigh,
           R"re((lie|mislead|deceive)\s+.{0,20}(client|customer|buyer))re",
           "deceiving clients"),
      Spec(unsafe, "unreported_cash", Severity::kHigh,
           R"re((under\s+the\s+table|off\s+the\s+books|cash\s+deal))re",
           "unreported cash dealings"),

      Spec(unsafe, "appreciation_claims", Severity::kMedium,
           R"re((definite|certain|guaranteed)\s+.{0,20}(appreciation|value\s+increase))re",
           "certain appreciation claims"),
      Spec(unsafe, "no_risk_claims", Severity::kMedium,
           R"re((can't\s+lose|risk\s*-?\s*free|sure\s+thing))re",
           "no-risk claims"),
      Spec(unsafe, "health_advice", Severity::kMedium,
           R"re((medical|health|safety)\s+.{0,20}(advice|recommendation))re",
           "medical or safety advice"),
      Spec(unsafe, "professional_advice", Severity::kMedium,
           R"re((legal|tax|financial)\s+advice\s+(?!general|basic))re",
           "specific legal, tax or financial advice"),

      Spec(unsafe, "buy_now", Severity::kLow,
           R"re((should|must|need\s+to)\s+(buy|sell|invest)\s+.{0,20}(now|immediately))re",
           "pressure to transact now"),
      Spec(unsafe, "absolute_investing", Severity::kLow,
           R"re((always|never)\s+.{0,20}(invest|buy|sell))re",
           "absolute investing rule"),

      Spec(compliance, "personal_data", Severity::kHigh,
           R"re((personal|private|confidential)\s+.{0,20}(information|data))re",
           "personal data disclosure"),
      Spec(compliance, "identity_numbers", Severity::kHigh,
           R"re((ssn|social\s+security|credit\s+score)\s+(?!general))re",
           "identity or credit details"),
      Spec(compliance, "individual_location", Severity::kHigh,
           R"re((exact|specific)\s+.{0,20}(address|location)\s+of\s+.{0,20}(person|individual))re",
           "location of an individual"),
      Spec(compliance, "phone_number", Severity::kHigh,
           R"re((contact|call|text)\s+.{0,20}\d{3}[-.\s]?\d{3}[-.\s]?\d{4})re",
           "phone number disclosure"),
      Spec(compliance, "email_address", Severity::kHigh,
           R"re([a-z0-9._%+-]+@[a-z0-9.-]+\.[a-z]{2,})re",
           "email address disclosure"),

      Spec(misinformation, "certain_forecast", Severity::kMedium,
           R"re((market\s+will\s+definitely|prices\s+will\s+certainly))re",
           "certain market forecast"),
      Spec(misinformation, "absolute_appreciation", Severity::kMedium,
           R"re((never|always)\s+.{0,20}(appreciate|depreciate))re",
           "absolute price movement claim"),
      Spec(misinformation, "conspiracy", Severity::kMedium,
           R"re((government\s+conspiracy|market\s+manipulation))re",
           "conspiracy claim"),
      Spec(misinformation, "insider_knowledge", Severity::kMedium,
           R"re((insider\s+information|secret\s+knowledge))re",
           "insider knowledge claim"),
  };
}

std::optional<std::vector<RuleSpec>> LoadRuleSpecs(std::string_view path,
                                                   std::string* error_out) {
  std::ifstream in{std::string(path)};
  if (!in) {
    if (error_out) {
      *error_out = "Failed to open rules file: " + std::string(path);
    }
    return std::nullopt;
  }

  nlohmann::json root;
  try {
    in >> root;
  } catch (const std::exception& ex) {
    if (error_out) {
      *error_out = std::string("Invalid JSON in rules file: ") + ex.what();
    }
    return std::nullopt;
  }
  if (!root.is_array()) {
    if (error_out) {
      *error_out = "Invalid rules file: root is not an array.";
    }
    return std::nullopt;
  }

  std::vector<RuleSpec> specs;
  for (size_t i = 0; i < root.size(); ++i) {
    const auto& entry = root[i];
    const std::string where = "rule #" + std::to_string(i);
    if (!entry.is_object()) {
      if (error_out) {
        *error_out = "Invalid rules file: " + where + " is not an object.";
      }
      return std::nullopt;
    }
    RuleSpec spec;
    try {
      spec.id = entry.value("id", "");
      spec.group = entry.value("group", "");
      spec.pattern = entry.value("pattern", "");
      spec.explanation = entry.value("explanation", "");
      const std::string severity = entry.value("severity", "");
      auto parsed = ParseSeverity(severity);
      if (!parsed) {
        if (error_out) {
          *error_out = "Invalid severity '" + severity + "' in " + where;
        }
        return std::nullopt;
      }
      spec.severity = *parsed;
    } catch (const nlohmann::json::exception& ex) {
      if (error_out) {
        *error_out = "Invalid field in " + where + ": " + ex.what();
      }
      return std::nullopt;
    }
    if (spec.id.empty() || spec.pattern.empty()) {
      if (error_out) {
        *error_out = "Invalid rules file: " + where + " needs an id and a pattern.";
      }
      return std::nullopt;
    }
    specs.push_back(std::move(spec));
  }
  return specs;
}

}  // namespace chatguard
