#pragma once

#include "Classifier.hpp"
#include "GuardrailConfig.hpp"
#include "PatternLibrary.hpp"
#include "SecurityLog.hpp"
#include "UserStateTracker.hpp"
#include "Verdict.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace chatguard {

namespace messages {
inline constexpr const char* kLockedOut =
    "Your account has been temporarily restricted due to security concerns. Please contact "
    "support.";
inline constexpr const char* kRepeatedWarnings =
    "Your account has been temporarily restricted due to repeated security warnings.";
inline constexpr const char* kRephrase =
    "Your message contains potentially inappropriate content. Please rephrase your question "
    "about real estate in a professional manner.";
inline constexpr const char* kPolicyViolation =
    "Your message has been blocked due to inappropriate content. Please ask questions related "
    "to real estate in a respectful and legal manner.";
inline constexpr const char* kAccountRestricted =
    "Your message has been flagged for serious policy violations. Your account has been "
    "temporarily restricted.";
inline constexpr const char* kDisclaimer =
    "\n\nDisclaimer: This information is for general purposes only. Please consult with "
    "qualified professionals for specific advice regarding real estate transactions, legal "
    "matters, or financial decisions.";
inline constexpr const char* kSafeFallback =
    "I apologize, but I cannot provide a response to that query. Please ask me about real "
    "estate properties, market insights, or general housing information, and I'll be happy to "
    "help.";
}  // namespace messages

struct FilterResult {
  bool allowed = false;
  std::string message;
  Verdict verdict;
};

struct HealthReport {
  std::string status = "healthy";
  bool guardrail_active = true;
  size_t blocked_users = 0;
  long long total_warnings = 0;
};

// Entry points the transport layer calls before handing user text to the
// model (FilterInput) and before handing model text back (FilterOutput).
// Classification runs without locks; only the tracker update is serialized.
class GuardrailPipeline {
 public:
  // Throws std::invalid_argument when `config` fails ValidateConfig() or its
  // max_warnings differs from the tracker's.
  GuardrailPipeline(PatternLibrary library,
                    const GuardrailConfig& config,
                    UserStateTracker& tracker,
                    const SecurityLog& log);

  GuardrailPipeline(const GuardrailPipeline&) = delete;
  GuardrailPipeline& operator=(const GuardrailPipeline&) = delete;

  FilterResult FilterInput(std::string_view text, std::string_view user_id = {});
  FilterResult FilterOutput(std::string_view text, const ClassifyContext& context = {});

  UserStatus Status(std::string_view user_id) const;
  void Reset(std::string_view user_id);
  HealthReport Health() const;

  void LogSecurityEvent(std::string_view event_type,
                        std::string_view user_id,
                        nlohmann::json details) const;

  const GuardrailConfig& config() const { return config_; }
  const PatternLibrary& library() const { return library_; }

 private:
  GuardrailConfig config_;
  PatternLibrary library_;
  UserStateTracker& tracker_;
  const SecurityLog& log_;
  InputClassifier input_classifier_;
  OutputClassifier output_classifier_;
};

// Canned messages for failures outside classification: "general",
// "inappropriate", "technical", "blocked". Unknown kinds get "general".
std::string SafeErrorMessage(std::string_view kind);

nlohmann::json ToJson(const UserStatus& status);
nlohmann::json ToJson(const HealthReport& health);

}  // namespace chatguard
