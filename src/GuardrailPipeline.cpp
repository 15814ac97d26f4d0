#include "GuardrailPipeline.hpp"

#include <stdexcept>

namespace chatguard {
namespace {

Verdict BlockedUserVerdict() {
  return Verdict(Severity::kCritical, Action::kBlock, "user is currently blocked", 1.0, {});
}

const GuardrailConfig& Validated(const GuardrailConfig& config) {
  std::string error;
  if (!ValidateConfig(config, &error)) {
    throw std::invalid_argument("Invalid guardrail config: " + error);
  }
  return config;
}

}  // namespace

GuardrailPipeline::GuardrailPipeline(PatternLibrary library,
                                     const GuardrailConfig& config,
                                     UserStateTracker& tracker,
                                     const SecurityLog& log)
    : config_(Validated(config)),
      library_(std::move(library)),
      tracker_(tracker),
      log_(log),
      input_classifier_(library_.input(), config_, log_),
      output_classifier_(library_.output(), config_, log_) {
  if (config_.max_warnings != tracker_.max_warnings()) {
    throw std::invalid_argument("Guardrail config max_warnings (" +
                                std::to_string(config_.max_warnings) +
                                ") does not match the user state tracker (" +
                                std::to_string(tracker_.max_warnings()) + ")");
  }
}

FilterResult GuardrailPipeline::FilterInput(std::string_view text, std::string_view user_id) {
  if (tracker_.IsBlocked(user_id)) {
    return {false, messages::kLockedOut, BlockedUserVerdict()};
  }

  ClassifyContext context;
  context.user_id = std::string(user_id);
  Verdict verdict = input_classifier_.Classify(text, context);

  const Outcome outcome = tracker_.RecordOutcome(user_id, verdict.action());
  if (outcome.was_blocked) {
    return {false, messages::kLockedOut, BlockedUserVerdict()};
  }
  if (outcome.locked_out) {
    return {false, messages::kRepeatedWarnings, std::move(verdict)};
  }

  switch (outcome.action) {
    case Action::kAllow:
      return {true, std::string(text), std::move(verdict)};
    case Action::kWarn:
      return {false, messages::kRephrase, std::move(verdict)};
    case Action::kBlock:
      return {false, messages::kPolicyViolation, std::move(verdict)};
    case Action::kEscalate:
      return {false, messages::kAccountRestricted, std::move(verdict)};
  }
  return {false, SafeErrorMessage("blocked"), std::move(verdict)};
}

FilterResult GuardrailPipeline::FilterOutput(std::string_view text,
                                             const ClassifyContext& context) {
  Verdict verdict = output_classifier_.Classify(text, context);
  switch (verdict.action()) {
    case Action::kAllow:
      return {true, std::string(text), std::move(verdict)};
    case Action::kWarn:
      return {true, std::string(text) + messages::kDisclaimer, std::move(verdict)};
    case Action::kBlock:
    case Action::kEscalate:
      log_.Write(LogLevel::kError, "output_blocked", context.user_id,
                 {{"severity", ToString(verdict.severity())}, {"reason", verdict.reason()}});
      return {false, messages::kSafeFallback, std::move(verdict)};
  }
  return {false, messages::kSafeFallback, std::move(verdict)};
}

UserStatus GuardrailPipeline::Status(std::string_view user_id) const {
  return tracker_.Status(user_id);
}

void GuardrailPipeline::Reset(std::string_view user_id) { tracker_.Reset(user_id); }

HealthReport GuardrailPipeline::Health() const {
  const TrackerTotals totals = tracker_.Totals();
  HealthReport health;
  health.blocked_users = totals.blocked_users;
  health.total_warnings = totals.total_warnings;
  return health;
}

void GuardrailPipeline::LogSecurityEvent(std::string_view event_type,
                                         std::string_view user_id,
                                         nlohmann::json details) const {
  log_.Write(LogLevel::kInfo, event_type, user_id, std::move(details));
}

std::string SafeErrorMessage(std::string_view kind) {
  if (kind == "inappropriate") {
    return "Please keep our conversation focused on real estate topics and maintain a "
           "professional tone.";
  }
  if (kind == "technical") {
    return "I'm experiencing technical difficulties. Please try your real estate question again "
           "in a moment.";
  }
  if (kind == "blocked") {
    return "Your request cannot be processed. Please ensure you're asking about legitimate real "
           "estate topics.";
  }
  return "I apologize, but I encountered an issue processing your request. Please try "
         "rephrasing your question about real estate.";
}

nlohmann::json ToJson(const UserStatus& status) {
  return {{"user_id", status.user_id},
          {"warnings", status.warnings},
          {"is_blocked", status.is_blocked},
          {"max_warnings", status.max_warnings}};
}

nlohmann::json ToJson(const HealthReport& health) {
  return {{"status", health.status},
          {"guardrail_active", health.guardrail_active},
          {"blocked_users", health.blocked_users},
          {"total_warnings", health.total_warnings}};
}

}  // namespace chatguard
