#include "GuardedTurn.hpp"

namespace chatguard {
namespace {

std::optional<std::string> CallBackend(const ChatBackend& backend,
                                       std::string_view prompt,
                                       std::string* error_out) {
  if (!backend.chat) {
    *error_out = "No chat backend configured.";
    return std::nullopt;
  }
  try {
    return backend.chat(prompt, error_out);
  } catch (const std::exception& ex) {
    *error_out = ex.what();
    return std::nullopt;
  } catch (...) {
    *error_out = "Chat backend failed with a non-standard exception.";
    return std::nullopt;
  }
}

}  // namespace

TurnResult RunGuardedTurn(GuardrailPipeline& pipeline,
                          const ChatBackend& backend,
                          std::string_view text,
                          std::string_view user_id) {
  TurnResult turn{false, {}, pipeline.FilterInput(text, user_id), std::nullopt};
  const Verdict& input_verdict = turn.input.verdict;
  if (input_verdict.severity() != Severity::kSafe) {
    pipeline.LogSecurityEvent("input_warning", user_id,
                              {{"risk_level", ToString(input_verdict.severity())},
                               {"reason", input_verdict.reason()},
                               {"allowed", turn.input.allowed}});
  }
  if (!turn.input.allowed) {
    turn.reply = turn.input.message;
    return turn;
  }

  std::string error;
  auto reply = CallBackend(backend, turn.input.message, &error);
  if (!reply) {
    pipeline.LogSecurityEvent("backend_error", user_id, {{"error", error}});
    turn.reply = SafeErrorMessage("technical");
    return turn;
  }

  ClassifyContext context;
  context.user_id = std::string(user_id);
  // FilterOutput logs rejected replies itself.
  turn.output = pipeline.FilterOutput(*reply, context);
  turn.delivered = turn.output->allowed;
  turn.reply = turn.output->message;
  return turn;
}

}  // namespace chatguard
