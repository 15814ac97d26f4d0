#pragma once

#include "GuardrailPipeline.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace chatguard {

// Model seam used by the transport layer. ChatGuard never calls it from the
// pipeline itself; RunGuardedTurn wires it between the two filters.
struct ChatBackend {
  using ChatFn =
      std::function<std::optional<std::string>(std::string_view prompt, std::string* error_out)>;
  ChatFn chat;
};

struct TurnResult {
  // True when `reply` came from the model (possibly with a disclaimer).
  bool delivered = false;
  std::string reply;
  FilterResult input;
  std::optional<FilterResult> output;
};

// filter input -> backend -> filter output for one conversation turn.
// Backend failures are logged and answered with the "technical" safe error
// message; they never propagate to the caller.
TurnResult RunGuardedTurn(GuardrailPipeline& pipeline,
                          const ChatBackend& backend,
                          std::string_view text,
                          std::string_view user_id = {});

}  // namespace chatguard
