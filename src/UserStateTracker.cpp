#include "UserStateTracker.hpp"

#include <stdexcept>

namespace chatguard {

UserStateTracker::UserStateTracker(int max_warnings, const SecurityLog& log)
    : max_warnings_(max_warnings), log_(log) {
  if (max_warnings_ < 1) {
    throw std::invalid_argument("max_warnings must be >= 1");
  }
}

Outcome UserStateTracker::RecordOutcome(std::string_view user_id, Action action) {
  Outcome outcome;
  outcome.action = action;
  if (user_id.empty() || action == Action::kAllow) {
    outcome.blocked = !user_id.empty() && IsBlocked(user_id);
    if (outcome.blocked) {
      outcome.action = Action::kBlock;
      outcome.was_blocked = true;
    }
    return outcome;
  }

  int warnings = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    UserState& state = users_[std::string(user_id)];
    if (state.blocked) {
      outcome.action = Action::kBlock;
      outcome.blocked = true;
      outcome.was_blocked = true;
      return outcome;
    }
    switch (action) {
      case Action::kWarn:
        ++state.warning_count;
        if (state.warning_count >= max_warnings_) {
          state.blocked = true;
          outcome.action = Action::kEscalate;
          outcome.locked_out = true;
        }
        break;
      case Action::kBlock:
        ++state.warning_count;
        break;
      case Action::kEscalate:
        state.blocked = true;
        break;
      case Action::kAllow:
        break;
    }
    outcome.blocked = state.blocked;
    warnings = state.warning_count;
  }

  if (outcome.locked_out) {
    log_.Write(LogLevel::kWarning, "user_locked_out", user_id,
               {{"warnings", warnings}, {"max_warnings", max_warnings_}});
  } else if (action == Action::kEscalate) {
    log_.Write(LogLevel::kCritical, "user_escalated", user_id, {{"warnings", warnings}});
  }
  return outcome;
}

bool UserStateTracker::IsBlocked(std::string_view user_id) const {
  return State(user_id).blocked;
}

UserState UserStateTracker::State(std::string_view user_id) const {
  if (user_id.empty()) {
    return {};
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = users_.find(std::string(user_id));
  if (it == users_.end()) {
    return {};
  }
  return it->second;
}

UserStatus UserStateTracker::Status(std::string_view user_id) const {
  const UserState state = State(user_id);
  UserStatus status;
  status.user_id = std::string(user_id);
  status.warnings = state.warning_count;
  status.is_blocked = state.blocked;
  status.max_warnings = max_warnings_;
  return status;
}

void UserStateTracker::Reset(std::string_view user_id) {
  if (user_id.empty()) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    users_.erase(std::string(user_id));
  }
  log_.Write(LogLevel::kInfo, "user_reset", user_id, nlohmann::json::object());
}

TrackerTotals UserStateTracker::Totals() const {
  TrackerTotals totals;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [id, state] : users_) {
    if (state.blocked) {
      ++totals.blocked_users;
    }
    totals.total_warnings += state.warning_count;
  }
  return totals;
}

}  // namespace chatguard
