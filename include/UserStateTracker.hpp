#pragma once

#include "SecurityLog.hpp"
#include "Severity.hpp"

#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace chatguard {

struct UserState {
  int warning_count = 0;
  bool blocked = false;
};

struct UserStatus {
  std::string user_id;
  int warnings = 0;
  bool is_blocked = false;
  int max_warnings = 0;
};

// Result of feeding one action into a user's record.
struct Outcome {
  Action action = Action::kAllow;
  // The user is blocked once this call returns.
  bool blocked = false;
  // The user was already blocked; the incoming action was ignored.
  bool was_blocked = false;
  // This call's warning reached max_warnings and locked the user out.
  bool locked_out = false;
};

struct TrackerTotals {
  size_t blocked_users = 0;
  long long total_warnings = 0;
};

// Per-user warning counts and lockouts. Every read-modify-write holds one
// lock, so concurrent turns for the same user never lose an update. Records
// live until Reset() or process exit; lockouts never expire on their own.
class UserStateTracker {
 public:
  UserStateTracker(int max_warnings, const SecurityLog& log);

  UserStateTracker(const UserStateTracker&) = delete;
  UserStateTracker& operator=(const UserStateTracker&) = delete;

  // Empty `user_id` is not tracked: the action is passed through unchanged.
  Outcome RecordOutcome(std::string_view user_id, Action action);

  bool IsBlocked(std::string_view user_id) const;
  UserState State(std::string_view user_id) const;
  UserStatus Status(std::string_view user_id) const;
  void Reset(std::string_view user_id);

  TrackerTotals Totals() const;
  int max_warnings() const { return max_warnings_; }

 private:
  const int max_warnings_;
  const SecurityLog& log_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, UserState> users_;
};

}  // namespace chatguard
