#include "ActionPolicy.hpp"
#include "Severity.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace {

const std::vector<chatguard::Severity> kAscending = {
    chatguard::Severity::kSafe, chatguard::Severity::kLow, chatguard::Severity::kMedium,
    chatguard::Severity::kHigh, chatguard::Severity::kCritical};

}  // namespace

TEST(ActionPolicyTests, SeverityOrderIsTotal) {
  for (size_t i = 0; i < kAscending.size(); ++i) {
    for (size_t j = 0; j < kAscending.size(); ++j) {
      const auto a = kAscending[i];
      const auto b = kAscending[j];
      const int relations = (a < b ? 1 : 0) + (a == b ? 1 : 0) + (a > b ? 1 : 0);
      EXPECT_EQ(relations, 1);
      EXPECT_EQ(a < b, i < j);
      EXPECT_EQ(a > b, i > j);
    }
  }
}

TEST(ActionPolicyTests, SeverityOrderIsTransitive) {
  for (auto a : kAscending) {
    for (auto b : kAscending) {
      for (auto c : kAscending) {
        if (a < b && b < c) {
          EXPECT_TRUE(a < c);
        }
      }
    }
  }
}

TEST(ActionPolicyTests, MaxSeverityKeepsHigher) {
  using chatguard::Severity;
  EXPECT_EQ(chatguard::MaxSeverity(Severity::kLow, Severity::kHigh), Severity::kHigh);
  EXPECT_EQ(chatguard::MaxSeverity(Severity::kCritical, Severity::kMedium), Severity::kCritical);
  EXPECT_EQ(chatguard::MaxSeverity(Severity::kSafe, Severity::kSafe), Severity::kSafe);
}

TEST(ActionPolicyTests, MapsEverySeverity) {
  using chatguard::Action;
  using chatguard::Severity;
  EXPECT_EQ(chatguard::ActionFor(Severity::kSafe), Action::kAllow);
  EXPECT_EQ(chatguard::ActionFor(Severity::kLow), Action::kAllow);
  EXPECT_EQ(chatguard::ActionFor(Severity::kMedium), Action::kWarn);
  EXPECT_EQ(chatguard::ActionFor(Severity::kHigh), Action::kBlock);
  EXPECT_EQ(chatguard::ActionFor(Severity::kCritical), Action::kEscalate);
}

TEST(ActionPolicyTests, ParsesSeverityNames) {
  EXPECT_EQ(chatguard::ParseSeverity("critical"), chatguard::Severity::kCritical);
  EXPECT_EQ(chatguard::ParseSeverity("Medium"), chatguard::Severity::kMedium);
  EXPECT_FALSE(chatguard::ParseSeverity("severe").has_value());
  for (auto severity : kAscending) {
    EXPECT_EQ(chatguard::ParseSeverity(chatguard::ToString(severity)), severity);
  }
}
