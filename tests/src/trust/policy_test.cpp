#include <gtest/gtest.h>
#include <warden/trust/policy.hpp>

namespace {

using warden::schema::trust_tier_t;

}  // namespace

TEST(tier_policy, default_requirements) {
  auto policy = warden::trust::tier_policy{};
  EXPECT_EQ(policy.requirement("arbor://fs/read/docs").minimum,
            trust_tier_t::untrusted);
  EXPECT_EQ(policy.requirement("arbor://fs/write/docs").minimum,
            trust_tier_t::trusted);
  EXPECT_EQ(policy.requirement("arbor://code/read").minimum,
            trust_tier_t::probationary);
  EXPECT_EQ(policy.requirement("arbor://net/http").minimum,
            trust_tier_t::probationary);

  auto shell = policy.requirement("arbor://shell/exec");
  EXPECT_EQ(shell.minimum, trust_tier_t::veteran);
  EXPECT_TRUE(shell.gated);

  auto governance = policy.requirement("ARBOR://governance/change/quorum");
  EXPECT_EQ(governance.minimum, trust_tier_t::autonomous);
  EXPECT_TRUE(governance.gated);

  auto unknown = policy.requirement("arbor://mail/send");
  EXPECT_EQ(unknown.minimum, trust_tier_t::untrusted);
  EXPECT_FALSE(unknown.gated);
}

TEST(tier_policy, longest_prefix_wins) {
  auto policy = warden::trust::tier_policy{{
      {"arbor://fs/write", trust_tier_t::trusted, false},
      {"arbor://fs/write/scratch", trust_tier_t::probationary, false},
  }};
  EXPECT_EQ(policy.requirement("arbor://fs/write/scratch/tmp.txt").minimum,
            trust_tier_t::probationary);
  EXPECT_EQ(policy.requirement("arbor://fs/write/scratchpad").minimum,
            trust_tier_t::trusted);
}

TEST(tier_policy, ceiling_only_restricts) {
  auto policy = warden::trust::tier_policy{};
  EXPECT_EQ(policy.effective_tier("agent_a", trust_tier_t::veteran),
            trust_tier_t::veteran);

  policy.set_ceiling("agent_a", trust_tier_t::probationary);
  EXPECT_EQ(policy.effective_tier("agent_a", trust_tier_t::veteran),
            trust_tier_t::probationary);
  EXPECT_EQ(policy.effective_tier("agent_a", trust_tier_t::untrusted),
            trust_tier_t::untrusted);
  EXPECT_EQ(policy.effective_tier("agent_b", trust_tier_t::veteran),
            trust_tier_t::veteran);

  policy.clear_ceiling("agent_a");
  EXPECT_EQ(policy.effective_tier("agent_a", trust_tier_t::veteran),
            trust_tier_t::veteran);
}
