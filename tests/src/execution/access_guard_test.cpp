#include <gtest/gtest.h>
#include <guild/execution/access_guard.hpp>
#include <guild/testing/common.hpp>

namespace {

using guild::schema::governance_error_code;
using guild::testing::kWeek;

guild::schema::member_state_t make_member(
    const guild::schema::timestamp_seconds_t joined,
    const guild::schema::timestamp_seconds_t last_action = 0) {
  return guild::schema::member_state_t{.member = guild::testing::make_hash(2),
                                       .sponsor = guild::testing::make_hash(1),
                                       .handle = guild::testing::make_handle("m"),
                                       .time_joined = joined,
                                       .last_action_time = last_action};
}

}  // namespace

TEST(access_guard, elapsed_since_saturates) {
  EXPECT_EQ(guild::execution::elapsed_since(10, 4), 6u);
  EXPECT_EQ(guild::execution::elapsed_since(4, 10), 0u);
}

TEST(access_guard, default_row_is_not_a_member) {
  auto error = guild::execution::require_full_member(
      guild::schema::member_state_t{}, 10 * kWeek, kWeek);
  EXPECT_EQ(error, governance_error_code::not_a_member);
}

TEST(access_guard, member_is_full_exactly_after_provisional_period) {
  auto member = make_member(1000);
  EXPECT_EQ(guild::execution::require_full_member(member, 1000 + kWeek - 1, kWeek),
            governance_error_code::not_yet_full);
  EXPECT_FALSE(guild::execution::require_full_member(member, 1000 + kWeek, kWeek)
                   .has_value());
}

TEST(access_guard, cooldown_expires_at_boundary) {
  auto member = make_member(0, 5 * kWeek);
  EXPECT_EQ(guild::execution::require_cooldown_elapsed(member, 6 * kWeek - 1,
                                                       kWeek),
            governance_error_code::rate_limited);
  EXPECT_FALSE(
      guild::execution::require_cooldown_elapsed(member, 6 * kWeek, kWeek)
          .has_value());
}

TEST(access_guard, active_check_reports_membership_before_cooldown) {
  auto member = make_member(10 * kWeek, 10 * kWeek);
  EXPECT_EQ(guild::execution::require_active_member(member, 10 * kWeek, kWeek,
                                                    kWeek),
            governance_error_code::not_yet_full);

  member.time_joined = 0;
  EXPECT_EQ(guild::execution::require_active_member(member, 10 * kWeek, kWeek,
                                                    kWeek),
            governance_error_code::rate_limited);

  guild::execution::record_action(member, 3 * kWeek);
  EXPECT_EQ(member.last_action_time, 3 * kWeek);
  EXPECT_FALSE(guild::execution::require_active_member(member, 10 * kWeek,
                                                       kWeek, kWeek)
                   .has_value());
}
