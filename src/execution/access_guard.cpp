#include <guild/execution/access_guard.hpp>

using namespace guild::schema;

namespace guild::execution {

duration_seconds_t elapsed_since(const timestamp_seconds_t now,
                                 const timestamp_seconds_t since) {
  return now >= since ? now - since : 0;
}

std::optional<governance_error_code> require_full_member(
    const member_state_t& member,
    const timestamp_seconds_t now,
    const duration_seconds_t provisional_period) {
  if (!is_admitted(member)) {
    return governance_error_code::not_a_member;
  }
  if (elapsed_since(now, member.time_joined) < provisional_period) {
    return governance_error_code::not_yet_full;
  }
  return std::nullopt;
}

std::optional<governance_error_code> require_cooldown_elapsed(
    const member_state_t& member,
    const timestamp_seconds_t now,
    const duration_seconds_t cooldown) {
  if (elapsed_since(now, member.last_action_time) < cooldown) {
    return governance_error_code::rate_limited;
  }
  return std::nullopt;
}

std::optional<governance_error_code> require_active_member(
    const member_state_t& member,
    const timestamp_seconds_t now,
    const duration_seconds_t provisional_period,
    const duration_seconds_t cooldown) {
  if (auto error = require_full_member(member, now, provisional_period)) {
    return error;
  }
  return require_cooldown_elapsed(member, now, cooldown);
}

void record_action(member_state_t& member, const timestamp_seconds_t now) {
  member.last_action_time = now;
}

}  // namespace guild::execution
