#pragma once

#include <guild/schema/governance_error_code.hpp>
#include <guild/schema/member_state.hpp>
#include <guild/schema/primitives.hpp>
#include <optional>

namespace guild::execution {

/// Seconds between `since` and `now`, zero when `now` is earlier.
guild::schema::duration_seconds_t elapsed_since(
    guild::schema::timestamp_seconds_t now,
    guild::schema::timestamp_seconds_t since);

/// `not_a_member` for a non-admitted row, `not_yet_full` while the member is
/// still inside its provisional period.
std::optional<guild::schema::governance_error_code> require_full_member(
    const guild::schema::member_state_t& member,
    guild::schema::timestamp_seconds_t now,
    guild::schema::duration_seconds_t provisional_period);

/// `rate_limited` when the member's last sponsor-or-propose action is more
/// recent than `cooldown`.
std::optional<guild::schema::governance_error_code> require_cooldown_elapsed(
    const guild::schema::member_state_t& member,
    guild::schema::timestamp_seconds_t now,
    guild::schema::duration_seconds_t cooldown);

/// Full membership followed by the cooldown check.
std::optional<guild::schema::governance_error_code> require_active_member(
    const guild::schema::member_state_t& member,
    guild::schema::timestamp_seconds_t now,
    guild::schema::duration_seconds_t provisional_period,
    guild::schema::duration_seconds_t cooldown);

/// Consume the member's action budget. Call only after the guarded action
/// passed all of its own checks.
void record_action(guild::schema::member_state_t& member,
                   guild::schema::timestamp_seconds_t now);

}  // namespace guild::execution
