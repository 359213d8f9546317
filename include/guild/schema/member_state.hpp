#pragma once
#include <guild/schema/primitives.hpp>

// Schema type: member state.
// Membership row. A default constructed row (zero sponsor) is the "not a
// member" record returned for unknown principals.
namespace guild::schema {

template <uint16_t Version>
struct member_state;

template <>
struct member_state<1> final {
  uint16_t version{1};
  principal_t member{};
  principal_t sponsor{};
  handle_t handle{};
  timestamp_seconds_t time_joined{};
  timestamp_seconds_t last_action_time{};
};

using member_state_t = member_state<1>;

inline bool is_admitted(const member_state_t& state) {
  return !is_zero(state.sponsor);
}

}  // namespace guild::schema
