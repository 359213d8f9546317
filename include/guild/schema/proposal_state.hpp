#pragma once
#include <guild/schema/primitives.hpp>

// Schema type: proposal state.
// Spending proposal row. `value` only ever moves to zero (vetoed or claimed);
// a row with `time_submitted == 0` does not exist.
namespace guild::schema {

template <uint16_t Version>
struct proposal_state;

template <>
struct proposal_state<1> final {
  uint16_t version{1};
  proposal_id_t id{};
  principal_t sponsor{};
  proposal_url_t url{};
  digest_t digest{};
  principal_t wallet{};
  amount_t value{};
  timestamp_seconds_t time_submitted{};
};

using proposal_state_t = proposal_state<1>;

inline bool is_submitted(const proposal_state_t& state) {
  return state.time_submitted != 0;
}

inline bool is_neutralized(const proposal_state_t& state) {
  return state.value == 0;
}

}  // namespace guild::schema
