#pragma once

#include <guild/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: event type.
// Notification kinds emitted by successful governance operations.
namespace guild::schema {

enum class event_type_t : uint8_t {
  new_member = 0,
  member_vetoed = 1,
  new_proposal = 2,
  proposal_vetoed = 3,
  proposal_claimed = 4,
  new_donation = 5
};

inline constexpr auto kEventTypeMappings = std::array{
    enum_mapping_t<event_type_t>{"new_member", event_type_t::new_member},
    enum_mapping_t<event_type_t>{"member_vetoed", event_type_t::member_vetoed},
    enum_mapping_t<event_type_t>{"new_proposal", event_type_t::new_proposal},
    enum_mapping_t<event_type_t>{"proposal_vetoed",
                                 event_type_t::proposal_vetoed},
    enum_mapping_t<event_type_t>{"proposal_claimed",
                                 event_type_t::proposal_claimed},
    enum_mapping_t<event_type_t>{"new_donation", event_type_t::new_donation}};

template <>
inline std::optional<event_type_t> try_from_string<event_type_t>(
    const std::string_view value) {
  return from_string(value, kEventTypeMappings);
}

inline constexpr std::string_view to_string(const event_type_t value) {
  return to_string(value, kEventTypeMappings).value_or("unknown");
}

}  // namespace guild::schema
