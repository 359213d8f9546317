#pragma once

#include <guild/schema/event_attribute.hpp>
#include <guild/schema/event_type.hpp>
#include <guild/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Schema type: governance event.
// Append-only notification log entry. `sequence` and `time` are assigned by
// the engine when the emitting operation commits.
namespace guild::schema {

template <uint16_t Version>
struct governance_event;

template <>
struct governance_event<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  timestamp_seconds_t time{};
  event_type_t type{};
  std::vector<event_attribute_t> attributes;
};

using governance_event_t = governance_event<1>;

inline event_attribute_t make_attribute(const std::string_view key,
                                        std::string value,
                                        const bool index = false) {
  return event_attribute_t{
      .key = std::string{key}, .value = std::move(value), .index = index};
}

inline std::optional<std::string_view> find_attribute(
    const governance_event_t& event,
    const std::string_view key) {
  for (const auto& attribute : event.attributes) {
    if (attribute.key == key) {
      return std::string_view{attribute.value};
    }
  }
  return std::nullopt;
}

}  // namespace guild::schema
