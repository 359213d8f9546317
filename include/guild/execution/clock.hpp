#pragma once

#include <guild/schema/primitives.hpp>
#include <chrono>
#include <functional>

namespace guild::execution {

/// Source of "now" in whole seconds. Must be monotonically non-decreasing;
/// consecutive reads may return the same value.
using clock_source_t = std::function<guild::schema::timestamp_seconds_t()>;

inline clock_source_t make_system_clock() {
  return [] {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<guild::schema::timestamp_seconds_t>(
        std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count());
  };
}

}  // namespace guild::execution
