#pragma once

#include <guild/execution/clock.hpp>
#include <guild/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace guild::testing {

inline constexpr auto kOneDay = guild::schema::duration_seconds_t{86400};
inline constexpr auto kWeek = guild::schema::kOneWeekSeconds;

inline guild::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = guild::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline guild::schema::handle_t make_handle(const std::string_view text) {
  return guild::schema::try_make_bytes32(text).value();
}

inline guild::schema::proposal_url_t make_url(const std::string_view text) {
  auto url = guild::schema::proposal_url_t{};
  url[0] = make_handle(text);
  return url;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Clock whose value is set by the test. Copies of `source()` observe later
/// calls to `set` and `advance`.
class manual_clock final {
 public:
  explicit manual_clock(const guild::schema::timestamp_seconds_t start = 1)
      : now_{std::make_shared<guild::schema::timestamp_seconds_t>(start)} {}

  guild::schema::timestamp_seconds_t now() const { return *now_; }
  void set(const guild::schema::timestamp_seconds_t value) { *now_ = value; }
  void advance(const guild::schema::duration_seconds_t seconds) {
    *now_ += seconds;
  }

  guild::execution::clock_source_t source() const {
    return [now = now_] { return *now; };
  }

 private:
  std::shared_ptr<guild::schema::timestamp_seconds_t> now_;
};

}  // namespace guild::testing
