#pragma once

#include <guild/schema/governance_error_code.hpp>
#include <guild/schema/governance_event.hpp>
#include <guild/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace guild::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<governance_event_t> events;

  bool ok() const { return code == 0; }
};

using operation_result_t = operation_result<1>;

inline bool has_error(const operation_result_t& result,
                      const governance_error_code code) {
  return result.code == to_code(code);
}

inline operation_result_t make_error_result(const governance_error_code code,
                                            const std::string_view codespace,
                                            std::string info = {}) {
  auto result = operation_result_t{};
  result.code = to_code(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

}  // namespace guild::schema
