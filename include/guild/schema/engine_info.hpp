#pragma once

#include <guild/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: engine info.
// Ledger metadata: number of committed events and the rolling state root.
namespace guild::schema {

template <uint16_t Version>
struct engine_info;

template <>
struct engine_info<1> final {
  uint16_t version{1};
  std::string data{"guild-treasury"};
  std::string app_version{"0.1.0"};
  uint64_t last_sequence{};
  hash32_t state_root{};
  amount_t treasury_balance{};
  uint64_t member_count{};
  uint64_t proposal_count{};
};

using engine_info_t = engine_info<1>;

}  // namespace guild::schema
