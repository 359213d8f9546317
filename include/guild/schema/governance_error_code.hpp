#pragma once

#include <guild/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: governance error code.
// Failure taxonomy for membership, proposal and treasury operations. Every
// code is reported before any state is touched.
namespace guild::schema {

enum class governance_error_code : uint32_t {
  not_a_member = 1,
  not_yet_full = 2,
  rate_limited = 3,
  already_member = 4,
  handle_taken = 5,
  veto_window_closed = 6,
  insufficient_funds = 7,
  duplicate_proposal = 8,
  not_yet_claimable = 9,
  invalid_principal = 10,
  proposal_not_found = 11,
  transfer_failed = 12,
  treasury_overflow = 13,
};

inline constexpr auto kGovernanceErrorCodeMappings = std::array{
    enum_mapping_t<governance_error_code>{"not_a_member",
                                          governance_error_code::not_a_member},
    enum_mapping_t<governance_error_code>{"not_yet_full",
                                          governance_error_code::not_yet_full},
    enum_mapping_t<governance_error_code>{"rate_limited",
                                          governance_error_code::rate_limited},
    enum_mapping_t<governance_error_code>{
        "already_member", governance_error_code::already_member},
    enum_mapping_t<governance_error_code>{"handle_taken",
                                          governance_error_code::handle_taken},
    enum_mapping_t<governance_error_code>{
        "veto_window_closed", governance_error_code::veto_window_closed},
    enum_mapping_t<governance_error_code>{
        "insufficient_funds", governance_error_code::insufficient_funds},
    enum_mapping_t<governance_error_code>{
        "duplicate_proposal", governance_error_code::duplicate_proposal},
    enum_mapping_t<governance_error_code>{
        "not_yet_claimable", governance_error_code::not_yet_claimable},
    enum_mapping_t<governance_error_code>{
        "invalid_principal", governance_error_code::invalid_principal},
    enum_mapping_t<governance_error_code>{
        "proposal_not_found", governance_error_code::proposal_not_found},
    enum_mapping_t<governance_error_code>{
        "transfer_failed", governance_error_code::transfer_failed},
    enum_mapping_t<governance_error_code>{
        "treasury_overflow", governance_error_code::treasury_overflow}};

template <>
inline std::optional<governance_error_code>
try_from_string<governance_error_code>(const std::string_view value) {
  return from_string(value, kGovernanceErrorCodeMappings);
}

inline constexpr std::string_view to_string(const governance_error_code value) {
  return to_string(value, kGovernanceErrorCodeMappings).value_or("unknown");
}

inline constexpr uint32_t to_code(const governance_error_code value) {
  return static_cast<uint32_t>(value);
}

}  // namespace guild::schema
