#pragma once

#include <guild/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

// Schema key type: engine keys.
// Canonical key prefixes and key codecs for membership, proposal, treasury
// and event rows.
namespace guild::schema::key {

inline constexpr std::string_view kMemberKeyPrefix{"SYS|STATE|MEMBER|"};
inline constexpr std::string_view kHandleKeyPrefix{"SYS|STATE|HANDLE|"};
inline constexpr std::string_view kProposalKeyPrefix{"SYS|STATE|PROPOSAL|"};
inline constexpr std::string_view kTreasuryKey{"SYS|STATE|TREASURY"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

template <typename Encoder, typename T>
guild::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                         std::string_view prefix,
                                         const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
guild::schema::bytes_t make_prefix_key(Encoder& encoder,
                                       std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
guild::schema::bytes_t make_member_key(
    Encoder& encoder,
    const guild::schema::principal_t& member) {
  return make_prefixed_key(encoder, kMemberKeyPrefix, member);
}

template <typename Encoder>
guild::schema::bytes_t make_handle_key(Encoder& encoder,
                                       const guild::schema::handle_t& handle) {
  return make_prefixed_key(encoder, kHandleKeyPrefix, handle);
}

template <typename Encoder>
guild::schema::bytes_t make_proposal_key(
    Encoder& encoder,
    const guild::schema::proposal_id_t& id) {
  return make_prefixed_key(encoder, kProposalKeyPrefix, id);
}

template <typename Encoder>
guild::schema::bytes_t make_treasury_key(Encoder& encoder) {
  return make_prefix_key(encoder, kTreasuryKey);
}

template <typename Encoder>
guild::schema::bytes_t make_event_key(Encoder& encoder,
                                      const uint64_t sequence) {
  return make_prefixed_key(encoder, kEventPrefix, sequence);
}

}  // namespace guild::schema::key
