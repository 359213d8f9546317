#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace guild::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_seconds_t = uint64_t;
using duration_seconds_t = uint64_t;

// Address-like key of a member, donor or payout wallet. The all-zero value is
// the "nobody" sentinel.
using principal_t = hash32_t;
// Fixed-size opaque nickname, unique among admitted members.
using handle_t = hash32_t;
using proposal_id_t = hash32_t;
using digest_t = hash32_t;
// Link to the proposal document, stored as four 32-byte blocks.
using proposal_url_t = std::array<hash32_t, 4>;

inline constexpr duration_seconds_t kOneWeekSeconds = 604800;

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const hash32_t& hash);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();
bool is_zero(const hash32_t& hash);

/// Parse a 32-byte block from either 64 hex digits (optionally `0x` prefixed)
/// or up to 32 raw ASCII bytes, zero padded on the right.
std::optional<hash32_t> try_make_bytes32(const std::string_view& text);

/// Render a 32-byte block as text when it is zero-padded printable ASCII.
std::optional<std::string> try_make_ascii(const hash32_t& block);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);

std::optional<amount_t> try_make_amount(const std::string_view decimal);

}  // namespace guild::schema
