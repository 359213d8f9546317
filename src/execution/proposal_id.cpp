#include <guild/blake3/hash.hpp>
#include <guild/execution/proposal_id.hpp>
#include <guild/schema/encoding/scale/encoder.hpp>
#include <tuple>

namespace guild::execution {

namespace {

using encoder_t =
    guild::schema::encoding::encoder<guild::schema::encoding::scale_encoder_tag>;

constexpr auto kProposalIdDomain = std::string_view{"guild-proposal-v1"};

}  // namespace

guild::schema::proposal_id_t derive_proposal_id(
    const guild::schema::principal_t& sponsor,
    const guild::schema::proposal_url_t& url,
    const guild::schema::digest_t& digest,
    const guild::schema::principal_t& wallet,
    const guild::schema::amount_t& value,
    const guild::schema::timestamp_seconds_t time_submitted) {
  auto encoder = encoder_t{};
  auto material = encoder.encode(kProposalIdDomain);
  encoder.encode(
      std::tuple{sponsor, url, digest, wallet, value, time_submitted},
      material);
  return guild::blake3::hash(guild::schema::make_bytes_view(material));
}

}  // namespace guild::execution
