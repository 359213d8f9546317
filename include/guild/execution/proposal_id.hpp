#pragma once

#include <guild/schema/primitives.hpp>

namespace guild::execution {

/// Content-derived proposal identifier.
///
/// BLAKE3 over the SCALE encoding of every field, submission time included:
/// resubmitting the same payload in a later tick yields a fresh id, while the
/// same payload in the same tick collides.
guild::schema::proposal_id_t derive_proposal_id(
    const guild::schema::principal_t& sponsor,
    const guild::schema::proposal_url_t& url,
    const guild::schema::digest_t& digest,
    const guild::schema::principal_t& wallet,
    const guild::schema::amount_t& value,
    guild::schema::timestamp_seconds_t time_submitted);

}  // namespace guild::execution
