#pragma once

#include <guild/schema/primitives.hpp>
#include <vector>

namespace guild::execution {

/// Founding member admitted when the ledger is first created. Genesis members
/// sponsor themselves and join at time zero, so they are full members
/// immediately.
struct genesis_member final {
  guild::schema::principal_t member{};
  guild::schema::handle_t handle{};
};

struct engine_options final {
  /// Provisional period of a new member and veto window of a new proposal.
  /// A proposal becomes claimable when this window closes.
  guild::schema::duration_seconds_t veto_window{guild::schema::kOneWeekSeconds};

  /// Minimum spacing between two sponsor-or-propose actions of one member.
  guild::schema::duration_seconds_t cooldown{guild::schema::kOneWeekSeconds};

  /// When false (compatible), a vetoed member's handle stays reserved forever.
  bool release_handle_on_member_veto{false};

  /// When true, vetoing an id that was never submitted fails with
  /// `proposal_not_found` instead of succeeding as a no-op.
  bool strict_proposal_veto{false};

  std::vector<genesis_member> genesis_members;
};

}  // namespace guild::execution
