#pragma once

#include <guild/schema/member_state.hpp>
#include <guild/schema/primitives.hpp>
#include <guild/schema/proposal_state.hpp>
#include <map>
#include <set>

namespace guild::execution {

/// In-memory tables shared by the membership registry and proposal ledger.
/// Only the engine, while holding its lock, hands out references to it.
struct ledger_state final {
  std::map<guild::schema::principal_t, guild::schema::member_state_t> members;
  std::set<guild::schema::handle_t> taken_handles;
  std::map<guild::schema::proposal_id_t, guild::schema::proposal_state_t>
      proposals;
  guild::schema::amount_t treasury{};
};

/// Keys written by one operation; persisted as a single batch on success.
struct ledger_delta final {
  std::set<guild::schema::principal_t> members;
  std::set<guild::schema::handle_t> handles;
  std::set<guild::schema::proposal_id_t> proposals;
  bool treasury{};
};

}  // namespace guild::execution
