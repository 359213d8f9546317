#include <spdlog/spdlog.h>
#include <guild/execution/access_guard.hpp>
#include <guild/execution/membership_registry.hpp>
#include <guild/schema/governance_event.hpp>

using namespace guild::schema;

namespace guild::execution {

namespace {

governance_event_t make_new_member_event(const principal_t& sponsor,
                                         const principal_t& member,
                                         const handle_t& handle) {
  return governance_event_t{
      .type = event_type_t::new_member,
      .attributes = {make_attribute("sponsor", to_hex(sponsor), true),
                     make_attribute("member", to_hex(member), true),
                     make_attribute("handle", to_hex(handle))}};
}

}  // namespace

membership_registry::membership_registry(ledger_state& state,
                                         const engine_options& options)
    : state_{state}, options_{options} {}

operation_result_t membership_registry::sponsor_member(
    const principal_t& caller,
    const principal_t& new_member,
    const handle_t& handle,
    const timestamp_seconds_t now,
    ledger_delta& delta) {
  if (auto error = require_active(caller, now)) {
    return make_error_result(*error, kMembershipCodespace,
                             "sponsor must be a full member past cooldown");
  }
  if (is_zero(new_member)) {
    return make_error_result(governance_error_code::invalid_principal,
                             kMembershipCodespace,
                             "the zero principal cannot be admitted");
  }
  if (is_member(new_member)) {
    return make_error_result(governance_error_code::already_member,
                             kMembershipCodespace, to_hex(new_member));
  }
  if (is_handle_taken(handle)) {
    return make_error_result(governance_error_code::handle_taken,
                             kMembershipCodespace, to_hex(handle));
  }

  state_.members[new_member] = member_state_t{.member = new_member,
                                              .sponsor = caller,
                                              .handle = handle,
                                              .time_joined = now,
                                              .last_action_time = 0};
  state_.taken_handles.insert(handle);
  record_action(caller, now, delta);
  delta.members.insert(new_member);
  delta.handles.insert(handle);

  auto result = operation_result_t{};
  result.info = "member admitted";
  result.codespace = std::string{kMembershipCodespace};
  result.events.push_back(make_new_member_event(caller, new_member, handle));
  return result;
}

operation_result_t membership_registry::veto_member(
    const principal_t& caller,
    const principal_t& target,
    const timestamp_seconds_t now,
    ledger_delta& delta) {
  if (auto error = require_full(caller, now)) {
    return make_error_result(*error, kMembershipCodespace,
                             "veto requires a full member");
  }
  auto found = state_.members.find(target);
  if (found == std::end(state_.members) || !is_admitted(found->second)) {
    return make_error_result(governance_error_code::not_a_member,
                             kMembershipCodespace, to_hex(target));
  }
  if (elapsed_since(now, found->second.time_joined) >= options_.veto_window) {
    return make_error_result(governance_error_code::veto_window_closed,
                             kMembershipCodespace,
                             "member is past the provisional period");
  }

  const auto handle = found->second.handle;
  state_.members.erase(found);
  delta.members.insert(target);
  if (options_.release_handle_on_member_veto) {
    state_.taken_handles.erase(handle);
    delta.handles.insert(handle);
  }

  auto result = operation_result_t{};
  result.info = "member vetoed";
  result.codespace = std::string{kMembershipCodespace};
  result.events.push_back(governance_event_t{
      .type = event_type_t::member_vetoed,
      .attributes = {make_attribute("caller", to_hex(caller), true),
                     make_attribute("member", to_hex(target), true)}});
  return result;
}

operation_result_t membership_registry::admit_genesis_member(
    const genesis_member& genesis,
    ledger_delta& delta) {
  if (is_zero(genesis.member)) {
    return make_error_result(governance_error_code::invalid_principal,
                             kMembershipCodespace,
                             "genesis member cannot be the zero principal");
  }
  if (is_member(genesis.member)) {
    return make_error_result(governance_error_code::already_member,
                             kMembershipCodespace, to_hex(genesis.member));
  }
  if (is_handle_taken(genesis.handle)) {
    return make_error_result(governance_error_code::handle_taken,
                             kMembershipCodespace, to_hex(genesis.handle));
  }

  state_.members[genesis.member] = member_state_t{.member = genesis.member,
                                                  .sponsor = genesis.member,
                                                  .handle = genesis.handle,
                                                  .time_joined = 0,
                                                  .last_action_time = 0};
  state_.taken_handles.insert(genesis.handle);
  delta.members.insert(genesis.member);
  delta.handles.insert(genesis.handle);
  spdlog::info("Admitted genesis member {}", to_hex(genesis.member));

  auto result = operation_result_t{};
  result.info = "genesis member admitted";
  result.codespace = std::string{kMembershipCodespace};
  result.events.push_back(
      make_new_member_event(genesis.member, genesis.member, genesis.handle));
  return result;
}

std::optional<governance_error_code> membership_registry::require_active(
    const principal_t& caller,
    const timestamp_seconds_t now) const {
  return require_active_member(member_or_default(caller), now,
                               options_.veto_window, options_.cooldown);
}

std::optional<governance_error_code> membership_registry::require_full(
    const principal_t& caller,
    const timestamp_seconds_t now) const {
  return require_full_member(member_or_default(caller), now,
                             options_.veto_window);
}

void membership_registry::record_action(const principal_t& caller,
                                        const timestamp_seconds_t now,
                                        ledger_delta& delta) {
  auto found = state_.members.find(caller);
  if (found == std::end(state_.members)) {
    return;
  }
  guild::execution::record_action(found->second, now);
  delta.members.insert(caller);
}

member_state_t membership_registry::member_or_default(
    const principal_t& member) const {
  auto found = state_.members.find(member);
  if (found == std::end(state_.members)) {
    return member_state_t{};
  }
  return found->second;
}

std::optional<member_state_t> membership_registry::find_member(
    const principal_t& member) const {
  auto found = state_.members.find(member);
  if (found == std::end(state_.members) || !is_admitted(found->second)) {
    return std::nullopt;
  }
  return found->second;
}

bool membership_registry::is_member(const principal_t& member) const {
  return is_admitted(member_or_default(member));
}

bool membership_registry::is_handle_taken(const handle_t& handle) const {
  return state_.taken_handles.contains(handle);
}

}  // namespace guild::execution
