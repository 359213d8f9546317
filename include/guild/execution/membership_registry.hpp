#pragma once

#include <guild/execution/engine_options.hpp>
#include <guild/execution/ledger_state.hpp>
#include <guild/schema/governance_error_code.hpp>
#include <guild/schema/member_state.hpp>
#include <guild/schema/operation_result.hpp>
#include <optional>
#include <string_view>

namespace guild::execution {

inline constexpr auto kMembershipCodespace = std::string_view{"guild.membership"};

/// Admission, veto and lookup of members over the shared ledger tables.
///
/// The registry does not lock; the engine serializes every call. All checks of
/// an operation run before its first write, so a failed call leaves the ledger
/// untouched.
class membership_registry final {
 public:
  membership_registry(ledger_state& state, const engine_options& options);

  /// Admit `new_member` with `handle`, sponsored by `caller`.
  ///
  /// Caller must be a full member whose cooldown elapsed. Consumes the
  /// caller's action budget on success.
  guild::schema::operation_result_t sponsor_member(
      const guild::schema::principal_t& caller,
      const guild::schema::principal_t& new_member,
      const guild::schema::handle_t& handle,
      guild::schema::timestamp_seconds_t now,
      ledger_delta& delta);

  /// Erase a member still inside its provisional period.
  ///
  /// Caller must be a full member; no cooldown applies.
  guild::schema::operation_result_t veto_member(
      const guild::schema::principal_t& caller,
      const guild::schema::principal_t& target,
      guild::schema::timestamp_seconds_t now,
      ledger_delta& delta);

  /// Admit a founding member. Only valid while building an empty ledger.
  guild::schema::operation_result_t admit_genesis_member(
      const genesis_member& genesis,
      ledger_delta& delta);

  /// Full/cooldown guard for sponsor-or-propose actions of `caller`.
  std::optional<guild::schema::governance_error_code> require_active(
      const guild::schema::principal_t& caller,
      guild::schema::timestamp_seconds_t now) const;

  /// Full-membership guard for veto actions of `caller`.
  std::optional<guild::schema::governance_error_code> require_full(
      const guild::schema::principal_t& caller,
      guild::schema::timestamp_seconds_t now) const;

  /// Stamp `caller`'s last action time.
  void record_action(const guild::schema::principal_t& caller,
                     guild::schema::timestamp_seconds_t now,
                     ledger_delta& delta);

  /// The stored row, or the zero default row for unknown principals.
  guild::schema::member_state_t member_or_default(
      const guild::schema::principal_t& member) const;

  std::optional<guild::schema::member_state_t> find_member(
      const guild::schema::principal_t& member) const;
  bool is_member(const guild::schema::principal_t& member) const;
  bool is_handle_taken(const guild::schema::handle_t& handle) const;

 private:
  ledger_state& state_;
  const engine_options& options_;
};

}  // namespace guild::execution
