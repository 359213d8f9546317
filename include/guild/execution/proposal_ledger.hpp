#pragma once

#include <guild/execution/callbacks.hpp>
#include <guild/execution/engine_options.hpp>
#include <guild/execution/ledger_state.hpp>
#include <guild/execution/membership_registry.hpp>
#include <guild/schema/operation_result.hpp>
#include <guild/schema/proposal_state.hpp>
#include <optional>
#include <string_view>

namespace guild::execution {

inline constexpr auto kProposalCodespace = std::string_view{"guild.proposal"};
inline constexpr auto kTreasuryCodespace = std::string_view{"guild.treasury"};

/// Spending proposals and the pooled treasury balance.
///
/// Proposals are never deleted. Veto and claim both neutralize a proposal by
/// zeroing its value, which is terminal.
class proposal_ledger final {
 public:
  proposal_ledger(ledger_state& state,
                  membership_registry& registry,
                  const engine_options& options);

  /// Record a new proposal. `value` must be strictly below the treasury
  /// balance. On success `result.data` holds the 32-byte proposal id.
  guild::schema::operation_result_t submit_proposal(
      const guild::schema::principal_t& caller,
      const guild::schema::proposal_url_t& url,
      const guild::schema::digest_t& digest,
      const guild::schema::principal_t& wallet,
      const guild::schema::amount_t& value,
      guild::schema::timestamp_seconds_t now,
      ledger_delta& delta);

  guild::schema::operation_result_t veto_proposal(
      const guild::schema::principal_t& caller,
      const guild::schema::proposal_id_t& id,
      guild::schema::timestamp_seconds_t now,
      ledger_delta& delta);

  /// Pay out a proposal whose veto window has closed. Claiming a neutralized
  /// proposal succeeds without paying anything.
  guild::schema::operation_result_t claim_proposal(
      const guild::schema::principal_t& caller,
      const guild::schema::proposal_id_t& id,
      guild::schema::timestamp_seconds_t now,
      const transfer_handler_t& transfer,
      ledger_delta& delta);

  guild::schema::operation_result_t donate(
      const guild::schema::principal_t& donor,
      const guild::schema::amount_t& amount,
      ledger_delta& delta);

  std::optional<guild::schema::proposal_state_t> find_proposal(
      const guild::schema::proposal_id_t& id) const;
  const guild::schema::amount_t& treasury_balance() const;

 private:
  ledger_state& state_;
  membership_registry& registry_;
  const engine_options& options_;
};

}  // namespace guild::execution
