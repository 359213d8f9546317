#include <spdlog/spdlog.h>
#include <guild/execution/access_guard.hpp>
#include <guild/execution/proposal_id.hpp>
#include <guild/execution/proposal_ledger.hpp>
#include <guild/schema/governance_event.hpp>
#include <iterator>
#include <limits>
#include <string>
#include <utility>

using namespace guild::schema;

namespace guild::execution {

namespace {

std::string to_decimal(const amount_t& amount) {
  return amount.str();
}

operation_result_t make_success(const std::string_view codespace,
                                std::string info) {
  auto result = operation_result_t{};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

}  // namespace

proposal_ledger::proposal_ledger(ledger_state& state,
                                 membership_registry& registry,
                                 const engine_options& options)
    : state_{state}, registry_{registry}, options_{options} {}

operation_result_t proposal_ledger::submit_proposal(
    const principal_t& caller,
    const proposal_url_t& url,
    const digest_t& digest,
    const principal_t& wallet,
    const amount_t& value,
    const timestamp_seconds_t now,
    ledger_delta& delta) {
  if (auto error = registry_.require_active(caller, now)) {
    return make_error_result(*error, kProposalCodespace,
                             "proposer must be a full member past cooldown");
  }
  if (value >= state_.treasury) {
    return make_error_result(
        governance_error_code::insufficient_funds, kProposalCodespace,
        "value " + to_decimal(value) + " is not below treasury balance " +
            to_decimal(state_.treasury));
  }

  const auto id = derive_proposal_id(caller, url, digest, wallet, value, now);
  auto existing = state_.proposals.find(id);
  if (existing != std::end(state_.proposals) &&
      is_submitted(existing->second)) {
    return make_error_result(governance_error_code::duplicate_proposal,
                             kProposalCodespace, to_hex(id));
  }

  state_.proposals[id] = proposal_state_t{.id = id,
                                          .sponsor = caller,
                                          .url = url,
                                          .digest = digest,
                                          .wallet = wallet,
                                          .value = value,
                                          .time_submitted = now};
  registry_.record_action(caller, now, delta);
  delta.proposals.insert(id);

  auto result = make_success(kProposalCodespace, "proposal submitted");
  result.data = bytes_t{std::begin(id), std::end(id)};
  result.events.push_back(governance_event_t{
      .type = event_type_t::new_proposal,
      .attributes = {make_attribute("sponsor", to_hex(caller), true),
                     make_attribute("proposal_id", to_hex(id), true),
                     make_attribute("wallet", to_hex(wallet)),
                     make_attribute("value", to_decimal(value))}});
  return result;
}

operation_result_t proposal_ledger::veto_proposal(
    const principal_t& caller,
    const proposal_id_t& id,
    const timestamp_seconds_t now,
    ledger_delta& delta) {
  if (auto error = registry_.require_full(caller, now)) {
    return make_error_result(*error, kProposalCodespace,
                             "veto requires a full member");
  }

  auto make_vetoed = [&](std::string info) {
    auto result = make_success(kProposalCodespace, std::move(info));
    result.events.push_back(governance_event_t{
        .type = event_type_t::proposal_vetoed,
        .attributes = {make_attribute("caller", to_hex(caller), true),
                       make_attribute("proposal_id", to_hex(id), true)}});
    return result;
  };

  auto found = state_.proposals.find(id);
  if (found == std::end(state_.proposals)) {
    if (options_.strict_proposal_veto) {
      return make_error_result(governance_error_code::proposal_not_found,
                               kProposalCodespace, to_hex(id));
    }
    // Nothing stored: the zero default row is already neutralized, so the
    // veto succeeds without consulting the window. Its zero submission time
    // would otherwise close the window for every caller that is a full member.
    spdlog::debug("Veto of unknown proposal {} accepted as no-op", to_hex(id));
    return make_vetoed("unknown proposal, nothing to neutralize");
  }
  if (elapsed_since(now, found->second.time_submitted) >=
      options_.veto_window) {
    return make_error_result(governance_error_code::veto_window_closed,
                             kProposalCodespace,
                             "proposal is past its veto window");
  }

  found->second.value = 0;
  delta.proposals.insert(id);
  return make_vetoed("proposal vetoed");
}

operation_result_t proposal_ledger::claim_proposal(
    const principal_t& caller,
    const proposal_id_t& id,
    const timestamp_seconds_t now,
    const transfer_handler_t& transfer,
    ledger_delta& delta) {
  auto found = state_.proposals.find(id);
  const auto proposal = found == std::end(state_.proposals)
                            ? proposal_state_t{.id = id}
                            : found->second;
  if (elapsed_since(now, proposal.time_submitted) < options_.veto_window) {
    return make_error_result(governance_error_code::not_yet_claimable,
                             kProposalCodespace,
                             "proposal is still inside its veto window");
  }
  if (is_neutralized(proposal)) {
    return make_success(kProposalCodespace, "nothing to claim");
  }
  if (proposal.value > state_.treasury) {
    return make_error_result(
        governance_error_code::insufficient_funds, kTreasuryCodespace,
        "treasury balance " + to_decimal(state_.treasury) +
            " cannot cover " + to_decimal(proposal.value));
  }
  if (transfer && !transfer(proposal)) {
    spdlog::warn("Transfer of proposal {} to {} was refused", to_hex(id),
                 to_hex(proposal.wallet));
    return make_error_result(governance_error_code::transfer_failed,
                             kTreasuryCodespace, to_hex(proposal.wallet));
  }

  state_.treasury -= proposal.value;
  found->second.value = 0;
  delta.treasury = true;
  delta.proposals.insert(id);

  auto result = make_success(kProposalCodespace, "proposal claimed");
  result.events.push_back(governance_event_t{
      .type = event_type_t::proposal_claimed,
      .attributes = {make_attribute("proposal_id", to_hex(id), true),
                     make_attribute("value", to_decimal(proposal.value)),
                     make_attribute("wallet", to_hex(proposal.wallet), true),
                     make_attribute("claimer", to_hex(caller))}});
  return result;
}

operation_result_t proposal_ledger::donate(const principal_t& donor,
                                           const amount_t& amount,
                                           ledger_delta& delta) {
  if (amount > std::numeric_limits<amount_t>::max() - state_.treasury) {
    return make_error_result(governance_error_code::treasury_overflow,
                             kTreasuryCodespace, to_decimal(amount));
  }
  state_.treasury += amount;
  delta.treasury = true;

  auto result = make_success(kTreasuryCodespace, "donation received");
  result.events.push_back(governance_event_t{
      .type = event_type_t::new_donation,
      .attributes = {make_attribute("donor", to_hex(donor), true),
                     make_attribute("amount", to_decimal(amount))}});
  return result;
}

std::optional<proposal_state_t> proposal_ledger::find_proposal(
    const proposal_id_t& id) const {
  auto found = state_.proposals.find(id);
  if (found == std::end(state_.proposals) || !is_submitted(found->second)) {
    return std::nullopt;
  }
  return found->second;
}

const amount_t& proposal_ledger::treasury_balance() const {
  return state_.treasury;
}

}  // namespace guild::execution
