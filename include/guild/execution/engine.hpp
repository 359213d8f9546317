#pragma once

#include <guild/execution/callbacks.hpp>
#include <guild/execution/clock.hpp>
#include <guild/execution/engine_options.hpp>
#include <guild/execution/ledger_state.hpp>
#include <guild/execution/membership_registry.hpp>
#include <guild/execution/proposal_ledger.hpp>
#include <guild/schema/encoding/scale/encoder.hpp>
#include <guild/schema/engine_info.hpp>
#include <guild/schema/governance_event.hpp>
#include <guild/schema/member_state.hpp>
#include <guild/schema/operation_result.hpp>
#include <guild/schema/primitives.hpp>
#include <guild/schema/proposal_state.hpp>
#include <guild/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace guild::execution {

/// Membership-gated treasury state machine.
///
/// Every operation runs under one mutex against the in-memory tables, reads
/// the injected clock once, and on success writes all touched rows, its events
/// and the new state root to storage in a single batch. Failed operations
/// change nothing.
class engine final {
 public:
  /// Construct the engine over encoder/storage backends.
  ///
  /// Persisted ledger state is loaded from storage. A storage without a
  /// committed checkpoint is initialized with `options.genesis_members`.
  explicit engine(
      guild::schema::encoding::encoder<
          guild::schema::encoding::scale_encoder_tag>& encoder,
      guild::storage::storage<guild::storage::rocksdb_storage_tag>& storage,
      clock_source_t clock,
      engine_options options = {});

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  /// Admit `new_member` under `handle`, sponsored by `caller`.
  guild::schema::operation_result_t sponsor_member(
      const guild::schema::principal_t& caller,
      const guild::schema::principal_t& new_member,
      const guild::schema::handle_t& handle);

  /// Remove a provisional member.
  guild::schema::operation_result_t veto_member(
      const guild::schema::principal_t& caller,
      const guild::schema::principal_t& target);

  /// Submit a spending proposal; the id is returned in `result.data`.
  guild::schema::operation_result_t submit_proposal(
      const guild::schema::principal_t& caller,
      const guild::schema::proposal_url_t& url,
      const guild::schema::digest_t& digest,
      const guild::schema::principal_t& wallet,
      const guild::schema::amount_t& value);

  guild::schema::operation_result_t veto_proposal(
      const guild::schema::principal_t& caller,
      const guild::schema::proposal_id_t& id);

  /// Release a proposal's funds once its veto window closed. Open to anyone.
  guild::schema::operation_result_t claim_proposal(
      const guild::schema::principal_t& caller,
      const guild::schema::proposal_id_t& id);

  /// Add `amount` to the treasury. Open to anyone.
  guild::schema::operation_result_t donate(
      const guild::schema::principal_t& donor,
      const guild::schema::amount_t& amount);

  std::optional<guild::schema::member_state_t> get_member(
      const guild::schema::principal_t& member) const;
  std::optional<guild::schema::proposal_state_t> get_proposal(
      const guild::schema::proposal_id_t& id) const;
  bool is_member(const guild::schema::principal_t& member) const;
  bool is_handle_taken(const guild::schema::handle_t& handle) const;
  guild::schema::amount_t treasury_balance() const;

  /// Committed events with sequence in the inclusive range.
  std::vector<guild::schema::governance_event_t> events(
      uint64_t from_sequence,
      uint64_t to_sequence) const;

  guild::schema::engine_info_t info() const;

  /// Install the notification callback.
  void set_event_sink(event_sink_t sink);

  /// Install the payout callback used by claims. Without one, claims only
  /// debit the treasury.
  void set_transfer_handler(transfer_handler_t handler);

 private:
  /// Run `operation` atomically and commit its delta when it succeeds.
  template <typename Operation>
  guild::schema::operation_result_t execute(std::string_view name,
                                            Operation&& operation);

  /// Persist touched rows and events; advances sequence and state root.
  void commit_delta(const ledger_delta& delta,
                    guild::schema::timestamp_seconds_t now,
                    std::vector<guild::schema::governance_event_t>& events);

  /// Load committed tables from storage at startup.
  void load_persisted_state();

  /// Admit the configured founding members into an empty ledger.
  void apply_genesis();

  mutable std::mutex mutex_;
  guild::schema::encoding::encoder<guild::schema::encoding::scale_encoder_tag>&
      encoder_;
  guild::storage::storage<guild::storage::rocksdb_storage_tag>& storage_;
  clock_source_t clock_;
  engine_options options_;
  ledger_state state_;
  membership_registry registry_;
  proposal_ledger proposals_;
  uint64_t last_sequence_{};
  guild::schema::hash32_t state_root_{};
  event_sink_t event_sink_;
  transfer_handler_t transfer_handler_;
};

}  // namespace guild::execution
