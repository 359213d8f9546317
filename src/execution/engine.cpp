#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>
#include <guild/blake3/hash.hpp>
#include <guild/common/critical.hpp>
#include <guild/execution/engine.hpp>
#include <guild/schema/key/engine_keys.hpp>
#include <iterator>
#include <tuple>
#include <utility>

using namespace guild::schema;

namespace {

using encoder_t =
    guild::schema::encoding::encoder<guild::schema::encoding::scale_encoder_tag>;

guild::schema::hash32_t fold_state_root(const guild::schema::hash32_t& seed,
                                        const guild::schema::bytes_t& event,
                                        uint64_t sequence) {
  auto material = guild::schema::bytes_t{};
  material.reserve(seed.size() + event.size() + 8);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(event), std::end(event));

  auto encoder = encoder_t{};
  encoder.encode(sequence, material);
  return guild::blake3::hash(guild::schema::make_bytes_view(material));
}

bool is_empty(const guild::execution::ledger_delta& delta) {
  return delta.members.empty() && delta.handles.empty() &&
         delta.proposals.empty() && !delta.treasury;
}

}  // namespace

namespace guild::execution {

template <typename Operation>
operation_result_t engine::execute(const std::string_view name,
                                   Operation&& operation) {
  auto result = operation_result_t{};
  auto sink = event_sink_t{};
  {
    auto lock = std::scoped_lock{mutex_};
    const auto now = clock_();
    auto delta = ledger_delta{};
    result = std::forward<Operation>(operation)(now, delta);
    if (!result.ok()) {
      spdlog::debug("{} rejected at {}: {} ({})", name, now, result.log,
                    result.info);
      return result;
    }
    if (!is_empty(delta) || !result.events.empty()) {
      commit_delta(delta, now, result.events);
    }
    sink = event_sink_;
  }

  spdlog::debug("{} committed with {} event(s)", name, result.events.size());
  if (sink) {
    for (const auto& event : result.events) {
      try {
        sink(event);
      } catch (const std::exception& e) {
        spdlog::error("Event sink failed on event {} ({}): {}", event.sequence,
                      to_string(event.type), e.what());
      }
    }
  }
  return result;
}

engine::engine(
    guild::schema::encoding::encoder<
        guild::schema::encoding::scale_encoder_tag>& encoder,
    guild::storage::storage<guild::storage::rocksdb_storage_tag>& storage,
    clock_source_t clock,
    engine_options options)
    : encoder_{encoder},
      storage_{storage},
      clock_{std::move(clock)},
      options_{std::move(options)},
      registry_{state_, options_},
      proposals_{state_, registry_, options_} {
  auto lock = std::scoped_lock{mutex_};
  if (!clock_) {
    guild::common::critical("governance engine requires a clock source");
  }
  spdlog::info("Initializing governance engine (veto window {}s, cooldown {}s)",
               options_.veto_window, options_.cooldown);
  if (options_.release_handle_on_member_veto) {
    spdlog::info("Handles of vetoed members will be released");
  }
  if (options_.strict_proposal_veto) {
    spdlog::info("Vetoing unknown proposals is rejected");
  }

  load_persisted_state();
  spdlog::info(
      "Governance engine ready at sequence {} with {} member(s) and {} "
      "proposal(s)",
      last_sequence_, state_.members.size(), state_.proposals.size());
}

operation_result_t engine::sponsor_member(const principal_t& caller,
                                          const principal_t& new_member,
                                          const handle_t& handle) {
  return execute("sponsor_member", [&](const timestamp_seconds_t now,
                                       ledger_delta& delta) {
    return registry_.sponsor_member(caller, new_member, handle, now, delta);
  });
}

operation_result_t engine::veto_member(const principal_t& caller,
                                       const principal_t& target) {
  return execute("veto_member", [&](const timestamp_seconds_t now,
                                    ledger_delta& delta) {
    return registry_.veto_member(caller, target, now, delta);
  });
}

operation_result_t engine::submit_proposal(const principal_t& caller,
                                           const proposal_url_t& url,
                                           const digest_t& digest,
                                           const principal_t& wallet,
                                           const amount_t& value) {
  return execute("submit_proposal", [&](const timestamp_seconds_t now,
                                        ledger_delta& delta) {
    return proposals_.submit_proposal(caller, url, digest, wallet, value, now,
                                      delta);
  });
}

operation_result_t engine::veto_proposal(const principal_t& caller,
                                         const proposal_id_t& id) {
  return execute("veto_proposal", [&](const timestamp_seconds_t now,
                                      ledger_delta& delta) {
    return proposals_.veto_proposal(caller, id, now, delta);
  });
}

operation_result_t engine::claim_proposal(const principal_t& caller,
                                          const proposal_id_t& id) {
  return execute("claim_proposal", [&](const timestamp_seconds_t now,
                                       ledger_delta& delta) {
    return proposals_.claim_proposal(caller, id, now, transfer_handler_, delta);
  });
}

operation_result_t engine::donate(const principal_t& donor,
                                  const amount_t& amount) {
  return execute("donate",
                 [&](const timestamp_seconds_t, ledger_delta& delta) {
                   return proposals_.donate(donor, amount, delta);
                 });
}

std::optional<member_state_t> engine::get_member(
    const principal_t& member) const {
  auto lock = std::scoped_lock{mutex_};
  return registry_.find_member(member);
}

std::optional<proposal_state_t> engine::get_proposal(
    const proposal_id_t& id) const {
  auto lock = std::scoped_lock{mutex_};
  return proposals_.find_proposal(id);
}

bool engine::is_member(const principal_t& member) const {
  auto lock = std::scoped_lock{mutex_};
  return registry_.is_member(member);
}

bool engine::is_handle_taken(const handle_t& handle) const {
  auto lock = std::scoped_lock{mutex_};
  return registry_.is_handle_taken(handle);
}

amount_t engine::treasury_balance() const {
  auto lock = std::scoped_lock{mutex_};
  return proposals_.treasury_balance();
}

std::vector<governance_event_t> engine::events(
    const uint64_t from_sequence,
    const uint64_t to_sequence) const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<governance_event_t>{};
  const auto first = std::max<uint64_t>(from_sequence, 1);
  const auto last = std::min(to_sequence, last_sequence_);
  if (first > last) {
    return out;
  }
  out.reserve(static_cast<std::size_t>(last - first + 1));
  for (auto sequence = first; sequence <= last; ++sequence) {
    auto event_key = key::make_event_key(encoder_, sequence);
    auto event = storage_.get<governance_event_t>(
        encoder_, make_bytes_view(event_key));
    if (!event) {
      spdlog::warn("Event {} is missing from storage", sequence);
      continue;
    }
    out.push_back(std::move(*event));
  }
  return out;
}

engine_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = engine_info_t{};
  result.last_sequence = last_sequence_;
  result.state_root = state_root_;
  result.treasury_balance = state_.treasury;
  result.member_count = state_.members.size();
  result.proposal_count = state_.proposals.size();
  return result;
}

void engine::set_event_sink(event_sink_t sink) {
  auto lock = std::scoped_lock{mutex_};
  event_sink_ = std::move(sink);
}

void engine::set_transfer_handler(transfer_handler_t handler) {
  auto lock = std::scoped_lock{mutex_};
  transfer_handler_ = std::move(handler);
}

void engine::commit_delta(const ledger_delta& delta,
                          const timestamp_seconds_t now,
                          std::vector<governance_event_t>& events) {
  auto batch = guild::storage::write_batch{};

  for (const auto& member : delta.members) {
    auto row_key = key::make_member_key(encoder_, member);
    auto found = state_.members.find(member);
    if (found == std::end(state_.members)) {
      batch.deletes.push_back(std::move(row_key));
    } else {
      batch.puts.emplace_back(std::move(row_key),
                              encoder_.encode(found->second));
    }
  }
  for (const auto& handle : delta.handles) {
    auto row_key = key::make_handle_key(encoder_, handle);
    if (state_.taken_handles.contains(handle)) {
      batch.puts.emplace_back(std::move(row_key), encoder_.encode(handle));
    } else {
      batch.deletes.push_back(std::move(row_key));
    }
  }
  for (const auto& id : delta.proposals) {
    auto found = state_.proposals.find(id);
    if (found != std::end(state_.proposals)) {
      batch.puts.emplace_back(key::make_proposal_key(encoder_, id),
                              encoder_.encode(found->second));
    }
  }
  if (delta.treasury) {
    batch.puts.emplace_back(key::make_treasury_key(encoder_),
                            encoder_.encode(state_.treasury));
  }

  for (auto& event : events) {
    event.sequence = ++last_sequence_;
    event.time = now;
    auto encoded = encoder_.encode(event);
    state_root_ = fold_state_root(state_root_, encoded, event.sequence);
    batch.puts.emplace_back(key::make_event_key(encoder_, event.sequence),
                            std::move(encoded));
  }

  batch.committed = guild::storage::committed_state{
      .sequence = last_sequence_, .state_root = state_root_};
  storage_.commit(batch);
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted ledger state");
  auto committed = storage_.load_committed_state();
  if (!committed) {
    apply_genesis();
    return;
  }
  last_sequence_ = committed->sequence;
  state_root_ = committed->state_root;

  auto member_prefix = key::make_prefix_key(encoder_, key::kMemberKeyPrefix);
  for (const auto& [row_key, value] :
       storage_.list_by_prefix(make_bytes_view(member_prefix))) {
    auto member = encoder_.try_decode<member_state_t>(make_bytes_view(value));
    if (!member.has_value()) {
      guild::common::critical("failed to decode member row {}",
                              to_hex(make_bytes_view(row_key)));
    }
    state_.members[member->member] = *member;
  }

  auto handle_prefix = key::make_prefix_key(encoder_, key::kHandleKeyPrefix);
  for (const auto& [row_key, value] :
       storage_.list_by_prefix(make_bytes_view(handle_prefix))) {
    auto handle = encoder_.try_decode<handle_t>(make_bytes_view(value));
    if (!handle.has_value()) {
      guild::common::critical("failed to decode handle row {}",
                              to_hex(make_bytes_view(row_key)));
    }
    state_.taken_handles.insert(*handle);
  }

  auto proposal_prefix =
      key::make_prefix_key(encoder_, key::kProposalKeyPrefix);
  for (const auto& [row_key, value] :
       storage_.list_by_prefix(make_bytes_view(proposal_prefix))) {
    auto proposal =
        encoder_.try_decode<proposal_state_t>(make_bytes_view(value));
    if (!proposal.has_value()) {
      guild::common::critical("failed to decode proposal row {}",
                              to_hex(make_bytes_view(row_key)));
    }
    state_.proposals[proposal->id] = *proposal;
  }

  auto treasury_key = key::make_treasury_key(encoder_);
  state_.treasury = storage_.get<amount_t>(encoder_, make_bytes_view(treasury_key))
                        .value_or(amount_t{0});
}

void engine::apply_genesis() {
  if (options_.genesis_members.empty()) {
    spdlog::warn(
        "Creating ledger without genesis members; nobody will be able to "
        "sponsor or propose");
  }
  auto delta = ledger_delta{};
  auto events = std::vector<governance_event_t>{};
  for (const auto& genesis : options_.genesis_members) {
    auto result = registry_.admit_genesis_member(genesis, delta);
    if (!result.ok()) {
      guild::common::critical("Rejected genesis member {}: {} ({})",
                              to_hex(genesis.member), result.log,
                              result.info);
    }
    std::move(std::begin(result.events), std::end(result.events),
              std::back_inserter(events));
  }
  commit_delta(delta, clock_(), events);
}

}  // namespace guild::execution
