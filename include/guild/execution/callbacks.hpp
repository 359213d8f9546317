#pragma once

#include <guild/schema/governance_event.hpp>
#include <guild/schema/proposal_state.hpp>
#include <functional>

namespace guild::execution {

/// Receives every event after its operation committed and the engine lock was
/// released. May be called from several threads at once. A `std::exception`
/// thrown by the sink is logged and delivery continues with the next event.
using event_sink_t =
    std::function<void(const guild::schema::governance_event_t& event)>;

/// Moves `proposal.value` out of the pooled funds to `proposal.wallet`.
/// Returning false aborts the claim without any state change. Runs while the
/// engine is locked and must not call back into the engine.
using transfer_handler_t =
    std::function<bool(const guild::schema::proposal_state_t& proposal)>;

}  // namespace guild::execution
