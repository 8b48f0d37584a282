#pragma once

#include "search/state.hpp"

#include <optional>
#include <vector>

namespace statebeam {

/// Per-member action restriction for one call to TransitionFunction::takeStep.
/// Entry i applies to member i of the grouped state; an empty entry leaves that
/// member unrestricted.
using AllowedActions = std::vector<std::vector<ActionId>>;

/// Scores and expands hypotheses. This is the policy the beam search calls;
/// it is treated as opaque by the search.
template <typename StateT>
class TransitionFunction {
public:
    virtual ~TransitionFunction() = default;

    /// Expand every member of `state` into its next states.
    ///
    /// Must return singleton-group states sorted by non-increasing score, with
    /// at most `max_actions` children per member of `state`. The beam search
    /// does not sort this output. When `allowed_actions` is set, a member with
    /// a non-empty entry may only take the listed actions.
    virtual std::vector<StateT> takeStep(
        const StateT& state,
        int max_actions,
        const std::optional<AllowedActions>& allowed_actions) = 0;
};

} // namespace statebeam
