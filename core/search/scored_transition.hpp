#pragma once

#include "search/sequence_state.hpp"
#include "search/transition_function.hpp"

#include <functional>
#include <utility>
#include <vector>

namespace statebeam {

/// (action, log probability) proposed for one hypothesis.
using ScoredAction = std::pair<ActionId, double>;

/// Callback scoring the next actions of one hypothesis:
/// (batch_index, action_history) -> candidate actions with log probabilities.
using ActionScorer = std::function<std::vector<ScoredAction>(int, const ActionHistory&)>;

/// TransitionFunction over SequenceState driven by a per-hypothesis scorer.
///
/// For each group member, the scorer's candidates are filtered by the
/// member's allowed actions, the max_actions most probable are kept, and a
/// child is built with the cumulative score. Children of all members are then
/// merged by non-increasing score. Ties keep member order, then scorer order.
class ScoredTransitionFunction : public TransitionFunction<SequenceState> {
public:
    explicit ScoredTransitionFunction(ActionScorer scorer);

    std::vector<SequenceState> takeStep(
        const SequenceState& state,
        int max_actions,
        const std::optional<AllowedActions>& allowed_actions) override;

    /// Number of scorer calls made so far.
    int scorerCalls() const { return scorer_calls_; }

private:
    ActionScorer scorer_;
    int scorer_calls_ = 0;
};

} // namespace statebeam
