#include "search/scored_transition.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace statebeam {

ScoredTransitionFunction::ScoredTransitionFunction(ActionScorer scorer)
    : scorer_(std::move(scorer)) {
    if (!scorer_) {
        throw std::invalid_argument("ScoredTransitionFunction requires a scorer");
    }
}

std::vector<SequenceState> ScoredTransitionFunction::takeStep(
    const SequenceState& state,
    int max_actions,
    const std::optional<AllowedActions>& allowed_actions
) {
    if (max_actions <= 0) {
        throw std::invalid_argument("max_actions must be positive, got " +
                                    std::to_string(max_actions));
    }
    if (allowed_actions && allowed_actions->size() != state.groupSize()) {
        throw std::invalid_argument("allowed_actions has " + std::to_string(allowed_actions->size()) +
                                    " entries for a group of " + std::to_string(state.groupSize()));
    }

    std::vector<SequenceState> children;
    for (size_t i = 0; i < state.groupSize(); i++) {
        std::vector<ScoredAction> candidates =
            scorer_(state.batchIndices()[i], state.actionHistories()[i]);
        scorer_calls_++;

        if (allowed_actions && !(*allowed_actions)[i].empty()) {
            const std::vector<ActionId>& allowed = (*allowed_actions)[i];
            candidates.erase(
                std::remove_if(candidates.begin(), candidates.end(),
                    [&allowed](const ScoredAction& c) {
                        return std::find(allowed.begin(), allowed.end(), c.first) == allowed.end();
                    }),
                candidates.end());
        }

        std::stable_sort(candidates.begin(), candidates.end(),
            [](const ScoredAction& a, const ScoredAction& b) {
                return a.second > b.second;
            });
        if (candidates.size() > static_cast<size_t>(max_actions)) {
            candidates.resize(max_actions);
        }

        for (const auto& [action, log_prob] : candidates) {
            children.push_back(state.extend(i, action, log_prob));
        }
    }

    // Members were appended in order, so a stable sort keeps member order on ties.
    std::stable_sort(children.begin(), children.end(),
        [](const SequenceState& a, const SequenceState& b) {
            return a.scores()[0] > b.scores()[0];
        });
    return children;
}

} // namespace statebeam
