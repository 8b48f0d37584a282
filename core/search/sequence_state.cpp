#include "search/sequence_state.hpp"

#include <stdexcept>
#include <string>

namespace statebeam {

SequenceState::SequenceState(std::vector<int> batch_indices,
                             std::vector<ActionHistory> action_history,
                             std::vector<double> score,
                             std::set<ActionId> terminal_actions)
    : SequenceState(ShareTerminals{}, std::move(batch_indices), std::move(action_history),
                    std::move(score), std::make_shared<const std::set<ActionId>>(std::move(terminal_actions))) {}

SequenceState::SequenceState(ShareTerminals,
                             std::vector<int> batch_indices,
                             std::vector<ActionHistory> action_history,
                             std::vector<double> score,
                             std::shared_ptr<const std::set<ActionId>> terminal_actions)
    : State<SequenceState>(std::move(batch_indices), std::move(action_history), std::move(score)),
      terminal_actions_(std::move(terminal_actions)) {}

SequenceState SequenceState::initial(int batch_size, std::set<ActionId> terminal_actions) {
    if (batch_size <= 0) {
        throw std::invalid_argument("batch_size must be positive, got " +
                                    std::to_string(batch_size));
    }
    std::vector<int> batch_indices;
    for (int b = 0; b < batch_size; b++) {
        batch_indices.push_back(b);
    }
    return SequenceState(std::move(batch_indices),
                         std::vector<ActionHistory>(batch_size),
                         std::vector<double>(batch_size, 0.0),
                         std::move(terminal_actions));
}

bool SequenceState::isFinished() const {
    requireSingleton("SequenceState::isFinished");
    const ActionHistory& history = actionHistories()[0];
    return !history.empty() && terminal_actions_->count(history.back()) > 0;
}

SequenceState SequenceState::combineStates(const std::vector<SequenceState>& states) const {
    if (states.empty()) {
        throw std::invalid_argument("Cannot combine an empty list of states");
    }
    for (const auto& s : states) {
        if (s.terminal_actions_ != terminal_actions_ &&
            *s.terminal_actions_ != *terminal_actions_) {
            throw std::invalid_argument("Cannot combine states with different terminal actions");
        }
    }

    std::vector<int> batch_indices;
    std::vector<ActionHistory> action_history;
    std::vector<double> score;
    concatFields(states, batch_indices, action_history, score);
    return SequenceState(ShareTerminals{}, std::move(batch_indices), std::move(action_history),
                         std::move(score), terminal_actions_);
}

SequenceState SequenceState::member(size_t i) const {
    if (i >= groupSize()) {
        throw std::logic_error("Member " + std::to_string(i) +
                               " out of range for group size " + std::to_string(groupSize()));
    }
    return SequenceState(ShareTerminals{}, {batchIndices()[i]}, {actionHistories()[i]}, {scores()[i]},
                         terminal_actions_);
}

SequenceState SequenceState::extend(size_t i, ActionId action, double log_prob) const {
    SequenceState child = member(i);
    ActionHistory history = child.actionHistories()[0];
    history.push_back(action);
    return SequenceState(ShareTerminals{}, {child.batchIndices()[0]}, {std::move(history)},
                         {child.scores()[0] + log_prob}, terminal_actions_);
}

} // namespace statebeam
