#pragma once

#include "search/state.hpp"

#include <cstddef>
#include <memory>
#include <set>
#include <vector>

namespace statebeam {

/// State over plain action sequences. A member is finished once its last
/// action is one of the terminal actions, which all members share.
class SequenceState : public State<SequenceState> {
public:
    SequenceState(std::vector<int> batch_indices,
                  std::vector<ActionHistory> action_history,
                  std::vector<double> score,
                  std::set<ActionId> terminal_actions);

    /// A group with one empty-history, zero-score member per batch instance.
    static SequenceState initial(int batch_size, std::set<ActionId> terminal_actions);

    bool isFinished() const override;
    SequenceState combineStates(const std::vector<SequenceState>& states) const override;

    /// Member `i` on its own. Throws std::logic_error if out of range.
    SequenceState member(size_t i) const;

    /// Singleton child of member `i` that takes `action` with `log_prob`.
    SequenceState extend(size_t i, ActionId action, double log_prob) const;

    const std::set<ActionId>& terminalActions() const { return *terminal_actions_; }

private:
    struct ShareTerminals {};

    SequenceState(ShareTerminals,
                  std::vector<int> batch_indices,
                  std::vector<ActionHistory> action_history,
                  std::vector<double> score,
                  std::shared_ptr<const std::set<ActionId>> terminal_actions);

    std::shared_ptr<const std::set<ActionId>> terminal_actions_;
};

} // namespace statebeam
