#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace statebeam {

using ActionId = int;
using ActionHistory = std::vector<ActionId>;

/// A group of one or more parallel hypotheses.
///
/// Member i of the group descends from input instance batchIndices()[i], has
/// cumulative score scores()[i] and took the actions actionHistories()[i].
/// The three sequences always have the same length (the group size).
///
/// StateT is the concrete state type deriving from State<StateT>. The beam
/// search combines many states into one group for a single call to the
/// transition function, and expects singleton groups back.
template <typename StateT>
class State {
public:
    State(std::vector<int> batch_indices,
          std::vector<ActionHistory> action_history,
          std::vector<double> score)
        : batch_indices_(std::move(batch_indices)),
          action_history_(std::move(action_history)),
          score_(std::move(score)) {
        if (batch_indices_.size() != action_history_.size() ||
            batch_indices_.size() != score_.size()) {
            throw std::invalid_argument(
                "State fields must have equal length: batch_indices=" +
                std::to_string(batch_indices_.size()) +
                " action_history=" + std::to_string(action_history_.size()) +
                " score=" + std::to_string(score_.size()));
        }
    }

    State(const State&) = default;
    State(State&&) = default;
    State& operator=(const State&) = default;
    State& operator=(State&&) = default;
    virtual ~State() = default;

    /// Whether this hypothesis is complete. Only defined for a group of one.
    virtual bool isFinished() const = 0;

    /// Merge `states` (each of any group size) into one group, preserving order.
    virtual StateT combineStates(const std::vector<StateT>& states) const = 0;

    const std::vector<int>& batchIndices() const { return batch_indices_; }
    const std::vector<ActionHistory>& actionHistories() const { return action_history_; }
    const std::vector<double>& scores() const { return score_; }

    size_t groupSize() const { return batch_indices_.size(); }

protected:
    /// Throws std::logic_error unless this is a singleton group.
    void requireSingleton(const char* operation) const {
        if (groupSize() != 1) {
            throw std::logic_error(std::string(operation) +
                                   " is only defined for a group of one, got group size " +
                                   std::to_string(groupSize()));
        }
    }

    /// Concatenate the fields of `states` in order. Helper for combineStates().
    static void concatFields(const std::vector<StateT>& states,
                             std::vector<int>& batch_indices,
                             std::vector<ActionHistory>& action_history,
                             std::vector<double>& score) {
        for (const auto& s : states) {
            batch_indices.insert(batch_indices.end(),
                                 s.batchIndices().begin(), s.batchIndices().end());
            action_history.insert(action_history.end(),
                                  s.actionHistories().begin(), s.actionHistories().end());
            score.insert(score.end(), s.scores().begin(), s.scores().end());
        }
    }

private:
    std::vector<int> batch_indices_;
    std::vector<ActionHistory> action_history_;
    std::vector<double> score_;
};

} // namespace statebeam
