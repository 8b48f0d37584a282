#pragma once

#include "search/state.hpp"
#include "search/transition_function.hpp"
#include "search/prefix_tree.hpp"
#include "search/beam_trace.hpp"
#include "search/search_config.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace statebeam {

/// Batch-aware beam search over transition sequences.
///
/// Starting from a batched initial state, repeatedly groups every live
/// hypothesis into one state, asks the TransitionFunction for ranked children,
/// splits them back out by batch index and keeps the first beam_size per batch.
/// Returns, per batch index, the best finished states found.
///
/// The TransitionFunction must return its children already sorted by
/// non-increasing score: the search only slices that order and sorts once, at
/// the very end, over the finished states.
///
/// Optionally forces the first steps along known action sequences (one per
/// batch index) and records the beam trajectory for inspection.
template <typename StateT>
class BeamSearch {
public:
    using Results = std::map<int, std::vector<StateT>>;

    explicit BeamSearch(int beam_size,
                        std::optional<int> per_node_beam_size = std::nullopt,
                        std::optional<ActionHistory> initial_sequence = std::nullopt,
                        bool keep_beam_details = false)
        : BeamSearch(makeConfig(beam_size, per_node_beam_size, keep_beam_details)) {
        if (initial_sequence) {
            constraints_.emplace(0, buildConstraint(*initial_sequence));
        }
    }

    explicit BeamSearch(const BeamSearchConfig& config)
        : config_(config) {
        config_.validate();
        STATEBEAM_LOG_DEBUG("BeamSearch: beam_size={} per_node_beam_size={} keep_beam_details={}",
                            config_.beam_size, config_.effectivePerNodeBeamSize(),
                            config_.keep_beam_details);
    }

    /// A new search with the same beam sizes, forced along `initial_sequence`
    /// for batch index 0.
    BeamSearch constrainedTo(const ActionHistory& initial_sequence,
                             bool keep_beam_details = true) const {
        return BeamSearch(config_.beam_size, config_.per_node_beam_size,
                          initial_sequence, keep_beam_details);
    }

    /// A new search with the same beam sizes, forced along one sequence per
    /// batch index. Batch indices without an entry search freely.
    BeamSearch constrainedToBatch(const std::map<int, ActionHistory>& initial_sequences,
                                  bool keep_beam_details = true) const {
        BeamSearch constrained(makeConfig(config_.beam_size, config_.per_node_beam_size,
                                          keep_beam_details));
        for (const auto& [batch_index, sequence] : initial_sequences) {
            constrained.constraints_.emplace(batch_index, buildConstraint(sequence));
        }
        return constrained;
    }

    /// Run the search for at most `num_steps` steps.
    ///
    /// If `keep_final_unfinished_states` is set, hypotheses still unfinished
    /// after the last step are returned alongside the finished ones, so every
    /// batch index that survives to the end gets a result.
    Results search(int num_steps,
                   const StateT& initial_state,
                   TransitionFunction<StateT>& transition_function,
                   bool keep_final_unfinished_states = true) {
        validateNumSteps(num_steps);

        const int beam_size = config_.beam_size;
        const int per_node_beam_size = config_.effectivePerNodeBeamSize();

        std::map<int, std::vector<StateT>> finished_states;
        std::vector<StateT> states{initial_state};

        if (config_.keep_beam_details) {
            trace_.clear();
        }

        bool forced = false;
        for (int step = 1; !states.empty() && step <= num_steps; step++) {
            StateT grouped_state = states.front().combineStates(states);
            std::optional<AllowedActions> allowed_actions = allowedActions(grouped_state);
            if (allowed_actions) {
                forced = true;
            } else if (forced) {
                STATEBEAM_LOG_DEBUG("BeamSearch: constrained prefix exhausted at step {}, searching freely",
                                    step);
                forced = false;
            }

            std::vector<StateT> candidates = transition_function.takeStep(
                grouped_state, per_node_beam_size, allowed_actions);

            std::map<int, std::vector<StateT>> next_states;
            for (auto& candidate : candidates) {
                if (candidate.groupSize() != 1) {
                    throw std::logic_error("Transition function returned a group of size " +
                                           std::to_string(candidate.groupSize()) +
                                           "; expected single states");
                }
                bool finished = candidate.isFinished();
                int batch_index = candidate.batchIndices()[0];
                if (finished) {
                    finished_states[batch_index].push_back(std::move(candidate));
                } else {
                    if (step == num_steps && keep_final_unfinished_states) {
                        finished_states[batch_index].push_back(candidate);
                    }
                    next_states[batch_index].push_back(std::move(candidate));
                }
            }

            states.clear();
            for (auto& [batch_index, batch_states] : next_states) {
                if (config_.keep_beam_details) {
                    trace_.appendStep(batch_index, toBeamStep(batch_states));
                }
                size_t keep = std::min(batch_states.size(), static_cast<size_t>(beam_size));
                STATEBEAM_LOG_TRACE("BeamSearch: step {} batch {} keeps {} of {} candidates",
                                    step, batch_index, keep, batch_states.size());
                // Already ranked by the transition function.
                for (size_t i = 0; i < keep; i++) {
                    states.push_back(std::move(batch_states[i]));
                }
            }

            STATEBEAM_LOG_DEBUG("BeamSearch: step {}/{} group={} candidates={} active={}",
                                step, num_steps, grouped_state.groupSize(),
                                candidates.size(), states.size());
        }

        if (config_.keep_beam_details) {
            for (const auto& [batch_index, batch_states] : finished_states) {
                for (const auto& state : batch_states) {
                    trace_.addFinished(batch_index, state.scores()[0], state.actionHistories()[0]);
                }
            }
        }

        Results best_states;
        for (auto& [batch_index, batch_states] : finished_states) {
            std::stable_sort(batch_states.begin(), batch_states.end(),
                [](const StateT& a, const StateT& b) {
                    return a.scores()[0] > b.scores()[0];
                });
            if (batch_states.size() > static_cast<size_t>(beam_size)) {
                batch_states.erase(batch_states.begin() + beam_size, batch_states.end());
            }
            best_states.emplace(batch_index, std::move(batch_states));
        }

        if (best_states.empty()) {
            STATEBEAM_LOG_WARN("BeamSearch: no states found after {} steps", num_steps);
        }
        return best_states;
    }

    int beamSize() const { return config_.beam_size; }
    int perNodeBeamSize() const { return config_.effectivePerNodeBeamSize(); }
    bool keepsBeamDetails() const { return config_.keep_beam_details; }
    bool isConstrained() const { return !constraints_.empty(); }
    const BeamSearchConfig& config() const { return config_; }

    /// Trajectory of the last search, per batch index. Empty unless
    /// keep_beam_details is set.
    const BeamTrace& beamTrace() const { return trace_; }

    /// Trajectory of the last search for batch index 0.
    const std::vector<BeamStep>& beams() const { return trace_.steps(0); }

private:
    BeamSearchConfig config_;
    std::map<int, PrefixTree> constraints_;
    BeamTrace trace_;

    static BeamSearchConfig makeConfig(int beam_size, std::optional<int> per_node_beam_size,
                                       bool keep_beam_details) {
        BeamSearchConfig config;
        config.beam_size = beam_size;
        config.per_node_beam_size = per_node_beam_size;
        config.keep_beam_details = keep_beam_details;
        return config;
    }

    static PrefixTree buildConstraint(const ActionHistory& sequence) {
        return constructPrefixTree({TargetSequences{sequence}}).front();
    }

    /// Restriction for each member of `grouped_state` from its batch's
    /// constraint, or nullopt when no member is constrained.
    std::optional<AllowedActions> allowedActions(const StateT& grouped_state) const {
        if (constraints_.empty()) return std::nullopt;

        AllowedActions allowed(grouped_state.groupSize());
        bool any = false;
        for (size_t i = 0; i < grouped_state.groupSize(); i++) {
            auto it = constraints_.find(grouped_state.batchIndices()[i]);
            if (it == constraints_.end()) continue;

            const std::set<ActionId>* actions = it->second.allowed(grouped_state.actionHistories()[i]);
            if (!actions) {
                STATEBEAM_LOG_TRACE("BeamSearch: batch {} member {} left its constrained prefix",
                                    grouped_state.batchIndices()[i], i);
                continue;
            }
            allowed[i].assign(actions->begin(), actions->end());
            any = true;
        }

        if (!any) return std::nullopt;
        return allowed;
    }

    static BeamStep toBeamStep(const std::vector<StateT>& batch_states) {
        BeamStep step;
        step.reserve(batch_states.size());
        for (const auto& state : batch_states) {
            step.emplace_back(state.scores()[0], state.actionHistories()[0]);
        }
        return step;
    }
};

} // namespace statebeam
