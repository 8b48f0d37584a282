#include "search/beam_trace.hpp"

namespace statebeam {

void BeamTrace::appendStep(int batch_index, BeamStep step) {
    steps_[batch_index].push_back(std::move(step));
}

void BeamTrace::addFinished(int batch_index, double score, const ActionHistory& history) {
    if (history.empty()) return;
    std::vector<BeamStep>& steps = steps_[batch_index];
    while (steps.size() < history.size()) {
        steps.emplace_back();
    }
    steps[history.size() - 1].emplace_back(score, history);
}

const std::vector<BeamStep>& BeamTrace::steps(int batch_index) const {
    static const std::vector<BeamStep> kNoSteps;
    auto it = steps_.find(batch_index);
    return it != steps_.end() ? it->second : kNoSteps;
}

std::vector<int> BeamTrace::batchIndices() const {
    std::vector<int> result;
    for (const auto& [batch_index, _] : steps_) {
        result.push_back(batch_index);
    }
    return result;
}

} // namespace statebeam
