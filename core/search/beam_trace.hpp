#pragma once

#include "search/state.hpp"

#include <cstddef>
#include <map>
#include <utility>
#include <vector>

namespace statebeam {

/// One candidate as seen in the beam: (score, action history).
using BeamEntry = std::pair<double, ActionHistory>;
/// All candidates seen at one step.
using BeamStep = std::vector<BeamEntry>;

/// Diagnostic record of a search trajectory, kept separately for each batch
/// instance. Step k (0-based) holds the candidates whose history has length k+1.
class BeamTrace {
public:
    void clear() { steps_.clear(); }

    /// Append a new step for `batch_index`.
    void appendStep(int batch_index, BeamStep step);

    /// Add a finished hypothesis to the step matching its history length,
    /// growing the trace with empty steps as needed. Empty histories are skipped.
    void addFinished(int batch_index, double score, const ActionHistory& history);

    /// Steps recorded for `batch_index`; empty if none.
    const std::vector<BeamStep>& steps(int batch_index) const;

    std::vector<int> batchIndices() const;
    size_t numSteps(int batch_index) const { return steps(batch_index).size(); }
    bool empty() const { return steps_.empty(); }

private:
    std::map<int, std::vector<BeamStep>> steps_;
};

} // namespace statebeam
