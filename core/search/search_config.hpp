#pragma once

#include <optional>

namespace statebeam {

/// Beam search configuration parameters.
struct BeamSearchConfig {
    int beam_size = 10;             // States kept per batch instance at each step
    std::optional<int> per_node_beam_size; // Children considered per hypothesis; nullopt = beam_size
    bool keep_beam_details = false; // Record the beam trajectory for inspection

    int effectivePerNodeBeamSize() const {
        return per_node_beam_size ? *per_node_beam_size : beam_size;
    }

    /// Throws std::invalid_argument on a non-positive beam size or a given,
    /// non-positive per-node beam size.
    void validate() const;
};

/// Throws std::invalid_argument unless num_steps > 0.
void validateNumSteps(int num_steps);

} // namespace statebeam
