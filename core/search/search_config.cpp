#include "search/search_config.hpp"

#include <stdexcept>
#include <string>

namespace statebeam {

void BeamSearchConfig::validate() const {
    if (beam_size <= 0) {
        throw std::invalid_argument("beam_size must be positive, got " +
                                    std::to_string(beam_size));
    }
    if (per_node_beam_size && *per_node_beam_size <= 0) {
        throw std::invalid_argument("per_node_beam_size must be positive, got " +
                                    std::to_string(*per_node_beam_size));
    }
}

void validateNumSteps(int num_steps) {
    if (num_steps <= 0) {
        throw std::invalid_argument("num_steps must be positive, got " +
                                    std::to_string(num_steps));
    }
}

} // namespace statebeam
