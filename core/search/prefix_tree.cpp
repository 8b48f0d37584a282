#include "search/prefix_tree.hpp"

#include <stdexcept>
#include <string>

namespace statebeam {

void PrefixTree::add(const ActionHistory& prefix, ActionId action) {
    transitions_[prefix].insert(action);
}

const std::set<ActionId>* PrefixTree::allowed(const ActionHistory& prefix) const {
    auto it = transitions_.find(prefix);
    if (it == transitions_.end()) return nullptr;
    return &it->second;
}

std::vector<PrefixTree> constructPrefixTree(
    const std::vector<TargetSequences>& targets,
    const std::vector<TargetMask>& masks
) {
    if (!masks.empty() && masks.size() != targets.size()) {
        throw std::invalid_argument("Mask batch size " + std::to_string(masks.size()) +
                                    " does not match target batch size " +
                                    std::to_string(targets.size()));
    }

    std::vector<PrefixTree> trees;
    trees.reserve(targets.size());

    for (size_t b = 0; b < targets.size(); b++) {
        const TargetSequences& sequences = targets[b];
        const TargetMask* mask = masks.empty() ? nullptr : &masks[b];
        if (mask && mask->size() != sequences.size()) {
            throw std::invalid_argument("Mask for instance " + std::to_string(b) +
                                        " has " + std::to_string(mask->size()) +
                                        " rows, expected " + std::to_string(sequences.size()));
        }

        PrefixTree tree;
        for (size_t i = 0; i < sequences.size(); i++) {
            const ActionHistory& sequence = sequences[i];
            if (mask && (*mask)[i].size() != sequence.size()) {
                throw std::invalid_argument("Mask row " + std::to_string(i) +
                                            " of instance " + std::to_string(b) +
                                            " does not match its sequence length");
            }

            ActionHistory history;
            for (size_t j = 0; j < sequence.size(); j++) {
                if (mask && (*mask)[i][j] == 0) break;  // padding
                tree.add(history, sequence[j]);
                history.push_back(sequence[j]);
            }
        }
        trees.push_back(std::move(tree));
    }
    return trees;
}

} // namespace statebeam
