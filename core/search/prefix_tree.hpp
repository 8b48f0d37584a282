#pragma once

#include "search/state.hpp"

#include <cstddef>
#include <map>
#include <set>
#include <vector>

namespace statebeam {

/// Allowed-transitions map: action prefix -> actions permitted next.
/// Used to force decoding along one or more known action sequences.
class PrefixTree {
public:
    /// Permit `action` after `prefix`.
    void add(const ActionHistory& prefix, ActionId action);

    /// Actions permitted after `prefix`, or nullptr if the prefix is unknown.
    const std::set<ActionId>* allowed(const ActionHistory& prefix) const;

    bool contains(const ActionHistory& prefix) const {
        return transitions_.count(prefix) > 0;
    }

    /// Number of distinct prefixes.
    size_t size() const { return transitions_.size(); }
    bool empty() const { return transitions_.empty(); }

private:
    std::map<ActionHistory, std::set<ActionId>> transitions_;
};

/// Target sequences of one batch instance (alternatives of one another).
using TargetSequences = std::vector<ActionHistory>;
/// Mask values for TargetSequences, same shape; 0 ends a sequence.
using TargetMask = std::vector<std::vector<int>>;

/// Build one PrefixTree per batch instance from its target sequences.
/// `masks` is either empty or one mask per instance, shaped like its targets.
/// Throws std::invalid_argument on a mask shape mismatch.
std::vector<PrefixTree> constructPrefixTree(
    const std::vector<TargetSequences>& targets,
    const std::vector<TargetMask>& masks = {});

} // namespace statebeam
