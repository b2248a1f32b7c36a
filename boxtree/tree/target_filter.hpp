#pragma once
#include <cstdint>
#include <vector>
#include "tree.hpp"

// The targets selected by a mask, kept in tree order so that every box's
// selected non-child targets form a contiguous range.
template <size_t dim, typename IdT>
struct FilteredTargetListsInTreeOrder {
    size_t nfiltered_targets;
    std::vector<IdT> box_target_starts;
    std::vector<IdT> box_target_counts_nonchild;
    // Filtered tree-order index -> unfiltered tree-order index.
    std::vector<IdT> unfiltered_from_filtered_target_indices;
    Coords<dim> targets;
};

// Per-box lists of the user ids of each box's selected non-child targets.
// The list of box ibox is
// target_lists[target_starts[ibox]] ... target_lists[target_starts[ibox+1]-1].
template <typename IdT>
struct FilteredTargetListsInUserOrder {
    std::vector<IdT> target_starts;
    std::vector<IdT> target_lists;
};

// flags is indexed by user target id.
template <size_t dim, typename IdT>
FilteredTargetListsInTreeOrder<dim,IdT> filter_target_lists_in_tree_order(
    const Tree<dim,IdT>& tree, const std::vector<uint8_t>& flags);

template <size_t dim, typename IdT>
FilteredTargetListsInUserOrder<IdT> filter_target_lists_in_user_order(
    const Tree<dim,IdT>& tree, const std::vector<uint8_t>& flags);
