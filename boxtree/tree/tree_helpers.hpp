#pragma once
#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>
#include "parallel.hpp"
#include "tree.hpp"

template <typename IdT>
std::vector<IdT> inverse_permutation(const std::vector<IdT>& perm) {
    std::vector<IdT> out(perm.size());
    parallel_for(perm.size(), [&] (size_t i) {
        out[perm[i]] = static_cast<IdT>(i);
    });
    return out;
}

// Per-source values in user order -> tree source order.
template <typename T, typename TreeT>
std::vector<T> reorder_sources(const TreeT& tree, const std::vector<T>& source_values) {
    if (source_values.size() != tree.nsources) {
        throw std::invalid_argument(
            "expected " + std::to_string(tree.nsources) + " source values, got " +
            std::to_string(source_values.size())
        );
    }
    std::vector<T> out(tree.nsources);
    parallel_for(tree.nsources, [&] (size_t i) {
        out[i] = source_values[tree.user_source_ids[i]];
    });
    return out;
}

// Per-target values in tree target order -> user order.
template <typename T, typename TreeT>
std::vector<T> reorder_potentials(const TreeT& tree, const std::vector<T>& potentials) {
    if (potentials.size() != tree.ntargets) {
        throw std::invalid_argument(
            "expected " + std::to_string(tree.ntargets) + " potentials, got " +
            std::to_string(potentials.size())
        );
    }
    std::vector<T> out(tree.ntargets);
    parallel_for(tree.ntargets, [&] (size_t i) {
        out[i] = potentials[tree.sorted_target_ids[i]];
    });
    return out;
}

template <typename TreeT>
std::vector<typename TreeT::particle_id_t> indices_to_tree_source_order(
    const TreeT& tree, const std::vector<typename TreeT::particle_id_t>& user_indices)
{
    auto sorted_source_ids = inverse_permutation(tree.user_source_ids);
    std::vector<typename TreeT::particle_id_t> out(user_indices.size());
    parallel_for(user_indices.size(), [&] (size_t i) {
        out[i] = sorted_source_ids[user_indices[i]];
    });
    return out;
}

template <typename TreeT>
std::vector<typename TreeT::particle_id_t> indices_to_tree_target_order(
    const TreeT& tree, const std::vector<typename TreeT::particle_id_t>& user_indices)
{
    std::vector<typename TreeT::particle_id_t> out(user_indices.size());
    parallel_for(user_indices.size(), [&] (size_t i) {
        out[i] = tree.sorted_target_ids[user_indices[i]];
    });
    return out;
}

// Descends from the root to the box whose non-child range holds tree_idx.
// Non-child particles sit at the front of their box's range.
template <typename TreeT>
typename TreeT::box_id_t find_owning_box(const TreeT& tree, size_t tree_idx,
    const std::vector<typename TreeT::particle_id_t>& starts,
    const std::vector<typename TreeT::particle_id_t>& counts_nonchild,
    const std::vector<typename TreeT::particle_id_t>& counts_cumul)
{
    using IdT = typename TreeT::box_id_t;
    IdT ibox = 0;
    while (true) {
        size_t start = static_cast<size_t>(starts[ibox]);
        if (tree_idx < start + static_cast<size_t>(counts_nonchild[ibox])) {
            return ibox;
        }

        IdT next_box = 0;
        for (auto child_id: tree.box_child_ids[ibox]) {
            if (child_id == 0) {
                continue;
            }
            size_t child_start = static_cast<size_t>(starts[child_id]);
            size_t child_end = child_start + static_cast<size_t>(counts_cumul[child_id]);
            if (child_start <= tree_idx && tree_idx < child_end) {
                next_box = child_id;
                break;
            }
        }
        if (next_box == 0) {
            throw std::logic_error(
                "particle " + std::to_string(tree_idx) + " is in no child of box " +
                std::to_string(ibox)
            );
        }
        ibox = next_box;
    }
}

template <typename TreeT>
typename TreeT::box_id_t find_box_for_source(const TreeT& tree, size_t tree_source_idx) {
    if (tree_source_idx >= tree.nsources) {
        throw std::out_of_range("source index " + std::to_string(tree_source_idx));
    }
    return find_owning_box(tree, tree_source_idx, tree.box_source_starts,
        tree.box_source_counts_nonchild, tree.box_source_counts_cumul);
}

template <typename TreeT>
typename TreeT::box_id_t find_box_for_target(const TreeT& tree, size_t tree_target_idx) {
    if (tree_target_idx >= tree.ntargets) {
        throw std::out_of_range("target index " + std::to_string(tree_target_idx));
    }
    return find_owning_box(tree, tree_target_idx, tree.box_target_starts,
        tree.box_target_counts_nonchild, tree.box_target_counts_cumul);
}

// Box owning the source with user index user_source_idx.
template <typename TreeT>
typename TreeT::box_id_t find_box_for_user_source(const TreeT& tree, size_t user_source_idx) {
    if (user_source_idx >= tree.nsources) {
        throw std::out_of_range("source index " + std::to_string(user_source_idx));
    }
    auto it = std::find(tree.user_source_ids.begin(), tree.user_source_ids.end(),
        static_cast<typename TreeT::box_id_t>(user_source_idx));
    return find_box_for_source(tree,
        static_cast<size_t>(it - tree.user_source_ids.begin()));
}

template <typename TreeT>
typename TreeT::box_id_t find_box_for_user_target(const TreeT& tree, size_t user_target_idx) {
    if (user_target_idx >= tree.ntargets) {
        throw std::out_of_range("target index " + std::to_string(user_target_idx));
    }
    return find_box_for_target(tree,
        static_cast<size_t>(tree.sorted_target_ids[user_target_idx]));
}
