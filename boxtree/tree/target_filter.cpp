#include <algorithm>
#include <string>
#include "target_filter.hpp"
#include "tree_helpers.hpp"

inline void check_target_mask(size_t ntargets, const std::vector<uint8_t>& flags) {
    if (flags.size() != ntargets) {
        throw ConfigurationError(
            "target mask: expected " + std::to_string(ntargets) +
            " entries, got " + std::to_string(flags.size())
        );
    }
}

template <size_t dim, typename IdT>
FilteredTargetListsInTreeOrder<dim,IdT> filter_target_lists_in_tree_order(
    const Tree<dim,IdT>& tree, const std::vector<uint8_t>& flags)
{
    size_t ntargets = tree.ntargets;
    check_target_mask(ntargets, flags);

    auto user_target_ids = inverse_permutation(tree.sorted_target_ids);

    FilteredTargetListsInTreeOrder<dim,IdT> out;
    out.nfiltered_targets = 0;

    // One extra entry so that a range ending at the last target can be
    // looked up like any other.
    std::vector<IdT> filtered_from_unfiltered(ntargets + 1, 0);
    out.unfiltered_from_filtered_target_indices.resize(ntargets);

    inclusive_scan(ntargets, IdT(0),
        [&] (size_t i) { return flags[user_target_ids[i]] ? IdT(1) : IdT(0); },
        [] (IdT a, IdT b, bool) { return a + b; },
        non_segmented(),
        [&] (size_t i, IdT prev_item, IdT item) {
            filtered_from_unfiltered[i] = prev_item;
            if (item != prev_item) {
                out.unfiltered_from_filtered_target_indices[prev_item] = static_cast<IdT>(i);
            }
            if (i + 1 == ntargets) {
                out.nfiltered_targets = static_cast<size_t>(item);
                filtered_from_unfiltered[ntargets] = item;
            }
        }
    );

    size_t nfiltered = out.nfiltered_targets;
    out.unfiltered_from_filtered_target_indices.resize(nfiltered);

    out.box_target_starts.resize(tree.nboxes);
    out.box_target_counts_nonchild.resize(tree.nboxes);
    parallel_for(tree.nboxes, [&] (size_t ibox) {
        IdT unfiltered_start = tree.box_target_starts[ibox];
        IdT unfiltered_count = tree.box_target_counts_nonchild[ibox];

        IdT filtered_start = filtered_from_unfiltered[unfiltered_start];
        out.box_target_starts[ibox] = filtered_start;
        if (unfiltered_count > 0) {
            IdT filtered_post_last =
                filtered_from_unfiltered[unfiltered_start + unfiltered_count];
            out.box_target_counts_nonchild[ibox] = filtered_post_last - filtered_start;
        } else {
            out.box_target_counts_nonchild[ibox] = 0;
        }
    });

    for (size_t d = 0; d < dim; d++) {
        out.targets[d].resize(nfiltered);
        parallel_for(nfiltered, [&] (size_t i) {
            out.targets[d][i] = tree.targets[d][out.unfiltered_from_filtered_target_indices[i]];
        });
    }

    return out;
}

template <size_t dim, typename IdT>
FilteredTargetListsInUserOrder<IdT> filter_target_lists_in_user_order(
    const Tree<dim,IdT>& tree, const std::vector<uint8_t>& flags)
{
    check_target_mask(tree.ntargets, flags);

    auto user_target_ids = inverse_permutation(tree.sorted_target_ids);

    std::vector<IdT> box_counts(tree.nboxes);
    parallel_for(tree.nboxes, [&] (size_t ibox) {
        IdT start = tree.box_target_starts[ibox];
        IdT count = 0;
        for (IdT i = start; i < start + tree.box_target_counts_nonchild[ibox]; i++) {
            if (flags[user_target_ids[i]]) {
                count++;
            }
        }
        box_counts[ibox] = count;
    });

    FilteredTargetListsInUserOrder<IdT> out;
    out.target_starts.assign(tree.nboxes + 1, 0);
    inclusive_scan(tree.nboxes, IdT(0),
        [&] (size_t i) { return box_counts[i]; },
        [] (IdT a, IdT b, bool) { return a + b; },
        non_segmented(),
        [&] (size_t i, IdT prev_item, IdT item) {
            out.target_starts[i] = prev_item;
            if (i + 1 == tree.nboxes) {
                out.target_starts[tree.nboxes] = item;
            }
        }
    );

    out.target_lists.resize(static_cast<size_t>(out.target_starts[tree.nboxes]));
    parallel_for(tree.nboxes, [&] (size_t ibox) {
        IdT start = tree.box_target_starts[ibox];
        IdT write_idx = out.target_starts[ibox];
        for (IdT i = start; i < start + tree.box_target_counts_nonchild[ibox]; i++) {
            IdT user_id = user_target_ids[i];
            if (flags[user_id]) {
                out.target_lists[write_idx] = user_id;
                write_idx++;
            }
        }
        std::sort(
            out.target_lists.begin() + out.target_starts[ibox],
            out.target_lists.begin() + out.target_starts[ibox + 1]
        );
    });

    return out;
}

template FilteredTargetListsInTreeOrder<2,int32_t> filter_target_lists_in_tree_order(
    const Tree<2,int32_t>& tree, const std::vector<uint8_t>& flags);
template FilteredTargetListsInTreeOrder<3,int32_t> filter_target_lists_in_tree_order(
    const Tree<3,int32_t>& tree, const std::vector<uint8_t>& flags);
template FilteredTargetListsInTreeOrder<2,int64_t> filter_target_lists_in_tree_order(
    const Tree<2,int64_t>& tree, const std::vector<uint8_t>& flags);
template FilteredTargetListsInTreeOrder<3,int64_t> filter_target_lists_in_tree_order(
    const Tree<3,int64_t>& tree, const std::vector<uint8_t>& flags);

template FilteredTargetListsInUserOrder<int32_t> filter_target_lists_in_user_order(
    const Tree<2,int32_t>& tree, const std::vector<uint8_t>& flags);
template FilteredTargetListsInUserOrder<int32_t> filter_target_lists_in_user_order(
    const Tree<3,int32_t>& tree, const std::vector<uint8_t>& flags);
template FilteredTargetListsInUserOrder<int64_t> filter_target_lists_in_user_order(
    const Tree<2,int64_t>& tree, const std::vector<uint8_t>& flags);
template FilteredTargetListsInUserOrder<int64_t> filter_target_lists_in_user_order(
    const Tree<3,int64_t>& tree, const std::vector<uint8_t>& flags);
