#include "prune.hpp"
#include "tree.hpp"

template <size_t dim, typename IdT>
void prune_empty_boxes(Tree<dim,IdT>& tree) {
    auto m = find_prune_indices<IdT>(tree.nboxes, [&] (size_t i) {
        IdT count = tree.box_source_counts_cumul[i];
        if (!tree.sources_are_targets) {
            count += tree.box_target_counts_cumul[i];
        }
        return count == 0;
    });

    compact_box_array(tree.box_source_starts, m);
    compact_box_array(tree.box_source_counts_nonchild, m);
    compact_box_array(tree.box_source_counts_cumul, m);
    compact_box_array(tree.box_target_starts, m);
    compact_box_array(tree.box_target_counts_nonchild, m);
    compact_box_array(tree.box_target_counts_cumul, m);
    compact_box_array(tree.box_parent_ids, m);
    compact_box_array(tree.box_child_ids, m);
    compact_box_array(tree.box_centers, m);
    compact_box_array(tree.box_levels, m);
    compact_box_array(tree.box_morton_nrs, m);
    compact_box_array(tree.box_flags, m);

    remap_box_ids(tree.box_parent_ids, m);
    // Empty boxes never register as children, so every nonzero child id
    // survives the prune.
    parallel_for(m.nboxes_post_prune, [&] (size_t i) {
        for (auto& child_id: tree.box_child_ids[i]) {
            if (child_id != 0) {
                child_id = m.to_box_id[child_id];
            }
        }
    });

    tree.nboxes = m.nboxes_post_prune;
}

template void prune_empty_boxes(Tree<2,int16_t>& tree);
template void prune_empty_boxes(Tree<3,int16_t>& tree);
template void prune_empty_boxes(Tree<2,int32_t>& tree);
template void prune_empty_boxes(Tree<3,int32_t>& tree);
template void prune_empty_boxes(Tree<2,int64_t>& tree);
template void prune_empty_boxes(Tree<3,int64_t>& tree);
