#pragma once

#include <vector>
#include "parallel.hpp"

template <typename IdT>
struct PruneMap {
    std::vector<IdT> to_box_id;
    std::vector<IdT> from_box_id;
    size_t nboxes_post_prune;
};

// Drops boxes for which is_empty(ibox) holds. Box 0 is never empty, so the
// root keeps its id.
template <typename IdT, typename EmptyF>
PruneMap<IdT> find_prune_indices(size_t nboxes, const EmptyF& is_empty) {
    PruneMap<IdT> out;
    out.to_box_id.resize(nboxes);
    out.from_box_id.resize(nboxes);
    out.nboxes_post_prune = nboxes;

    inclusive_scan(nboxes, IdT(0),
        [&] (size_t i) { return is_empty(i) ? IdT(1) : IdT(0); },
        [] (IdT a, IdT b, bool) { return a + b; },
        non_segmented(),
        [&] (size_t i, IdT prev_item, IdT item) {
            IdT new_id = static_cast<IdT>(i) - prev_item;
            out.to_box_id[i] = new_id;
            if (item == prev_item) {
                out.from_box_id[new_id] = static_cast<IdT>(i);
            }
            if (i + 1 == nboxes) {
                out.nboxes_post_prune = nboxes - static_cast<size_t>(item);
            }
        }
    );

    out.from_box_id.resize(out.nboxes_post_prune);
    return out;
}

template <typename T, typename IdT>
void compact_box_array(std::vector<T>& arr, const PruneMap<IdT>& m) {
    std::vector<T> out(m.nboxes_post_prune);
    parallel_for(out.size(), [&] (size_t i) {
        out[i] = arr[m.from_box_id[i]];
    });
    arr.swap(out);
}

template <typename IdT>
void remap_box_ids(std::vector<IdT>& ids, const PruneMap<IdT>& m) {
    parallel_for(ids.size(), [&] (size_t i) {
        ids[i] = m.to_box_id[ids[i]];
    });
}
