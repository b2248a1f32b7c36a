#pragma once

#include <algorithm>
#include <array>
#include <climits>
#include <cstdint>
#include <vector>
#include "parallel.hpp"
#include "tree.hpp"

// The kernels of the level loop. Each level is built by two scans over the
// particles followed by an elementwise pass:
//
// 1. A segmented (per-box) scan counts, for every particle, how many particles
//    of its box before and including it go to each child octant ("pcnt"),
//    along with their refine weights ("pwt").
//
// 2. A global scan decides which boxes get split and hands out box ids. The
//    first particle of a box that needs refining asks for 2^d new boxes. The
//    running total starts at the number of boxes present before this level.
//
// 3. split_and_sort moves every particle of a split box to its place in the
//    child ranges and creates the child boxes.
//
// Particles whose extent doesn't fit into a child box ("non-child" particles)
// stay in their box and are sorted in front of all child particles.

inline refine_weight_t add_sat(refine_weight_t a, refine_weight_t b) {
    long long result = static_cast<long long>(a) + b;
    return (result > INT32_MAX) ? INT32_MAX : static_cast<refine_weight_t>(result);
}

template <size_t dim, typename IdT>
struct MortonCounts {
    constexpr static size_t split = 2 << (dim - 1);

    IdT nonchild;
    std::array<IdT,split> pcnt;
    std::array<refine_weight_t,split> pwt;

    IdT total_count() const {
        IdT out = nonchild;
        for (size_t m = 0; m < split; m++) {
            out += pcnt[m];
        }
        return out;
    }

    refine_weight_t child_weight() const {
        refine_weight_t out = 0;
        for (size_t m = 0; m < split; m++) {
            out = add_sat(out, pwt[m]);
        }
        return out;
    }

    IdT get_count(int morton_nr) const {
        if (morton_nr == -1) {
            return nonchild;
        }
        return pcnt[morton_nr];
    }

    // Number of particles sorted in front of the ones with morton_nr.
    IdT count_before(int morton_nr) const {
        if (morton_nr == -1) {
            return 0;
        }
        IdT out = nonchild;
        for (int m = 0; m < morton_nr; m++) {
            out += pcnt[m];
        }
        return out;
    }
};

template <size_t dim, typename IdT>
MortonCounts<dim,IdT> combine_morton_counts(const MortonCounts<dim,IdT>& a,
    const MortonCounts<dim,IdT>& b, bool across_seg_boundary)
{
    if (across_seg_boundary) {
        return b;
    }
    MortonCounts<dim,IdT> out;
    out.nonchild = a.nonchild + b.nonchild;
    for (size_t m = 0; m < MortonCounts<dim,IdT>::split; m++) {
        out.pcnt[m] = a.pcnt[m] + b.pcnt[m];
        out.pwt[m] = add_sat(a.pwt[m], b.pwt[m]);
    }
    return out;
}

// The particles as the level loop sees them, in user ("srcntgt") order:
// sources first, then targets, unless the two coincide.
template <size_t dim>
struct Srcntgts {
    size_t n;
    const Coords<dim>& coords;
    const std::vector<double>& radii;
    const std::vector<refine_weight_t>& refine_weights;
    BoundingBox<dim> root_box;
    double stick_out_factor;
};

// Per-box arrays during the build. They only ever grow, between levels.
template <size_t dim, typename IdT>
struct BuildBoxes {
    std::vector<IdT> srcntgt_starts;
    std::vector<IdT> srcntgt_counts_cumul;
    std::vector<IdT> parent_ids;
    std::vector<morton_nr_t> morton_nrs;
    std::vector<box_level_t> levels;
    std::vector<uint8_t> has_children;
    std::vector<MortonCounts<dim,IdT>> morton_bin_counts;

    size_t capacity() const { return srcntgt_starts.size(); }

    void resize(size_t n) {
        srcntgt_starts.resize(n);
        srcntgt_counts_cumul.resize(n);
        parent_ids.resize(n);
        morton_nrs.resize(n);
        levels.resize(n);
        has_children.resize(n);
        morton_bin_counts.resize(n, MortonCounts<dim,IdT>{});
    }

    void reserve_boxes(size_t nboxes) {
        size_t new_capacity = std::max<size_t>(capacity(), 1);
        while (new_capacity < nboxes) {
            new_capacity *= 2;
        }
        if (new_capacity != capacity()) {
            resize(new_capacity);
        }
    }
};

// Per-particle arrays during the build. The id arrays are double buffered:
// split_and_sort reads the current ones and writes the new ones.
template <size_t dim, typename IdT>
struct LevelBuffers {
    std::vector<IdT> user_srcntgt_ids;
    std::vector<IdT> new_user_srcntgt_ids;
    std::vector<IdT> srcntgt_box_ids;
    std::vector<IdT> new_srcntgt_box_ids;

    std::vector<MortonCounts<dim,IdT>> morton_bin_counts;
    std::vector<morton_nr_t> morton_nrs;
    std::vector<uint8_t> box_start_flags;
    std::vector<IdT> split_box_ids;

    explicit LevelBuffers(size_t n):
        user_srcntgt_ids(n),
        new_user_srcntgt_ids(n),
        srcntgt_box_ids(n, 0),
        new_srcntgt_box_ids(n, 0),
        morton_bin_counts(n),
        morton_nrs(n),
        box_start_flags(n, 0),
        split_box_ids(n)
    {}

    void swap_buffers() {
        user_srcntgt_ids.swap(new_user_srcntgt_ids);
        srcntgt_box_ids.swap(new_srcntgt_box_ids);
    }
};

template <bool has_extent, size_t dim, typename IdT>
void morton_count_scan(int level, const Srcntgts<dim>& p,
    LevelBuffers<dim,IdT>& buf, BuildBoxes<dim,IdT>& boxes)
{
    using Counts = MortonCounts<dim,IdT>;

    // level is the level being built, 1 when splitting the root.
    const double level_scale = static_cast<double>(uint64_t(1) << level);
    const double next_level_box_size_factor = 1.0 / level_scale;
    // Converts a box diameter into the radius a particle may occupy.
    const double box_radius_factor = (1.0 + p.stick_out_factor) * 0.5;

    inclusive_scan(p.n, Counts{},
        [&] (size_t i) {
            auto user_id = buf.user_srcntgt_ids[i];
            bool stop_descent = false;
            int morton_nr = 0;
            for (size_t d = 0; d < dim; d++) {
                double global_min = p.root_box.min[d];
                double global_extent = p.root_box.max[d] - global_min;
                double x = p.coords[d][user_id];

                // The scaled coordinate is strictly below 1, so this is
                // strictly below 2^level.
                auto bits = static_cast<uint64_t>(
                    ((x - global_min) / global_extent) * level_scale
                );

                if (has_extent) {
                    double r = p.radii[user_id];
                    double child_center = global_min + global_extent
                        * (static_cast<double>(bits) + 0.5) * next_level_box_size_factor;
                    double stick_out_radius = box_radius_factor
                        * global_extent * next_level_box_size_factor;
                    stop_descent = stop_descent
                        || (x + r >= child_center + stick_out_radius)
                        || (x - r < child_center - stick_out_radius);
                }

                morton_nr = (morton_nr << 1) | static_cast<int>(bits & 1);
            }
            if (has_extent) {
                // Boxes from before the preceding level are never split
                // again, so everything still in them is non-child, even if
                // it would fit a box on this level.
                IdT box_id = buf.srcntgt_box_ids[i];
                stop_descent = stop_descent || boxes.levels[box_id] + 1 < level;
            }
            if (has_extent && stop_descent) {
                morton_nr = -1;
            }
            buf.morton_nrs[i] = static_cast<morton_nr_t>(morton_nr);

            Counts out{};
            if (morton_nr == -1) {
                out.nonchild = 1;
            } else {
                out.pcnt[morton_nr] = 1;
                out.pwt[morton_nr] = p.refine_weights[user_id];
            }
            return out;
        },
        combine_morton_counts<dim,IdT>,
        [&] (size_t i) { return buf.box_start_flags[i] != 0; },
        [&] (size_t i, const Counts&, const Counts& item) {
            buf.morton_bin_counts[i] = item;

            // The last particle of its box publishes the box totals.
            IdT my_id_in_my_box = item.total_count() - 1;
            IdT box_id = buf.srcntgt_box_ids[i];
            if (my_id_in_my_box + 1 == boxes.srcntgt_counts_cumul[box_id]) {
                boxes.morton_bin_counts[box_id] = item;
            }
        }
    );
}

// Returns the number of boxes after this level. The sum is carried in 64 bits
// so the caller can check it against the range of IdT before split_box_ids is
// used.
template <bool has_extent, size_t dim, typename IdT>
long long split_box_id_scan(int level, size_t nboxes, const TreeBuildConfig& cfg,
    refine_weight_t max_leaf_refine_weight,
    LevelBuffers<dim,IdT>& buf, BuildBoxes<dim,IdT>& boxes)
{
    constexpr long long split = 2 << (dim - 1);
    size_t n = buf.srcntgt_box_ids.size();
    long long nboxes_new = static_cast<long long>(nboxes);

    inclusive_scan(n, 0LL,
        [&] (size_t i) {
            long long result = 0;
            if (i == 0) {
                result += static_cast<long long>(nboxes);
            }

            IdT box_id = buf.srcntgt_box_ids[i];
            const auto& counts = boxes.morton_bin_counts[box_id];
            IdT nonchild = has_extent ? counts.nonchild : 0;

            bool first_in_box = static_cast<IdT>(i) == boxes.srcntgt_starts[box_id];
            if (has_extent) {
                // Boxes from earlier levels keep their non-child particles
                // and would otherwise ask for new boxes on every level.
                first_in_box = first_in_box && boxes.levels[box_id] + 1 == level;
            }

            bool refine;
            if (cfg.adaptive) {
                refine = counts.child_weight() > max_leaf_refine_weight;
            } else {
                // Refine weights may be zero, so look at the particle count.
                refine = boxes.srcntgt_counts_cumul[box_id] - nonchild > 0;
            }

            if (first_in_box && refine) {
                result += split;
                boxes.has_children[box_id] = 1;
            }
            return result;
        },
        [] (long long a, long long b, bool) { return a + b; },
        non_segmented(),
        [&] (size_t i, long long, long long item) {
            buf.split_box_ids[i] = static_cast<IdT>(item);
            if (i + 1 == n) {
                nboxes_new = item;
            }
        }
    );

    return nboxes_new;
}

// Returns whether a newly created box is still too heavy, which means another
// level is needed.
template <bool has_extent, size_t dim, typename IdT>
bool split_and_sort(int level, refine_weight_t max_leaf_refine_weight,
    LevelBuffers<dim,IdT>& buf, BuildBoxes<dim,IdT>& boxes)
{
    constexpr IdT split = 2 << (dim - 1);
    size_t n = buf.srcntgt_box_ids.size();
    int have_oversize_split_box = 0;

    parallel_for(n, [&] (size_t i) {
        IdT ibox = buf.srcntgt_box_ids[i];

        bool do_split_box = boxes.has_children[ibox] != 0;
        if (has_extent) {
            // Only boxes created on the preceding level are split now. Older
            // boxes that still hold particles hold only non-child ones.
            do_split_box = do_split_box && boxes.levels[ibox] + 1 == level;
        }

        if (!do_split_box) {
            buf.new_user_srcntgt_ids[i] = buf.user_srcntgt_ids[i];
            buf.new_srcntgt_box_ids[i] = ibox;
            return;
        }

        int my_morton_nr = buf.morton_nrs[i];
        const auto& my_box_counts = boxes.morton_bin_counts[ibox];
        IdT my_count = buf.morton_bin_counts[i].get_count(my_morton_nr);

        IdT my_box_start = boxes.srcntgt_starts[ibox];
        IdT my_bin_start = my_box_start + my_box_counts.count_before(my_morton_nr);
        IdT tgt_particle_idx = my_bin_start + my_count - 1;

        buf.new_user_srcntgt_ids[tgt_particle_idx] = buf.user_srcntgt_ids[i];

        IdT new_box_id = ibox;
        if (my_morton_nr != -1) {
            new_box_id = buf.split_box_ids[i] - split + static_cast<IdT>(my_morton_nr);
        }
        buf.new_srcntgt_box_ids[tgt_particle_idx] = new_box_id;

        // The last particle of each Morton bin sets up the child box.
        if (my_morton_nr == -1 || my_box_counts.pcnt[my_morton_nr] != my_count) {
            return;
        }

        buf.box_start_flags[my_bin_start] = 1;
        boxes.srcntgt_starts[new_box_id] = my_bin_start;
        boxes.parent_ids[new_box_id] = ibox;
        boxes.morton_nrs[new_box_id] = static_cast<morton_nr_t>(my_morton_nr);
        boxes.srcntgt_counts_cumul[new_box_id] = my_count;
        boxes.levels[new_box_id] = static_cast<box_level_t>(level);

        if (my_box_counts.pwt[my_morton_nr] > max_leaf_refine_weight) {
#pragma omp atomic write
            have_oversize_split_box = 1;
        }
    });

    return have_oversize_split_box != 0;
}
