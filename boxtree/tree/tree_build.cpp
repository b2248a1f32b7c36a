#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

#include "include/timing.hpp"
#include "tree_build_kernels.hpp"
#include "prune.hpp"

template <size_t dim>
BoundingBox<dim> compute_bounding_box(const Coords<dim>& pts, const std::vector<double>& radii) {
    return parallel_reduce(pts[0].size(), BoundingBox<dim>::empty(),
        [&] (size_t i) {
            double r = radii.empty() ? 0.0 : radii[i];
            BoundingBox<dim> b;
            for (size_t d = 0; d < dim; d++) {
                b.min[d] = pts[d][i] - r;
                b.max[d] = pts[d][i] + r;
            }
            return b;
        },
        merge<dim>
    );
}

template <size_t dim>
size_t check_coords(const Coords<dim>& pts, const std::string& name) {
    for (size_t d = 1; d < dim; d++) {
        if (pts[d].size() != pts[0].size()) {
            throw ConfigurationError(
                name + " coordinate arrays must all have the same length"
            );
        }
    }
    return pts[0].size();
}

inline void check_radii(const std::vector<double>& radii, size_t n, const std::string& name) {
    if (radii.empty()) {
        return;
    }
    if (radii.size() != n) {
        throw ConfigurationError(
            name + " radii: expected " + std::to_string(n) +
            " entries, got " + std::to_string(radii.size())
        );
    }
    size_t n_bad = parallel_reduce(n, size_t(0),
        [&] (size_t i) { return (radii[i] >= 0.0 && std::isfinite(radii[i])) ? 0 : 1; },
        [] (size_t a, size_t b) { return a + b; }
    );
    if (n_bad > 0) {
        throw ConfigurationError(name + " radii must be finite and non-negative");
    }
}

template <size_t dim, typename IdT>
void check_input(const TreeBuildInput<dim>& input, const TreeBuildConfig& cfg) {
    size_t nsources = check_coords(input.sources, "source");
    bool sources_are_targets = input.sources_are_targets();
    size_t ntargets = sources_are_targets ? nsources : check_coords(input.targets, "target");
    size_t n = sources_are_targets ? nsources : nsources + ntargets;

    if (n == 0) {
        throw ConfigurationError("cannot build a tree without particles");
    }
    if (n > static_cast<size_t>(std::numeric_limits<IdT>::max())) {
        throw ConfigurationError(
            std::to_string(n) + " particles do not fit in the particle id type"
        );
    }

    check_radii(input.source_radii, nsources, "source");
    if (sources_are_targets && !input.target_radii.empty()) {
        throw ConfigurationError(
            "target radii given, but targets are the sources; pass source radii instead"
        );
    }
    check_radii(input.target_radii, ntargets, "target");

    if (input.refine_weights.empty()) {
        if (cfg.max_particles_in_box == 0) {
            throw ConfigurationError("max_particles_in_box must be positive");
        }
        if (cfg.max_leaf_refine_weight != 0) {
            throw ConfigurationError(
                "max_leaf_refine_weight requires per-particle refine weights"
            );
        }
    } else {
        if (cfg.max_particles_in_box != 0) {
            throw ConfigurationError(
                "max_particles_in_box and refine weights are mutually exclusive; "
                "use max_leaf_refine_weight"
            );
        }
        if (cfg.max_leaf_refine_weight <= 0) {
            throw ConfigurationError("max_leaf_refine_weight must be positive");
        }
        if (input.refine_weights.size() != n) {
            throw ConfigurationError(
                "refine weights: expected " + std::to_string(n) +
                " entries, got " + std::to_string(input.refine_weights.size())
            );
        }
        auto min_weight = parallel_reduce(n, std::numeric_limits<refine_weight_t>::max(),
            [&] (size_t i) { return input.refine_weights[i]; },
            [] (refine_weight_t a, refine_weight_t b) { return std::min(a, b); }
        );
        if (min_weight < 0) {
            throw ConfigurationError("refine weights must be non-negative");
        }
    }

    if (!(cfg.stick_out_factor >= 0.0) || !std::isfinite(cfg.stick_out_factor)) {
        throw ConfigurationError("stick_out_factor must be finite and non-negative");
    }
    if (cfg.max_levels < 1 || cfg.max_levels > 62) {
        throw ConfigurationError(
            "max_levels must be between 1 and 62, got " + std::to_string(cfg.max_levels)
        );
    }
}

template <size_t dim>
BoundingBox<dim> get_root_box(const Coords<dim>& srcntgts,
    const std::vector<double>& srcntgt_radii, const BoundingBox<dim>* bbox)
{
    if (bbox == nullptr) {
        auto computed = compute_bounding_box(srcntgts, srcntgt_radii);
        for (size_t d = 0; d < dim; d++) {
            if (!std::isfinite(computed.min[d]) || !std::isfinite(computed.max[d])) {
                throw ConfigurationError("particle coordinates must be finite");
            }
        }
        return make_root_box(computed);
    }

    for (size_t d = 0; d < dim; d++) {
        if (!(bbox->max[d] > bbox->min[d])) {
            throw DegenerateGeometryError(
                "bounding box has zero extent along axis " + std::to_string(d)
            );
        }
    }
    size_t n_outside = parallel_reduce(srcntgts[0].size(), size_t(0),
        [&] (size_t i) {
            std::array<double,dim> pt;
            for (size_t d = 0; d < dim; d++) {
                pt[d] = srcntgts[d][i];
            }
            return bbox->contains(pt) ? 0 : 1;
        },
        [] (size_t a, size_t b) { return a + b; }
    );
    if (n_outside > 0) {
        throw ConfigurationError(
            std::to_string(n_outside) + " particles lie outside the given bounding box"
        );
    }
    return make_root_box(*bbox);
}

template <typename T, typename IdT>
std::vector<T> permute(const std::vector<T>& from, const std::vector<IdT>& from_ids) {
    std::vector<T> out(from_ids.size());
    parallel_for(out.size(), [&] (size_t i) {
        out[i] = from[from_ids[i]];
    });
    return out;
}

template <size_t dim, typename IdT>
Coords<dim> permute(const Coords<dim>& from, const std::vector<IdT>& from_ids) {
    Coords<dim> out;
    for (size_t d = 0; d < dim; d++) {
        out[d] = permute(from[d], from_ids);
    }
    return out;
}

// Splits the sorted srcntgts into sources and targets and finds the source
// and target ranges of every box. Whoever is the first (last) particle of a
// box writes its start (count), walking up to all ancestors that share it.
template <bool has_extent, size_t dim, typename IdT>
void find_source_and_target_indices(Tree<dim,IdT>& tree,
    const LevelBuffers<dim,IdT>& buf, const BuildBoxes<dim,IdT>& boxes,
    const std::vector<IdT>& srcntgt_counts_nonchild,
    std::vector<IdT>& srcntgt_target_ids)
{
    size_t n = buf.user_srcntgt_ids.size();
    IdT nsources = static_cast<IdT>(tree.nsources);

    std::vector<IdT> source_numbers(n);
    inclusive_scan(n, IdT(0),
        [&] (size_t i) { return (buf.user_srcntgt_ids[i] < nsources) ? IdT(1) : IdT(0); },
        [] (IdT a, IdT b, bool) { return a + b; },
        non_segmented(),
        [&] (size_t i, IdT prev_item, IdT) { source_numbers[i] = prev_item; }
    );

    tree.user_source_ids.resize(tree.nsources);
    tree.sorted_target_ids.resize(tree.ntargets);
    srcntgt_target_ids.resize(tree.ntargets);
    tree.box_source_starts.assign(tree.nboxes, 0);
    tree.box_source_counts_cumul.assign(tree.nboxes, 0);
    tree.box_source_counts_nonchild.assign(tree.nboxes, 0);
    tree.box_target_starts.assign(tree.nboxes, 0);
    tree.box_target_counts_cumul.assign(tree.nboxes, 0);
    tree.box_target_counts_nonchild.assign(tree.nboxes, 0);

    parallel_for(n, [&] (size_t i) {
        IdT sorted_srcntgt_id = static_cast<IdT>(i);
        IdT source_nr = source_numbers[i];
        IdT target_nr = sorted_srcntgt_id - source_nr;

        IdT box_id = buf.srcntgt_box_ids[i];
        IdT box_start = boxes.srcntgt_starts[box_id];
        IdT box_count = boxes.srcntgt_counts_cumul[box_id];

        IdT user_srcntgt_id = buf.user_srcntgt_ids[i];
        bool is_source = user_srcntgt_id < nsources;
        IdT is_source_int = is_source ? 1 : 0;

        {
            IdT walk_box_start = box_start;
            IdT walk_box_id = box_id;
            while (sorted_srcntgt_id == walk_box_start) {
                tree.box_source_starts[walk_box_id] = source_nr;
                tree.box_target_starts[walk_box_id] = target_nr;

                IdT parent_id = boxes.parent_ids[walk_box_id];
                if (parent_id == walk_box_id) {
                    break;
                }
                walk_box_id = parent_id;
                walk_box_start = boxes.srcntgt_starts[walk_box_id];
            }
        }

        if (has_extent) {
            // Last non-child particle of the box. (The first child particle
            // wouldn't do: the box may not have any.)
            IdT box_nonchild_count = srcntgt_counts_nonchild[box_id];
            if (sorted_srcntgt_id + 1 == box_start + box_nonchild_count) {
                IdT box_start_source_nr = source_numbers[box_start];
                IdT box_start_target_nr = box_start - box_start_source_nr;
                tree.box_source_counts_nonchild[box_id] =
                    source_nr + is_source_int - box_start_source_nr;
                tree.box_target_counts_nonchild[box_id] =
                    target_nr + 1 - is_source_int - box_start_target_nr;
            }
        }

        {
            IdT walk_box_start = box_start;
            IdT walk_box_count = box_count;
            IdT walk_box_id = box_id;
            while (sorted_srcntgt_id + 1 == walk_box_start + walk_box_count) {
                IdT box_start_source_nr = source_numbers[walk_box_start];
                IdT box_start_target_nr = walk_box_start - box_start_source_nr;
                tree.box_source_counts_cumul[walk_box_id] =
                    source_nr + is_source_int - box_start_source_nr;
                tree.box_target_counts_cumul[walk_box_id] =
                    target_nr + 1 - is_source_int - box_start_target_nr;

                IdT parent_id = boxes.parent_ids[walk_box_id];
                if (parent_id == walk_box_id) {
                    break;
                }
                walk_box_id = parent_id;
                walk_box_start = boxes.srcntgt_starts[walk_box_id];
                walk_box_count = boxes.srcntgt_counts_cumul[walk_box_id];
            }
        }

        if (is_source) {
            tree.user_source_ids[source_nr] = user_srcntgt_id;
        } else {
            IdT user_target_id = user_srcntgt_id - nsources;
            srcntgt_target_ids[target_nr] = user_srcntgt_id;
            tree.sorted_target_ids[user_target_id] = target_nr;
        }
    });
}

template <bool has_extent, size_t dim, typename IdT>
void compute_box_info(Tree<dim,IdT>& tree,
    const std::vector<IdT>& srcntgt_counts_cumul,
    const std::vector<uint8_t>& has_children)
{
    tree.box_child_ids.assign(tree.nboxes, std::array<IdT,Tree<dim,IdT>::split>{});
    tree.box_centers.assign(tree.nboxes, std::array<double,dim>{});
    tree.box_flags.assign(tree.nboxes, 0);

    parallel_for(tree.nboxes, [&] (size_t i) {
        IdT box_id = static_cast<IdT>(i);

        // Only boxes that received particles during the level loop have
        // anything initialized. Empty boxes get no flags.
        IdT particle_count = srcntgt_counts_cumul[i];
        if (particle_count == 0) {
            return;
        }

        IdT nonchild_source_count = has_extent ? tree.box_source_counts_nonchild[i] : 0;
        IdT nonchild_target_count = has_extent ? tree.box_target_counts_nonchild[i] : 0;

        box_flags_t my_box_flags = 0;
        if (has_children[i]) {
            my_box_flags |= BOX_HAS_CHILDREN;

            if (tree.sources_are_targets) {
                if (particle_count - nonchild_source_count > 0) {
                    my_box_flags |= BOX_HAS_CHILD_SRCNTGTS;
                }
            } else {
                if (tree.box_source_counts_cumul[i] - nonchild_source_count > 0) {
                    my_box_flags |= BOX_HAS_CHILD_SOURCES;
                }
                if (tree.box_target_counts_cumul[i] - nonchild_target_count > 0) {
                    my_box_flags |= BOX_HAS_CHILD_TARGETS;
                }
            }

            if (nonchild_source_count > 0) {
                my_box_flags |= BOX_HAS_OWN_SOURCES;
            }
            if (nonchild_target_count > 0) {
                my_box_flags |= BOX_HAS_OWN_TARGETS;
            }
        } else {
            // Everything in a leaf belongs to the leaf, including particles
            // that could have descended further.
            if (tree.sources_are_targets) {
                my_box_flags |= BOX_HAS_OWN_SRCNTGTS;
                tree.box_source_counts_nonchild[i] = particle_count;
                tree.box_target_counts_nonchild[i] = particle_count;
            } else {
                IdT my_source_count = tree.box_source_counts_cumul[i];
                IdT my_target_count = particle_count - my_source_count;
                if (my_source_count > 0) {
                    my_box_flags |= BOX_HAS_OWN_SOURCES;
                }
                if (my_target_count > 0) {
                    my_box_flags |= BOX_HAS_OWN_TARGETS;
                }
                tree.box_source_counts_nonchild[i] = my_source_count;
                tree.box_target_counts_nonchild[i] = my_target_count;
            }
        }
        tree.box_flags[i] = my_box_flags;

        IdT parent_id = tree.box_parent_ids[i];
        int morton_nr = tree.box_morton_nrs[i];
        if (parent_id != box_id) {
            tree.box_child_ids[parent_id][morton_nr] = box_id;
        }

        // Walk up to the root, halving the offset from the center at every
        // level.
        std::array<double,dim> center{};
        IdT walk_parent_id = parent_id;
        IdT current_box_id = box_id;
        int walk_morton_nr = morton_nr;
        while (walk_parent_id != current_box_id) {
            for (size_t d = 0; d < dim; d++) {
                double has_bit = (walk_morton_nr & (1 << (dim - 1 - d))) ? 1.0 : 0.0;
                center[d] = 0.5 * (center[d] - 0.5 + has_bit);
            }
            current_box_id = walk_parent_id;
            walk_parent_id = tree.box_parent_ids[walk_parent_id];
            walk_morton_nr = tree.box_morton_nrs[current_box_id];
        }

        for (size_t d = 0; d < dim; d++) {
            tree.box_centers[i][d] = tree.bounding_box.min[d]
                + tree.root_extent * (0.5 + center[d]);
        }
    });
}

template <bool has_extent, size_t dim, typename IdT>
Tree<dim,IdT> build_tree_impl(const TreeBuildInput<dim>& input,
    const TreeBuildConfig& cfg, const BoundingBox<dim>* bbox)
{
    constexpr size_t split = 2 << (dim - 1);
    Timer timer(cfg.verbose);

    // {{{ particle staging

    bool sources_are_targets = input.sources_are_targets();
    size_t nsources = input.sources[0].size();
    size_t ntargets = sources_are_targets ? nsources : input.targets[0].size();
    size_t n = sources_are_targets ? nsources : nsources + ntargets;

    const Coords<dim>* srcntgt_coords = &input.sources;
    Coords<dim> combined_coords;
    if (!sources_are_targets) {
        for (size_t d = 0; d < dim; d++) {
            combined_coords[d].reserve(n);
            combined_coords[d].insert(combined_coords[d].end(),
                input.sources[d].begin(), input.sources[d].end());
            combined_coords[d].insert(combined_coords[d].end(),
                input.targets[d].begin(), input.targets[d].end());
        }
        srcntgt_coords = &combined_coords;
    }

    std::vector<double> srcntgt_radii;
    if (has_extent) {
        srcntgt_radii.assign(n, 0.0);
        std::copy(input.source_radii.begin(), input.source_radii.end(),
            srcntgt_radii.begin());
        if (!sources_are_targets) {
            std::copy(input.target_radii.begin(), input.target_radii.end(),
                srcntgt_radii.begin() + nsources);
        }
    }

    std::vector<refine_weight_t> refine_weights = input.refine_weights;
    refine_weight_t max_leaf_refine_weight = cfg.max_leaf_refine_weight;
    if (refine_weights.empty()) {
        refine_weights.assign(n, 1);
        max_leaf_refine_weight = static_cast<refine_weight_t>(std::min<size_t>(
            cfg.max_particles_in_box,
            static_cast<size_t>(std::numeric_limits<refine_weight_t>::max())
        ));
    }

    auto root_box = get_root_box(*srcntgt_coords, srcntgt_radii, bbox);

    Srcntgts<dim> p{
        n, *srcntgt_coords, srcntgt_radii, refine_weights,
        root_box, cfg.stick_out_factor
    };

    LevelBuffers<dim,IdT> buf(n);
    parallel_for(n, [&] (size_t i) {
        buf.user_srcntgt_ids[i] = static_cast<IdT>(i);
    });
    buf.box_start_flags[0] = 1;

    BuildBoxes<dim,IdT> boxes;
    size_t nboxes_guess = split * std::max<size_t>(
        1, n / static_cast<size_t>(std::max<refine_weight_t>(1, max_leaf_refine_weight))
    ) + 1;
    boxes.reserve_boxes(nboxes_guess);
    boxes.srcntgt_starts[0] = 0;
    boxes.srcntgt_counts_cumul[0] = static_cast<IdT>(n);
    boxes.parent_ids[0] = 0;
    boxes.morton_nrs[0] = 0;
    boxes.levels[0] = 0;

    timer.report("staging " + std::to_string(n) + " particles");

    // }}}

    // {{{ level loop

    size_t nboxes = 1;
    // Boxes with ids from here on were created on the last level and never
    // had their Morton bins counted.
    size_t highest_possibly_split_box_nr = 1;

    int level = 1;
    while (true) {
        if (level > cfg.max_levels) {
            throw ConvergenceError(level, nboxes);
        }

        morton_count_scan<has_extent>(level, p, buf, boxes);

        long long nboxes_new = split_box_id_scan<has_extent>(
            level, nboxes, cfg, max_leaf_refine_weight, buf, boxes
        );
        if (nboxes_new > static_cast<long long>(std::numeric_limits<IdT>::max())) {
            throw CapacityOverflowError(level, nboxes_new);
        }

        boxes.reserve_boxes(static_cast<size_t>(nboxes_new));

        bool have_oversize_split_box = split_and_sort<has_extent>(
            level, max_leaf_refine_weight, buf, boxes
        );
        buf.swap_buffers();

        highest_possibly_split_box_nr = nboxes;
        nboxes = static_cast<size_t>(nboxes_new);

        timer.report(
            "level " + std::to_string(level) + " (" + std::to_string(nboxes) + " boxes)"
        );

        if (!have_oversize_split_box) {
            break;
        }
        level++;
    }

    // }}}

    std::vector<IdT> srcntgt_counts_nonchild(nboxes, 0);
    if (has_extent) {
        parallel_for(nboxes, [&] (size_t i) {
            if (i < highest_possibly_split_box_nr && boxes.srcntgt_counts_cumul[i] > 0) {
                srcntgt_counts_nonchild[i] = boxes.morton_bin_counts[i].nonchild;
            }
        });
    }
    boxes.resize(nboxes);
    boxes.morton_bin_counts.clear();

    // {{{ prune empty boxes

    if (!cfg.skip_prune) {
        auto m = find_prune_indices<IdT>(nboxes, [&] (size_t i) {
            return boxes.srcntgt_counts_cumul[i] == 0;
        });
        compact_box_array(boxes.srcntgt_starts, m);
        compact_box_array(boxes.srcntgt_counts_cumul, m);
        compact_box_array(boxes.parent_ids, m);
        compact_box_array(boxes.morton_nrs, m);
        compact_box_array(boxes.levels, m);
        compact_box_array(boxes.has_children, m);
        compact_box_array(srcntgt_counts_nonchild, m);
        remap_box_ids(boxes.parent_ids, m);
        remap_box_ids(buf.srcntgt_box_ids, m);

        timer.report(
            "pruning " + std::to_string(nboxes - m.nboxes_post_prune) + " empty boxes"
        );
        nboxes = m.nboxes_post_prune;
    }

    // }}}

    Tree<dim,IdT> tree;
    tree.sources_are_targets = sources_are_targets;
    tree.sources_have_extent = !input.source_radii.empty();
    tree.targets_have_extent = sources_are_targets
        ? tree.sources_have_extent : !input.target_radii.empty();
    tree.stick_out_factor = cfg.stick_out_factor;
    tree.bounding_box = root_box;
    tree.root_extent = root_box.max[0] - root_box.min[0];
    tree.nboxes = nboxes;
    tree.nsources = nsources;
    tree.ntargets = ntargets;

    box_level_t max_level = parallel_reduce(nboxes, box_level_t(0),
        [&] (size_t i) {
            return boxes.srcntgt_counts_cumul[i] > 0 ? boxes.levels[i] : box_level_t(0);
        },
        [] (box_level_t a, box_level_t b) { return std::max(a, b); }
    );
    tree.nlevels = static_cast<size_t>(max_level) + 1;

    // {{{ sources and targets

    if (sources_are_targets) {
        tree.user_source_ids = buf.user_srcntgt_ids;
        tree.sorted_target_ids.resize(n);
        parallel_for(n, [&] (size_t i) {
            tree.sorted_target_ids[buf.user_srcntgt_ids[i]] = static_cast<IdT>(i);
        });

        tree.box_source_starts = boxes.srcntgt_starts;
        tree.box_source_counts_cumul = boxes.srcntgt_counts_cumul;
        tree.box_source_counts_nonchild = srcntgt_counts_nonchild;
        tree.box_target_starts = boxes.srcntgt_starts;
        tree.box_target_counts_cumul = boxes.srcntgt_counts_cumul;
        tree.box_target_counts_nonchild = srcntgt_counts_nonchild;

        tree.sources = permute(*srcntgt_coords, tree.user_source_ids);
        tree.targets = tree.sources;
        if (has_extent) {
            tree.source_radii = permute(srcntgt_radii, tree.user_source_ids);
            tree.target_radii = tree.source_radii;
        }
    } else {
        std::vector<IdT> srcntgt_target_ids;
        find_source_and_target_indices<has_extent>(
            tree, buf, boxes, srcntgt_counts_nonchild, srcntgt_target_ids
        );

        // Sources come first in srcntgt order, so user source ids are also
        // srcntgt ids.
        tree.sources = permute(*srcntgt_coords, tree.user_source_ids);
        tree.targets = permute(*srcntgt_coords, srcntgt_target_ids);
        if (tree.sources_have_extent) {
            tree.source_radii = permute(srcntgt_radii, tree.user_source_ids);
        }
        if (tree.targets_have_extent) {
            tree.target_radii = permute(srcntgt_radii, srcntgt_target_ids);
        }
    }

    timer.report("source/target split");

    // }}}

    tree.box_parent_ids = std::move(boxes.parent_ids);
    tree.box_levels = std::move(boxes.levels);
    tree.box_morton_nrs = std::move(boxes.morton_nrs);
    compute_box_info<has_extent>(tree, boxes.srcntgt_counts_cumul, boxes.has_children);

    timer.report("box info");
    timer.log(
        "built tree: " + std::to_string(tree.nboxes) + " boxes, " +
        std::to_string(tree.nlevels) + " levels"
    );

    return tree;
}

template <size_t dim, typename IdT>
Tree<dim,IdT> build_tree(const TreeBuildInput<dim>& input, const TreeBuildConfig& cfg,
    const BoundingBox<dim>* bbox)
{
    check_input<dim,IdT>(input, cfg);

    bool have_extent = !input.source_radii.empty() || !input.target_radii.empty();
    if (have_extent) {
        return build_tree_impl<true,dim,IdT>(input, cfg, bbox);
    } else {
        return build_tree_impl<false,dim,IdT>(input, cfg, bbox);
    }
}

template BoundingBox<2> compute_bounding_box(const Coords<2>& pts, const std::vector<double>& radii);
template BoundingBox<3> compute_bounding_box(const Coords<3>& pts, const std::vector<double>& radii);

template Tree<2,int16_t> build_tree(const TreeBuildInput<2>& input,
    const TreeBuildConfig& cfg, const BoundingBox<2>* bbox);
template Tree<3,int16_t> build_tree(const TreeBuildInput<3>& input,
    const TreeBuildConfig& cfg, const BoundingBox<3>* bbox);
template Tree<2,int32_t> build_tree(const TreeBuildInput<2>& input,
    const TreeBuildConfig& cfg, const BoundingBox<2>* bbox);
template Tree<3,int32_t> build_tree(const TreeBuildInput<3>& input,
    const TreeBuildConfig& cfg, const BoundingBox<3>* bbox);
template Tree<2,int64_t> build_tree(const TreeBuildInput<2>& input,
    const TreeBuildConfig& cfg, const BoundingBox<2>* bbox);
template Tree<3,int64_t> build_tree(const TreeBuildInput<3>& input,
    const TreeBuildConfig& cfg, const BoundingBox<3>* bbox);
