#pragma once

#include <array>
#include <cstdint>
#include <vector>
#include "geometry.hpp"
#include "errors.hpp"

using refine_weight_t = int32_t;
// -1 marks a particle that stays in its current box instead of descending.
using morton_nr_t = int8_t;
using box_level_t = uint8_t;
using box_flags_t = uint8_t;

enum BoxFlags: box_flags_t {
    BOX_HAS_OWN_SOURCES = 1 << 0,
    BOX_HAS_OWN_TARGETS = 1 << 1,
    BOX_HAS_OWN_SRCNTGTS = BOX_HAS_OWN_SOURCES | BOX_HAS_OWN_TARGETS,
    BOX_HAS_CHILD_SOURCES = 1 << 2,
    BOX_HAS_CHILD_TARGETS = 1 << 3,
    BOX_HAS_CHILD_SRCNTGTS = BOX_HAS_CHILD_SOURCES | BOX_HAS_CHILD_TARGETS,
    BOX_HAS_CHILDREN = 1 << 4
};

template <size_t dim>
using Coords = std::array<std::vector<double>,dim>;

struct TreeBuildConfig {
    // Exactly one of these two is set. max_leaf_refine_weight requires
    // per-particle refine weights.
    size_t max_particles_in_box = 0;
    refine_weight_t max_leaf_refine_weight = 0;

    // Non-adaptive trees split every non-empty box until all boxes on the
    // finest level fit, so all leaves end up on the same level.
    bool adaptive = true;

    // How far (as a fraction of the box size) a particle with extent may stick
    // out of a child box before it is kept in the parent.
    double stick_out_factor = 0.25;

    int max_levels = 50;
    bool skip_prune = false;
    bool verbose = false;
};

template <size_t dim>
struct TreeBuildInput {
    Coords<dim> sources;
    // Leave all target axes empty to use the sources as targets.
    Coords<dim> targets;
    std::vector<double> source_radii;
    std::vector<double> target_radii;
    // Indexed like the sources followed by the targets. Empty means one per
    // particle.
    std::vector<refine_weight_t> refine_weights;

    bool sources_are_targets() const {
        for (size_t d = 0; d < dim; d++) {
            if (!targets[d].empty()) {
                return false;
            }
        }
        return true;
    }
};

template <size_t _dim, typename IdT>
struct Tree {
    constexpr static size_t dim = _dim;
    constexpr static size_t split = 2 << (dim - 1);
    using particle_id_t = IdT;
    using box_id_t = IdT;

    bool sources_are_targets;
    bool sources_have_extent;
    bool targets_have_extent;
    double stick_out_factor;

    BoundingBox<dim> bounding_box;
    double root_extent;

    size_t nlevels;
    size_t nboxes;
    size_t nsources;
    size_t ntargets;

    // Tree order.
    Coords<dim> sources;
    Coords<dim> targets;
    std::vector<double> source_radii;
    std::vector<double> target_radii;

    // Tree source order -> user source order.
    std::vector<IdT> user_source_ids;
    // User target order -> tree target order.
    std::vector<IdT> sorted_target_ids;

    std::vector<IdT> box_source_starts;
    std::vector<IdT> box_source_counts_nonchild;
    std::vector<IdT> box_source_counts_cumul;
    std::vector<IdT> box_target_starts;
    std::vector<IdT> box_target_counts_nonchild;
    std::vector<IdT> box_target_counts_cumul;

    std::vector<IdT> box_parent_ids;
    // 0 marks an absent child; the root is never anybody's child.
    std::vector<std::array<IdT,split>> box_child_ids;
    std::vector<std::array<double,dim>> box_centers;
    std::vector<box_level_t> box_levels;
    std::vector<morton_nr_t> box_morton_nrs;
    std::vector<box_flags_t> box_flags;

    double box_width(size_t ibox) const {
        return root_extent / static_cast<double>(uint64_t(1) << box_levels[ibox]);
    }

    bool is_leaf(size_t ibox) const {
        return !(box_flags[ibox] & BOX_HAS_CHILDREN);
    }
};

template <size_t dim, typename IdT>
Tree<dim,IdT> build_tree(const TreeBuildInput<dim>& input, const TreeBuildConfig& cfg,
    const BoundingBox<dim>* bbox = nullptr);

template <size_t dim>
BoundingBox<dim> compute_bounding_box(const Coords<dim>& pts, const std::vector<double>& radii);

template <size_t dim, typename IdT>
void prune_empty_boxes(Tree<dim,IdT>& tree);
