#pragma once
#include <vector>
#include "tree.hpp"

// Sources that act as expansion centers for a variable number of point
// sources each. point_source_starts (size nsources + 1, user source order)
// delimits the point sources of every source, in user point-source order.
template <size_t dim, typename IdT>
struct LinkedPointSources {
    size_t npoint_sources;

    // Tree order.
    Coords<dim> point_sources;
    // Tree point-source order -> user point-source order.
    std::vector<IdT> user_point_source_ids;

    // Indexed by tree-order source.
    std::vector<IdT> point_source_starts;
    std::vector<IdT> point_source_counts;

    std::vector<IdT> box_point_source_starts;
    std::vector<IdT> box_point_source_counts_nonchild;
    std::vector<IdT> box_point_source_counts_cumul;
};

template <size_t dim, typename IdT>
LinkedPointSources<dim,IdT> link_point_sources(const Tree<dim,IdT>& tree,
    const std::vector<IdT>& point_source_starts, const Coords<dim>& point_sources);
