#include <string>
#include "point_sources.hpp"
#include "parallel.hpp"

template <size_t dim, typename IdT>
LinkedPointSources<dim,IdT> link_point_sources(const Tree<dim,IdT>& tree,
    const std::vector<IdT>& point_source_starts, const Coords<dim>& point_sources)
{
    size_t nsources = tree.nsources;
    if (point_source_starts.size() != nsources + 1) {
        throw ConfigurationError(
            "point_source_starts: expected " + std::to_string(nsources + 1) +
            " entries, got " + std::to_string(point_source_starts.size())
        );
    }
    if (point_source_starts[0] != 0) {
        throw ConfigurationError("point_source_starts must begin at 0");
    }
    size_t n_decreasing = parallel_reduce(nsources, size_t(0),
        [&] (size_t i) {
            return (point_source_starts[i + 1] < point_source_starts[i]) ? 1 : 0;
        },
        [] (size_t a, size_t b) { return a + b; }
    );
    if (n_decreasing > 0) {
        throw ConfigurationError("point_source_starts must be non-decreasing");
    }
    for (size_t d = 0; d < dim; d++) {
        if (point_sources[d].size() != static_cast<size_t>(point_source_starts[nsources])) {
            throw ConfigurationError(
                "point source coordinates do not match point_source_starts"
            );
        }
    }

    LinkedPointSources<dim,IdT> out;
    out.point_source_starts.resize(nsources);
    out.point_source_counts.resize(nsources);
    out.npoint_sources = 0;

    inclusive_scan(nsources, IdT(0),
        [&] (size_t i) {
            IdT user_id = tree.user_source_ids[i];
            return point_source_starts[user_id + 1] - point_source_starts[user_id];
        },
        [] (IdT a, IdT b, bool) { return a + b; },
        non_segmented(),
        [&] (size_t i, IdT prev_item, IdT item) {
            out.point_source_starts[i] = prev_item;
            out.point_source_counts[i] = item - prev_item;
            if (i + 1 == nsources) {
                out.npoint_sources = static_cast<size_t>(item);
            }
        }
    );

    size_t npoint_sources = out.npoint_sources;

    // Every source with point sources starts a segment holding its user
    // point-source start. The segmented scan then counts up from there.
    std::vector<IdT> segment_values(npoint_sources, 1);
    std::vector<char> source_boundaries(npoint_sources, 0);
    parallel_for(nsources, [&] (size_t i) {
        if (out.point_source_counts[i] > 0) {
            IdT start = out.point_source_starts[i];
            source_boundaries[start] = 1;
            segment_values[start] = point_source_starts[tree.user_source_ids[i]];
        }
    });

    out.user_point_source_ids.resize(npoint_sources);
    inclusive_scan(npoint_sources, IdT(0),
        [&] (size_t i) { return segment_values[i]; },
        [] (IdT a, IdT b, bool across_seg_boundary) {
            return across_seg_boundary ? b : a + b;
        },
        [&] (size_t i) { return source_boundaries[i] != 0; },
        [&] (size_t i, IdT, IdT item) { out.user_point_source_ids[i] = item; }
    );

    for (size_t d = 0; d < dim; d++) {
        out.point_sources[d].resize(npoint_sources);
        parallel_for(npoint_sources, [&] (size_t i) {
            out.point_sources[d][i] = point_sources[d][out.user_point_source_ids[i]];
        });
    }

    out.box_point_source_starts.resize(tree.nboxes);
    out.box_point_source_counts_nonchild.resize(tree.nboxes);
    out.box_point_source_counts_cumul.resize(tree.nboxes);

    parallel_for(tree.nboxes, [&] (size_t ibox) {
        size_t s_start = static_cast<size_t>(tree.box_source_starts[ibox]);
        // A box without sources may start one past the last source.
        IdT ps_start = (s_start < nsources)
            ? out.point_source_starts[s_start]
            : static_cast<IdT>(npoint_sources);
        out.box_point_source_starts[ibox] = ps_start;

        auto count_point_sources = [&] (IdT s_count) {
            if (s_count == 0) {
                return IdT(0);
            }
            size_t last_s_in_box = s_start + static_cast<size_t>(s_count) - 1;
            IdT beyond_last_ps_in_box = out.point_source_starts[last_s_in_box]
                + out.point_source_counts[last_s_in_box];
            return static_cast<IdT>(beyond_last_ps_in_box - ps_start);
        };
        out.box_point_source_counts_nonchild[ibox] =
            count_point_sources(tree.box_source_counts_nonchild[ibox]);
        out.box_point_source_counts_cumul[ibox] =
            count_point_sources(tree.box_source_counts_cumul[ibox]);
    });

    return out;
}

template LinkedPointSources<2,int32_t> link_point_sources(const Tree<2,int32_t>& tree,
    const std::vector<int32_t>& point_source_starts, const Coords<2>& point_sources);
template LinkedPointSources<3,int32_t> link_point_sources(const Tree<3,int32_t>& tree,
    const std::vector<int32_t>& point_source_starts, const Coords<3>& point_sources);
template LinkedPointSources<2,int64_t> link_point_sources(const Tree<2,int64_t>& tree,
    const std::vector<int64_t>& point_source_starts, const Coords<2>& point_sources);
template LinkedPointSources<3,int64_t> link_point_sources(const Tree<3,int64_t>& tree,
    const std::vector<int64_t>& point_source_starts, const Coords<3>& point_sources);
