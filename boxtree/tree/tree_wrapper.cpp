#include "include/pybind11_nparray.hpp"
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "tree.hpp"
#include "tree_helpers.hpp"
#include "point_sources.hpp"
#include "target_filter.hpp"

namespace py = pybind11;

using IdT = int32_t;

template <size_t dim>
TreeBuildInput<dim> make_input(NPArrayD sources, py::object targets,
    py::object source_radii, py::object target_radii, py::object refine_weights)
{
    TreeBuildInput<dim> input;
    input.sources = get_coords<dim>(sources);
    if (!targets.is_none()) {
        auto np_targets = targets.cast<NPArrayD>();
        input.targets = get_coords<dim>(np_targets);
    }
    if (!source_radii.is_none()) {
        auto np_radii = source_radii.cast<NPArrayD>();
        input.source_radii = get_vector<double>(np_radii);
    }
    if (!target_radii.is_none()) {
        auto np_radii = target_radii.cast<NPArrayD>();
        input.target_radii = get_vector<double>(np_radii);
    }
    if (!refine_weights.is_none()) {
        auto np_weights = refine_weights.cast<NPArray<refine_weight_t>>();
        input.refine_weights = get_vector<refine_weight_t>(np_weights);
    }
    return input;
}

template <size_t dim>
void wrap_dim(py::module& m) {
    using TreeT = Tree<dim,IdT>;

    py::class_<BoundingBox<dim>>(m, "BoundingBox")
        .def(py::init<std::array<double,dim>, std::array<double,dim>>())
        .def_readonly("min", &BoundingBox<dim>::min)
        .def_readonly("max", &BoundingBox<dim>::max);

    py::class_<TreeT>(m, "Tree")
        .def_property_readonly("dimensions", [] (const TreeT&) { return dim; })
        .def_readonly("sources_are_targets", &TreeT::sources_are_targets)
        .def_readonly("sources_have_extent", &TreeT::sources_have_extent)
        .def_readonly("targets_have_extent", &TreeT::targets_have_extent)
        .def_readonly("stick_out_factor", &TreeT::stick_out_factor)
        .def_readonly("bounding_box", &TreeT::bounding_box)
        .def_readonly("root_extent", &TreeT::root_extent)
        .def_readonly("nlevels", &TreeT::nlevels)
        .def_readonly("nboxes", &TreeT::nboxes)
        .def_readonly("nsources", &TreeT::nsources)
        .def_readonly("ntargets", &TreeT::ntargets)
        .COORDSPROP(TreeT, sources)
        .COORDSPROP(TreeT, targets)
        .NPARRAYPROP(TreeT, source_radii)
        .NPARRAYPROP(TreeT, target_radii)
        .NPARRAYPROP(TreeT, user_source_ids)
        .NPARRAYPROP(TreeT, sorted_target_ids)
        .NPARRAYPROP(TreeT, box_source_starts)
        .NPARRAYPROP(TreeT, box_source_counts_nonchild)
        .NPARRAYPROP(TreeT, box_source_counts_cumul)
        .NPARRAYPROP(TreeT, box_target_starts)
        .NPARRAYPROP(TreeT, box_target_counts_nonchild)
        .NPARRAYPROP(TreeT, box_target_counts_cumul)
        .NPARRAYPROP(TreeT, box_parent_ids)
        .NPARRAYPROP(TreeT, box_child_ids)
        .NPARRAYPROP(TreeT, box_centers)
        .NPARRAYPROP(TreeT, box_levels)
        .NPARRAYPROP(TreeT, box_morton_nrs)
        .NPARRAYPROP(TreeT, box_flags)
        .def("reorder_sources", [] (const TreeT& tree, NPArrayD np_x) {
            auto out = reorder_sources(tree, get_vector<double>(np_x));
            return make_array<double>({out.size()}, out.data());
        })
        .def("reorder_potentials", [] (const TreeT& tree, NPArrayD np_p) {
            auto out = reorder_potentials(tree, get_vector<double>(np_p));
            return make_array<double>({out.size()}, out.data());
        })
        .def("find_box_for_source", &find_box_for_source<TreeT>)
        .def("find_box_for_target", &find_box_for_target<TreeT>)
        .def("find_box_for_user_source", &find_box_for_user_source<TreeT>)
        .def("find_box_for_user_target", &find_box_for_user_target<TreeT>)
        .def("prune_empty_boxes", &prune_empty_boxes<dim,IdT>);

    using FilteredT = FilteredTargetListsInTreeOrder<dim,IdT>;
    py::class_<FilteredT>(m, "FilteredTargetListsInTreeOrder")
        .def_readonly("nfiltered_targets", &FilteredT::nfiltered_targets)
        .NPARRAYPROP(FilteredT, box_target_starts)
        .NPARRAYPROP(FilteredT, box_target_counts_nonchild)
        .NPARRAYPROP(FilteredT, unfiltered_from_filtered_target_indices)
        .COORDSPROP(FilteredT, targets);

    using LinkedT = LinkedPointSources<dim,IdT>;
    py::class_<LinkedT>(m, "LinkedPointSources")
        .def_readonly("npoint_sources", &LinkedT::npoint_sources)
        .COORDSPROP(LinkedT, point_sources)
        .NPARRAYPROP(LinkedT, user_point_source_ids)
        .NPARRAYPROP(LinkedT, point_source_starts)
        .NPARRAYPROP(LinkedT, point_source_counts)
        .NPARRAYPROP(LinkedT, box_point_source_starts)
        .NPARRAYPROP(LinkedT, box_point_source_counts_nonchild)
        .NPARRAYPROP(LinkedT, box_point_source_counts_cumul);

    m.def("build_tree",
        [] (NPArrayD sources, py::object targets, py::object source_radii,
            py::object target_radii, py::object refine_weights,
            const TreeBuildConfig& cfg, py::object bbox)
        {
            auto input = make_input<dim>(
                sources, targets, source_radii, target_radii, refine_weights
            );
            if (bbox.is_none()) {
                return build_tree<dim,IdT>(input, cfg);
            }
            auto user_bbox = bbox.cast<BoundingBox<dim>>();
            return build_tree<dim,IdT>(input, cfg, &user_bbox);
        },
        py::arg("sources"), py::arg("targets") = py::none(),
        py::arg("source_radii") = py::none(), py::arg("target_radii") = py::none(),
        py::arg("refine_weights") = py::none(), py::arg("config") = TreeBuildConfig(),
        py::arg("bbox") = py::none());

    m.def("filter_target_lists_in_tree_order",
        [] (const TreeT& tree, NPArray<uint8_t> np_flags) {
            return filter_target_lists_in_tree_order(tree, get_vector<uint8_t>(np_flags));
        });

    m.def("filter_target_lists_in_user_order",
        [] (const TreeT& tree, NPArray<uint8_t> np_flags) {
            auto lists = filter_target_lists_in_user_order(
                tree, get_vector<uint8_t>(np_flags)
            );
            return py::make_tuple(
                make_array<IdT>({lists.target_starts.size()}, lists.target_starts.data()),
                make_array<IdT>({lists.target_lists.size()}, lists.target_lists.data())
            );
        });

    m.def("link_point_sources",
        [] (const TreeT& tree, NPArray<IdT> np_point_source_starts, NPArrayD np_point_sources) {
            return link_point_sources(
                tree, get_vector<IdT>(np_point_source_starts),
                get_coords<dim>(np_point_sources)
            );
        });
}

PYBIND11_MODULE(tree_wrapper, m) {
    py::class_<TreeBuildConfig>(m, "TreeBuildConfig")
        .def(py::init<>())
        .def_readwrite("max_particles_in_box", &TreeBuildConfig::max_particles_in_box)
        .def_readwrite("max_leaf_refine_weight", &TreeBuildConfig::max_leaf_refine_weight)
        .def_readwrite("adaptive", &TreeBuildConfig::adaptive)
        .def_readwrite("stick_out_factor", &TreeBuildConfig::stick_out_factor)
        .def_readwrite("max_levels", &TreeBuildConfig::max_levels)
        .def_readwrite("skip_prune", &TreeBuildConfig::skip_prune)
        .def_readwrite("verbose", &TreeBuildConfig::verbose);

    m.attr("BOX_HAS_OWN_SOURCES") = int(BOX_HAS_OWN_SOURCES);
    m.attr("BOX_HAS_OWN_TARGETS") = int(BOX_HAS_OWN_TARGETS);
    m.attr("BOX_HAS_CHILD_SOURCES") = int(BOX_HAS_CHILD_SOURCES);
    m.attr("BOX_HAS_CHILD_TARGETS") = int(BOX_HAS_CHILD_TARGETS);
    m.attr("BOX_HAS_CHILDREN") = int(BOX_HAS_CHILDREN);

    auto tree_build_error = py::register_exception<TreeBuildError>(
        m, "TreeBuildError", PyExc_RuntimeError
    );
    py::register_exception<ConfigurationError>(m, "ConfigurationError", tree_build_error);
    py::register_exception<ConvergenceError>(m, "ConvergenceError", tree_build_error);
    py::register_exception<CapacityOverflowError>(m, "CapacityOverflowError", tree_build_error);
    py::register_exception<DegenerateGeometryError>(
        m, "DegenerateGeometryError", tree_build_error
    );

    auto two = m.def_submodule("two");
    auto three = m.def_submodule("three");

    wrap_dim<2>(two);
    wrap_dim<3>(three);
}
