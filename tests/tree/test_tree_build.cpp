#include <doctest/doctest.h>
#include "include/test_helpers.hpp"
#include "tree.hpp"
#include "tree_helpers.hpp"
#include "tree_checks.hpp"

#include <numeric>
#include <stdexcept>

TEST_CASE("one box tree") {
    TreeBuildInput<3> input;
    input.sources = random_pts<3>(3);
    auto tree = build_tree<3,int32_t>(input, particle_count_cfg(4));
    REQUIRE(tree.nboxes == 1);
    REQUIRE(tree.nlevels == 1);
    REQUIRE(tree.sources_are_targets);
    REQUIRE(tree.box_flags[0] == BOX_HAS_OWN_SRCNTGTS);
    REQUIRE(tree.box_source_counts_nonchild[0] == 3);
    REQUIRE(tree.box_source_counts_cumul[0] == 3);
    check_tree(tree);
}

TEST_CASE("box ranges partition") {
    for (bool adaptive: {true, false}) {
        for (bool with_extent: {false, true}) {
            CAPTURE(adaptive);
            CAPTURE(with_extent);

            TreeBuildInput<2> input;
            input.sources = random_pts<2>(3000, -1, 1, 1);
            input.targets = random_pts<2>(2000, -1, 1, 2);
            if (with_extent) {
                input.source_radii = random_vals(3000, 0.0, 0.02, 3);
                input.target_radii = random_vals(2000, 0.0, 0.02, 4);
            }

            auto tree = build_tree<2,int32_t>(input, particle_count_cfg(30, adaptive));
            REQUIRE(!tree.sources_are_targets);
            REQUIRE(tree.sources_have_extent == with_extent);
            REQUIRE(tree.nsources == 3000);
            REQUIRE(tree.ntargets == 2000);
            check_tree(tree);

            if (!with_extent) {
                check_points_in_boxes(tree);
                for (size_t b = 0; b < tree.nboxes; b++) {
                    if (!tree.is_leaf(b)) {
                        REQUIRE(tree.box_source_counts_nonchild[b] == 0);
                        REQUIRE(tree.box_target_counts_nonchild[b] == 0);
                    }
                }
            }
        }
    }
}

TEST_CASE("sources and targets are permuted consistently") {
    TreeBuildInput<3> input;
    input.sources = random_pts<3>(2000, 0, 1, 5);
    input.targets = random_pts<3>(1500, 0, 1, 6);
    input.target_radii = random_vals(1500, 0.0, 0.01, 7);
    auto tree = build_tree<3,int64_t>(input, particle_count_cfg(20));
    check_tree(tree);

    REQUIRE(!tree.sources_have_extent);
    REQUIRE(tree.targets_have_extent);
    REQUIRE(tree.source_radii.empty());

    std::vector<char> seen(2000, 0);
    for (size_t i = 0; i < tree.nsources; i++) {
        auto user_id = tree.user_source_ids[i];
        REQUIRE(!seen[user_id]);
        seen[user_id] = 1;
        for (size_t d = 0; d < 3; d++) {
            REQUIRE(tree.sources[d][i] == input.sources[d][user_id]);
        }
    }

    for (size_t user_id = 0; user_id < tree.ntargets; user_id++) {
        auto i = tree.sorted_target_ids[user_id];
        for (size_t d = 0; d < 3; d++) {
            REQUIRE(tree.targets[d][i] == input.targets[d][user_id]);
        }
        REQUIRE(tree.target_radii[i] == input.target_radii[user_id]);
    }
}

TEST_CASE("non-adaptive leaves obey the occupancy bound") {
    TreeBuildInput<2> input;
    input.sources = random_pts<2>(10000, 0, 1, 8);
    size_t max_particles = 25;
    auto tree = build_tree<2,int32_t>(input, particle_count_cfg(max_particles, false));
    check_tree(tree);

    size_t leaf_level = 0;
    for (size_t b = 0; b < tree.nboxes; b++) {
        if (tree.is_leaf(b)) {
            REQUIRE(static_cast<size_t>(tree.box_source_counts_cumul[b]) <= max_particles);
            if (leaf_level == 0) {
                leaf_level = tree.box_levels[b];
            }
            REQUIRE(tree.box_levels[b] == leaf_level);
        }
    }
    REQUIRE(tree.nlevels == leaf_level + 1);
}

TEST_CASE("adaptive leaves obey the occupancy bound") {
    TreeBuildInput<3> input;
    input.sources = random_pts<3>(10000, 0, 1, 9);
    // Cluster half of the points to get leaves on many levels.
    for (size_t i = 0; i < 5000; i++) {
        for (size_t d = 0; d < 3; d++) {
            input.sources[d][i] *= 1e-3;
        }
    }
    auto tree = build_tree<3,int32_t>(input, particle_count_cfg(10));
    check_tree(tree);
    check_points_in_boxes(tree);

    size_t min_leaf_level = tree.nlevels;
    for (size_t b = 0; b < tree.nboxes; b++) {
        if (tree.is_leaf(b)) {
            REQUIRE(tree.box_source_counts_cumul[b] <= 10);
            REQUIRE(tree.box_source_counts_cumul[b] > 0);
            min_leaf_level = std::min<size_t>(min_leaf_level, tree.box_levels[b]);
        }
    }
    REQUIRE(tree.nlevels > min_leaf_level + 5);
}

TEST_CASE("refine weights") {
    TreeBuildInput<2> input;
    input.sources = random_pts<2>(4000, 0, 1, 10);
    input.refine_weights.resize(4000);
    for (size_t i = 0; i < 4000; i++) {
        // Zero weight particles never force a split.
        input.refine_weights[i] = (i % 3 == 0) ? 0 : 2;
    }

    TreeBuildConfig cfg;
    cfg.max_leaf_refine_weight = 40;
    auto tree = build_tree<2,int32_t>(input, cfg);
    check_tree(tree);

    auto tree_weights = reorder_sources(tree, input.refine_weights);
    for (size_t b = 0; b < tree.nboxes; b++) {
        if (tree.is_leaf(b)) {
            int weight = 0;
            auto start = tree.box_source_starts[b];
            for (auto i = start; i < start + tree.box_source_counts_cumul[b]; i++) {
                weight += tree_weights[i];
            }
            REQUIRE(weight <= 40);
        }
    }
}

TEST_CASE("coincident particles do not converge") {
    TreeBuildInput<2> input;
    for (size_t d = 0; d < 2; d++) {
        input.sources[d].assign(10, 0.25);
    }
    TreeBuildConfig cfg = particle_count_cfg(1);
    cfg.max_levels = 20;
    try {
        build_tree<2,int32_t>(input, cfg);
        FAIL("expected ConvergenceError");
    } catch (const ConvergenceError& e) {
        REQUIRE(e.level == 21);
        REQUIRE(e.nboxes > 0);
    }
    REQUIRE_THROWS_AS(build_tree<2,int32_t>(input, cfg), TreeBuildError);
}

TEST_CASE("a ball of coincident particles stays in its box") {
    size_t n_random = 200;
    size_t n_ball = 10;
    TreeBuildInput<2> input;
    input.sources = random_pts<2>(n_random, 0, 1, 11);
    input.source_radii.assign(n_random, 0.0);
    for (size_t i = 0; i < n_ball; i++) {
        input.sources[0].push_back(0.3);
        input.sources[1].push_back(0.6);
        input.source_radii.push_back(0.01);
    }

    auto tree = build_tree<2,int32_t>(input, particle_count_cfg(2, false));
    check_tree(tree);

    auto ball_tree_idx = indices_to_tree_source_order(
        tree, std::vector<int32_t>{static_cast<int32_t>(n_random)}
    )[0];
    auto ball_box = find_box_for_source(tree, ball_tree_idx);
    REQUIRE(static_cast<size_t>(tree.box_source_counts_nonchild[ball_box]) >= n_ball);
    REQUIRE((tree.box_flags[ball_box] & BOX_HAS_OWN_SOURCES) != 0);

    // The ball fits the box it is stuck in.
    double w = tree.box_width(ball_box);
    for (size_t d = 0; d < 2; d++) {
        double dist = std::fabs(input.sources[d][n_random] - tree.box_centers[ball_box][d]);
        REQUIRE(dist + 0.01 <= 0.5 * w * (1 + tree.stick_out_factor) + 1e-12);
    }
}

TEST_CASE("particles stuck in an old box do not split it again") {
    // One large particle stays in the root. Later levels must not hand the
    // root a second set of children.
    TreeBuildInput<2> input;
    input.sources = random_pts<2>(3000, 0, 1, 12);
    input.source_radii.assign(3000, 0.0);
    input.sources[0][0] = 0.5;
    input.sources[1][0] = 0.5;
    input.source_radii[0] = 0.4;

    auto tree = build_tree<2,int32_t>(input, particle_count_cfg(5));
    check_tree(tree);
    REQUIRE(tree.nlevels > 3);

    REQUIRE(tree.box_source_counts_nonchild[0] == 1);
    REQUIRE(tree.user_source_ids[0] == 0);
    REQUIRE(find_box_for_source(tree, 0) == 0);
    REQUIRE(tree.box_flags[0] == (BOX_HAS_OWN_SRCNTGTS | BOX_HAS_CHILD_SRCNTGTS | BOX_HAS_CHILDREN));

    size_t n_root_children = 0;
    for (size_t b = 1; b < tree.nboxes; b++) {
        if (tree.box_parent_ids[b] == 0) {
            n_root_children++;
        }
    }
    REQUIRE(n_root_children == 4);
}

TEST_CASE("extent particles fit their boxes") {
    TreeBuildInput<3> input;
    input.sources = random_pts<3>(5000, 0, 1, 13);
    input.source_radii = random_vals(5000, 0.0, 0.05, 14);
    TreeBuildConfig cfg = particle_count_cfg(15);
    cfg.stick_out_factor = 0.1;
    auto tree = build_tree<3,int32_t>(input, cfg);
    check_tree(tree);

    for (size_t b = 1; b < tree.nboxes; b++) {
        double box_radius = 0.5 * tree.box_width(b) * (1 + cfg.stick_out_factor);
        auto start = tree.box_source_starts[b];
        for (auto i = start; i < start + tree.box_source_counts_nonchild[b]; i++) {
            for (size_t d = 0; d < 3; d++) {
                double dist = std::fabs(tree.sources[d][i] - tree.box_centers[b][d]);
                REQUIRE(dist + tree.source_radii[i] <= box_radius + 1e-12);
            }
        }
    }
}

TEST_CASE("pruning is idempotent") {
    TreeBuildInput<2> input;
    input.sources = random_pts<2>(3000, 0, 1, 15);
    input.targets = random_pts<2>(500, 0, 0.5, 16);

    auto cfg = particle_count_cfg(8);
    auto pruned = build_tree<2,int32_t>(input, cfg);
    cfg.skip_prune = true;
    auto unpruned = build_tree<2,int32_t>(input, cfg);
    REQUIRE(unpruned.nboxes > pruned.nboxes);

    for (size_t b = 0; b < unpruned.nboxes; b++) {
        if (unpruned.box_source_counts_cumul[b] + unpruned.box_target_counts_cumul[b] == 0) {
            REQUIRE(unpruned.box_flags[b] == 0);
        }
    }

    prune_empty_boxes(unpruned);
    REQUIRE(unpruned.nboxes == pruned.nboxes);
    REQUIRE(unpruned.nlevels == pruned.nlevels);
    REQUIRE_ARRAY_EQUAL(unpruned.box_parent_ids, pruned.box_parent_ids, pruned.nboxes);
    REQUIRE_ARRAY_EQUAL(unpruned.box_child_ids, pruned.box_child_ids, pruned.nboxes);
    REQUIRE_ARRAY_EQUAL(unpruned.box_flags, pruned.box_flags, pruned.nboxes);
    REQUIRE_ARRAY_EQUAL(unpruned.box_source_starts, pruned.box_source_starts, pruned.nboxes);
    REQUIRE_ARRAY_EQUAL(unpruned.box_target_counts_cumul, pruned.box_target_counts_cumul, pruned.nboxes);
    check_tree(unpruned);

    auto before = pruned;
    prune_empty_boxes(pruned);
    REQUIRE(pruned.nboxes == before.nboxes);
    REQUIRE_ARRAY_EQUAL(pruned.box_parent_ids, before.box_parent_ids, pruned.nboxes);
    REQUIRE_ARRAY_EQUAL(pruned.box_child_ids, before.box_child_ids, pruned.nboxes);
    REQUIRE_ARRAY_EQUAL(pruned.box_levels, before.box_levels, pruned.nboxes);
}

TEST_CASE("too many boxes for the box id type") {
    // 30000 distinct grid points with one particle per box need more than
    // 32767 boxes.
    TreeBuildInput<2> input;
    for (size_t i = 0; i < 200; i++) {
        for (size_t j = 0; j < 150; j++) {
            input.sources[0].push_back(static_cast<double>(i) / 200);
            input.sources[1].push_back(static_cast<double>(j) / 150);
        }
    }
    REQUIRE_THROWS_AS(build_tree<2,int16_t>(input, particle_count_cfg(1)), CapacityOverflowError);
    auto tree = build_tree<2,int32_t>(input, particle_count_cfg(1));
    REQUIRE(tree.nboxes > 32767);
}

TEST_CASE("invalid configurations") {
    TreeBuildInput<2> input;
    input.sources = random_pts<2>(100);

    SUBCASE("no particles") {
        TreeBuildInput<2> empty;
        REQUIRE_THROWS_AS(build_tree<2,int32_t>(empty, particle_count_cfg(4)), ConfigurationError);
    }
    SUBCASE("zero particles per box") {
        REQUIRE_THROWS_AS(build_tree<2,int32_t>(input, particle_count_cfg(0)), ConfigurationError);
    }
    SUBCASE("both limits") {
        auto cfg = particle_count_cfg(4);
        cfg.max_leaf_refine_weight = 4;
        REQUIRE_THROWS_AS(build_tree<2,int32_t>(input, cfg), ConfigurationError);
    }
    SUBCASE("weights without a weight limit") {
        input.refine_weights.assign(100, 1);
        REQUIRE_THROWS_AS(build_tree<2,int32_t>(input, particle_count_cfg(4)), ConfigurationError);
    }
    SUBCASE("negative weights") {
        input.refine_weights.assign(100, 1);
        input.refine_weights[50] = -1;
        TreeBuildConfig cfg;
        cfg.max_leaf_refine_weight = 4;
        REQUIRE_THROWS_AS(build_tree<2,int32_t>(input, cfg), ConfigurationError);
    }
    SUBCASE("mismatched lengths") {
        input.sources[1].pop_back();
        REQUIRE_THROWS_AS(build_tree<2,int32_t>(input, particle_count_cfg(4)), ConfigurationError);
    }
    SUBCASE("negative radius") {
        input.source_radii.assign(100, 0.1);
        input.source_radii[3] = -0.1;
        REQUIRE_THROWS_AS(build_tree<2,int32_t>(input, particle_count_cfg(4)), ConfigurationError);
    }
    SUBCASE("target radii without targets") {
        input.target_radii.assign(100, 0.1);
        REQUIRE_THROWS_AS(build_tree<2,int32_t>(input, particle_count_cfg(4)), ConfigurationError);
    }
    SUBCASE("negative stick out factor") {
        auto cfg = particle_count_cfg(4);
        cfg.stick_out_factor = -0.5;
        REQUIRE_THROWS_AS(build_tree<2,int32_t>(input, cfg), ConfigurationError);
    }
    SUBCASE("level bound out of range") {
        auto cfg = particle_count_cfg(4);
        cfg.max_levels = 0;
        REQUIRE_THROWS_AS(build_tree<2,int32_t>(input, cfg), ConfigurationError);
        cfg.max_levels = 63;
        REQUIRE_THROWS_AS(build_tree<2,int32_t>(input, cfg), ConfigurationError);
    }
    SUBCASE("too many particles for the id type") {
        TreeBuildInput<2> big;
        big.sources = random_pts<2>(40000);
        REQUIRE_THROWS_AS(build_tree<2,int16_t>(big, particle_count_cfg(4)), ConfigurationError);
    }
    SUBCASE("flat bounding box") {
        BoundingBox<2> bbox{{0, 0}, {1, 0}};
        REQUIRE_THROWS_AS(
            build_tree<2,int32_t>(input, particle_count_cfg(4), &bbox),
            DegenerateGeometryError
        );
    }
    SUBCASE("bounding box missing particles") {
        BoundingBox<2> bbox{{0, 0}, {0.5, 0.5}};
        REQUIRE_THROWS_AS(
            build_tree<2,int32_t>(input, particle_count_cfg(4), &bbox),
            ConfigurationError
        );
    }
}

TEST_CASE("caller bounding box") {
    TreeBuildInput<2> input;
    input.sources = random_pts<2>(1000, 0.25, 0.5, 17);
    BoundingBox<2> bbox{{-1, -1}, {1, 1}};
    auto tree = build_tree<2,int32_t>(input, particle_count_cfg(10), &bbox);
    check_tree(tree);
    check_points_in_boxes(tree);
    REQUIRE(tree.bounding_box.min[0] == -1);
    REQUIRE(tree.root_extent > 2.0);
    REQUIRE(tree.root_extent < 2.001);
}

TEST_CASE("source permutation round trip") {
    TreeBuildInput<2> input;
    input.sources = random_pts<2>(5000, 0, 1, 18);
    auto tree = build_tree<2,int32_t>(input, particle_count_cfg(30));

    auto x = random_vals(5000, -1, 1, 19);
    auto tree_x = reorder_sources(tree, x);
    auto back = reorder_potentials(tree, tree_x);
    REQUIRE_ARRAY_EQUAL(back, x, x.size());

    std::vector<int32_t> user_ids(5000);
    std::iota(user_ids.begin(), user_ids.end(), 0);
    auto tree_ids = indices_to_tree_target_order(tree, user_ids);
    auto tree_src_ids = indices_to_tree_source_order(tree, user_ids);
    REQUIRE_ARRAY_EQUAL(tree_ids, tree_src_ids, user_ids.size());
    for (size_t i = 0; i < 5000; i++) {
        REQUIRE(tree_x[tree_ids[i]] == x[i]);
    }
}

TEST_CASE("find box for particles") {
    TreeBuildInput<3> input;
    input.sources = random_pts<3>(2000, 0, 1, 20);
    input.targets = random_pts<3>(2000, 0, 1, 21);
    input.source_radii = random_vals(2000, 0.0, 0.03, 22);
    auto tree = build_tree<3,int32_t>(input, particle_count_cfg(12));

    for (size_t i = 0; i < tree.nsources; i++) {
        auto b = find_box_for_source(tree, i);
        REQUIRE(tree.box_source_starts[b] <= static_cast<int32_t>(i));
        REQUIRE(static_cast<int32_t>(i) < tree.box_source_starts[b] + tree.box_source_counts_nonchild[b]);
    }
    for (size_t i = 0; i < tree.ntargets; i++) {
        auto b = find_box_for_target(tree, i);
        REQUIRE(tree.is_leaf(b));
    }
    REQUIRE_THROWS_AS(find_box_for_target(tree, tree.ntargets), std::out_of_range);
}

TEST_CASE("find box for particles in user order") {
    TreeBuildInput<2> input;
    input.sources = random_pts<2>(1500, 0, 1, 30);
    input.targets = random_pts<2>(1200, 0, 1, 31);
    auto tree = build_tree<2,int32_t>(input, particle_count_cfg(10));

    // Tree position i holds user source user_source_ids[i].
    for (size_t i = 0; i < tree.nsources; i++) {
        size_t user_idx = static_cast<size_t>(tree.user_source_ids[i]);
        REQUIRE(find_box_for_user_source(tree, user_idx) == find_box_for_source(tree, i));
    }
    for (size_t i = 0; i < tree.ntargets; i++) {
        auto b = find_box_for_user_target(tree, i);
        auto tree_idx = tree.sorted_target_ids[i];
        REQUIRE(tree.box_target_starts[b] <= tree_idx);
        REQUIRE(tree_idx < tree.box_target_starts[b] + tree.box_target_counts_nonchild[b]);
        for (size_t d = 0; d < 2; d++) {
            REQUIRE(tree.targets[d][tree_idx] == input.targets[d][i]);
        }
    }
    REQUIRE_THROWS_AS(find_box_for_user_source(tree, tree.nsources), std::out_of_range);
    REQUIRE_THROWS_AS(find_box_for_user_target(tree, tree.ntargets), std::out_of_range);
}
