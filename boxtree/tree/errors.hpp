#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

struct TreeBuildError: public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct ConfigurationError: public TreeBuildError {
    using TreeBuildError::TreeBuildError;
};

struct DegenerateGeometryError: public TreeBuildError {
    using TreeBuildError::TreeBuildError;
};

// Many (nearly) coincident particles can keep a box over capacity no matter
// how far it is subdivided.
struct ConvergenceError: public TreeBuildError {
    int level;
    size_t nboxes;

    ConvergenceError(int level, size_t nboxes):
        TreeBuildError(
            "tree build did not converge: level " + std::to_string(level) +
            " exceeds the maximum level with " + std::to_string(nboxes) +
            " boxes allocated. Are there many coincident particles?"
        ),
        level(level),
        nboxes(nboxes)
    {}
};

struct CapacityOverflowError: public TreeBuildError {
    int level;
    long long nboxes;

    CapacityOverflowError(int level, long long nboxes):
        TreeBuildError(
            "box count " + std::to_string(nboxes) + " at level " +
            std::to_string(level) + " does not fit in the box id type"
        ),
        level(level),
        nboxes(nboxes)
    {}
};
