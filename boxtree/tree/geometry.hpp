#pragma once
#include <array>
#include <cmath>
#include <cstddef>
#include <limits>

#define BINOPVECVEC(name,op) \
    template <size_t dim>\
    inline std::array<double,dim> name(const std::array<double,dim>& a,\
            const std::array<double,dim>& b) {\
        std::array<double,dim> out;\
        for (size_t d = 0; d < dim; d++) {\
            out[d] = a[d] op b[d];\
        }\
        return out;\
    }

#define BINOPVECSCALAR(name,op) \
    template <size_t dim>\
    inline std::array<double,dim> name(const std::array<double,dim>& a, double b) {\
        std::array<double,dim> out;\
        for (size_t d = 0; d < dim; d++) {\
            out[d] = a[d] op b;\
        }\
        return out;\
    }

#define BINOP(name, op)\
    BINOPVECVEC(name, op)\
    BINOPVECSCALAR(name, op)

BINOP(add,+)
BINOP(sub,-)

#undef BINOPVECVEC
#undef BINOPVECSCALAR
#undef BINOP

template <size_t dim>
struct BoundingBox {
    std::array<double,dim> min;
    std::array<double,dim> max;

    static BoundingBox<dim> empty() {
        BoundingBox<dim> out;
        out.min.fill(std::numeric_limits<double>::infinity());
        out.max.fill(-std::numeric_limits<double>::infinity());
        return out;
    }

    double max_extent() const {
        auto extent = sub(max, min);
        double out = 0.0;
        for (size_t d = 0; d < dim; d++) {
            out = std::fmax(out, extent[d]);
        }
        return out;
    }

    bool contains(const std::array<double,dim>& pt) const {
        for (size_t d = 0; d < dim; d++) {
            if (!(min[d] <= pt[d] && pt[d] < max[d])) {
                return false;
            }
        }
        return true;
    }
};

template <size_t dim>
BoundingBox<dim> merge(const BoundingBox<dim>& a, const BoundingBox<dim>& b) {
    BoundingBox<dim> out;
    for (size_t d = 0; d < dim; d++) {
        out.min[d] = std::fmin(a.min[d], b.min[d]);
        out.max[d] = std::fmax(a.max[d], b.max[d]);
    }
    return out;
}

// Stretching the extent keeps the largest coordinate strictly below the top of
// the root box, so a scaled coordinate never reaches 1.
constexpr double root_extent_stretch_factor = 1e-4;

template <size_t dim>
BoundingBox<dim> make_root_box(const BoundingBox<dim>& bbox) {
    double extent = bbox.max_extent();
    if (extent == 0.0) {
        extent = 1.0;
    }
    extent *= 1.0 + root_extent_stretch_factor;

    BoundingBox<dim> out;
    out.min = bbox.min;
    out.max = add(bbox.min, extent);
    return out;
}
