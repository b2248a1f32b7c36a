#pragma once
#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>
#include <vector>
#include <pybind11/numpy.h>

template <typename T>
using NPArray = pybind11::array_t<T,pybind11::array::c_style | pybind11::array::forcecast>;
using NPArrayD = NPArray<double>;

inline std::vector<size_t> calc_strides(const std::vector<size_t>& shape, size_t unit_size) {
    std::vector<size_t> strides(shape.size());
    strides[shape.size() - 1] = unit_size;
    for (int i = shape.size() - 2; i >= 0; i--) {
        strides[i] = strides[i + 1] * shape[i + 1];
    }
    return strides;
}

// With a base object, the array is a view that keeps base alive. Without
// one, it owns a fresh (copied) buffer.
template <typename T>
struct ArrayMaker {
    static NPArray<T> make_array(const std::vector<size_t>& shape,
        const T* buffer_ptr = nullptr, pybind11::handle base = pybind11::handle())
    {
        return pybind11::array(
            pybind11::dtype::of<T>(), shape,
            calc_strides(shape, sizeof(T)), buffer_ptr, base
        );
    }
};

template <typename T, size_t dim>
struct ArrayMaker<std::array<T,dim>> {
    static NPArray<T> make_array(const std::vector<size_t>& shape_in,
        const std::array<T,dim>* buffer_ptr_in = nullptr,
        pybind11::handle base = pybind11::handle())
    {
        auto shape = shape_in;
        shape.push_back(dim);
        auto* buffer_ptr = reinterpret_cast<const T*>(buffer_ptr_in);
        return ArrayMaker<T>::make_array(shape, buffer_ptr, base);
    }
};

template <typename T>
auto make_array(const std::vector<size_t>& shape, const T* buffer_ptr = nullptr,
    pybind11::handle base = pybind11::handle())
{
    return ArrayMaker<T>::make_array(shape, buffer_ptr, base);
}

template <typename T, typename NPT>
T* as_ptr(NPArray<NPT>& np_arr) {
    return reinterpret_cast<T*>(np_arr.request().ptr);
}

template <typename T, typename NPT>
std::vector<T> get_vector(NPArray<NPT>& np_arr) {
    auto buf = np_arr.request();
    if (buf.ndim != 1) {
        throw std::runtime_error("parameter requires a 1-d array.");
    }
    auto* first = reinterpret_cast<NPT*>(buf.ptr);
    auto* last = first + buf.shape[0];
    return std::vector<T>(first, last);
}

template <size_t D>
void check_shape(NPArrayD& arr) {
    auto buf = arr.request();
    if (buf.ndim != 2 || buf.shape[0] != static_cast<pybind11::ssize_t>(D)) {
        std::string msg = "parameter requires ";
        msg += std::to_string(D);
        msg += " x n array.";
        throw std::runtime_error(msg);
    }
}

// (dim, n) array -> one vector per axis.
template <size_t D>
std::array<std::vector<double>,D> get_coords(NPArrayD& arr) {
    check_shape<D>(arr);
    auto buf = arr.request();
    size_t n = buf.shape[1];
    auto* ptr = reinterpret_cast<double*>(buf.ptr);
    std::array<std::vector<double>,D> out;
    for (size_t d = 0; d < D; d++) {
        out[d].assign(ptr + d * n, ptr + (d + 1) * n);
    }
    return out;
}

template <size_t D>
NPArrayD coords_to_array(const std::array<std::vector<double>,D>& coords) {
    size_t n = coords[0].size();
    auto out = make_array<double>({D, n});
    auto* out_ptr = as_ptr<double>(out);
    for (size_t d = 0; d < D; d++) {
        std::copy(coords[d].begin(), coords[d].end(), out_ptr + d * n);
    }
    return out;
}

// A read-only numpy view of a vector member that keeps its owner alive.
#define NPARRAYPROP(type, name)\
    def_property_readonly(#name, [] (pybind11::object self) {\
        auto& op = self.cast<type&>();\
        return make_array({op.name.size()}, op.name.data(), self);\
    })

#define COORDSPROP(type, name)\
    def_property_readonly(#name, [] (const type& op) {\
        return coords_to_array(op.name);\
    })
