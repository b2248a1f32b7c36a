#pragma once

#include <algorithm>
#include <cstddef>
#include <vector>
#include <omp.h>

// The three primitives the tree builder is written against: an elementwise
// map, an (optionally segmented) inclusive scan and a reduction. Everything
// runs on the OpenMP thread pool, but results never depend on the number of
// threads.

template <typename F>
void parallel_for(size_t n, const F& f) {
#pragma omp parallel for
    for (size_t i = 0; i < n; i++) {
        f(i);
    }
}

struct non_segmented {
    bool operator()(size_t) const { return false; }
};

inline size_t n_scan_blocks(size_t n) {
    size_t n_threads = static_cast<size_t>(omp_get_max_threads());
    return std::max<size_t>(1, std::min(n, 4 * n_threads));
}

// Inclusive scan in the style of a GPU scan kernel:
//   input(i) -> T            evaluated exactly once per element
//   combine(a, b, across)    associative; across == true means b starts a
//                            new segment somewhere at or before its end
//   is_segment_start(i)      segment boundary predicate
//   output(i, prev, item)    prev is the previous inclusive value, or neutral
//                            at the start of the array or of a segment
//
// Two passes over blocks: the first evaluates inputs and scans each block
// locally, a short sequential pass combines the block totals, and the second
// applies the carry and runs the output statements.
template <typename T, typename InputF, typename CombineF, typename SegF, typename OutputF>
void inclusive_scan(size_t n, T neutral, const InputF& input, const CombineF& combine,
    const SegF& is_segment_start, const OutputF& output)
{
    if (n == 0) {
        return;
    }

    size_t n_blocks = n_scan_blocks(n);
    size_t block_size = (n + n_blocks - 1) / n_blocks;
    n_blocks = (n + block_size - 1) / block_size;

    std::vector<T> local(n);
    std::vector<char> seg_start(n);
    std::vector<T> block_total(n_blocks);
    std::vector<char> block_has_seg_start(n_blocks);

#pragma omp parallel for
    for (size_t b = 0; b < n_blocks; b++) {
        size_t start = b * block_size;
        size_t end = std::min(n, start + block_size);
        bool any_seg_start = false;
        T acc = neutral;
        for (size_t i = start; i < end; i++) {
            seg_start[i] = is_segment_start(i);
            any_seg_start = any_seg_start || seg_start[i];
            T item = input(i);
            if (i == start) {
                acc = item;
            } else {
                acc = combine(acc, item, static_cast<bool>(seg_start[i]));
            }
            local[i] = acc;
        }
        block_total[b] = acc;
        block_has_seg_start[b] = any_seg_start;
    }

    std::vector<T> carry(n_blocks, neutral);
    for (size_t b = 1; b < n_blocks; b++) {
        if (b == 1) {
            carry[b] = block_total[0];
        } else {
            carry[b] = combine(carry[b - 1], block_total[b - 1],
                static_cast<bool>(block_has_seg_start[b - 1]));
        }
    }

#pragma omp parallel for
    for (size_t b = 0; b < n_blocks; b++) {
        size_t start = b * block_size;
        size_t end = std::min(n, start + block_size);
        bool seen_seg_start = false;
        T prev = carry[b];
        for (size_t i = start; i < end; i++) {
            seen_seg_start = seen_seg_start || seg_start[i];
            if (seg_start[i] || i == 0) {
                prev = neutral;
            }
            T item = local[i];
            if (b > 0 && !seen_seg_start) {
                item = combine(carry[b], local[i], false);
            }
            output(i, prev, item);
            prev = item;
        }
    }
}

template <typename T, typename MapF, typename CombineF>
T parallel_reduce(size_t n, T neutral, const MapF& map, const CombineF& combine) {
    if (n == 0) {
        return neutral;
    }

    size_t n_blocks = n_scan_blocks(n);
    size_t block_size = (n + n_blocks - 1) / n_blocks;
    n_blocks = (n + block_size - 1) / block_size;

    std::vector<T> partial(n_blocks, neutral);

#pragma omp parallel for
    for (size_t b = 0; b < n_blocks; b++) {
        size_t start = b * block_size;
        size_t end = std::min(n, start + block_size);
        T acc = neutral;
        for (size_t i = start; i < end; i++) {
            acc = combine(acc, map(i));
        }
        partial[b] = acc;
    }

    T out = neutral;
    for (size_t b = 0; b < n_blocks; b++) {
        out = combine(out, partial[b]);
    }
    return out;
}
