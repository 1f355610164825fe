#pragma once
#include <algorithm>
#include <cstddef>
#include <limits>

namespace cnum {

// Combiners for reductions evaluated one linearized run at a time.

// Count-weighted mean of per-run means, accumulated in double. Empty input yields 0.
template <typename T>
struct MeanFold {
    double weighted_sum = 0.0;
    size_t count = 0;

    void add(T run_mean, size_t run_count) {
        weighted_sum += (double)run_mean * (double)run_count;
        count += run_count;
    }
    T result() const { return count ? (T)(weighted_sum / (double)count) : T(0); }
};

template <typename T>
struct MinFold {
    T value = std::numeric_limits<T>::infinity();

    void add(T run_min, size_t) { value = std::min(value, run_min); }
    T result() const { return value; }
};

template <typename T>
struct MaxFold {
    T value = -std::numeric_limits<T>::infinity();

    void add(T run_max, size_t) { value = std::max(value, run_max); }
    T result() const { return value; }
};

} // namespace cnum
