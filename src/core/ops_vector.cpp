#include "ops.h"
#include "ops_support.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace cnum {
namespace Ops {

using detail::check_same_shape;
using detail::overlaps;
using detail::write_through;

// ----------------- Generation -----------------

template <typename T>
void linspace(T start, T stop, const Vector<T>& out) {
    size_t n = out.size();
    if (n < 2) throw std::invalid_argument("linspace: count must be at least 2, got " + std::to_string(n));
    LinearAccess<T> o = out.access();
    cpu::kernels<T>().vramp(start, (stop - start) / (T)(n - 1), o.base, o.stride, n);
    out[n - 1] = stop;
}

template <typename T>
Vector<T> linspace(T start, T stop, size_t count) {
    if (count < 2) throw std::invalid_argument("linspace: count must be at least 2, got " + std::to_string(count));
    Vector<T> out(count);
    linspace(start, stop, out);
    return out;
}

template <typename T>
Vector<T> range(T start, T stop, T step) {
    if (!std::isfinite(start) || !std::isfinite(stop) || !std::isfinite(step))
        throw std::invalid_argument("range: bounds and step must be finite");
    if (step == T(0)) throw std::invalid_argument("range: step must be non-zero");
    T span = stop - start;
    if ((span > T(0) && step < T(0)) || (span < T(0) && step > T(0)))
        throw std::invalid_argument("range: step points away from stop");

    double steps = std::ceil((double)span / (double)step);
    if (steps >= (double)std::numeric_limits<size_t>::max())
        throw std::invalid_argument("range: " + std::to_string(steps) + " elements requested");
    size_t count = (size_t)steps;
    Vector<T> out(count);
    if (count) {
        LinearAccess<T> o = out.access();
        cpu::kernels<T>().vramp(start, step, o.base, o.stride, count);
    }
    return out;
}

// ----------------- Filters -----------------

template <typename T>
void median(const Vector<T>& in, size_t window, const Vector<T>& out) {
    if (window == 0 || window % 2 == 0)
        throw std::invalid_argument("median: window must be odd and positive, got " + std::to_string(window));
    check_same_shape("median", in, out);
    size_t n = in.size();
    if (n == 0) return;

    // Edge-replicated copy, also decouples in from out
    size_t half = window / 2;
    Vector<T> padded = in.padding(half, half, PaddingMode::edge);

    std::vector<T> values(window);
    for (size_t i = 0; i < n; ++i) {
        for (size_t k = 0; k < window; ++k) values[k] = padded[i + k];
        std::sort(values.begin(), values.end());
        out[i] = values[half];
    }
}

template <typename T>
void pad(const Vector<T>& in, size_t before, size_t after, PaddingMode mode, const Vector<T>& out) {
    if (mode != PaddingMode::edge) throw std::invalid_argument("pad: unsupported padding mode");
    size_t n = in.size();
    if (n == 0) throw std::invalid_argument("pad: edge padding needs a non-empty input");
    if (out.size() != before + n + after)
        throw std::invalid_argument("pad: output size " + std::to_string(out.size()) + " != " +
                                    std::to_string(before) + " + " + std::to_string(n) + " + " +
                                    std::to_string(after));

    Vector<T> src = out.shares_buffer(in) ? in.clone() : in;
    T first = src.first();
    T last = src.last();
    out.slice(before, before + n).assign(src);
    out.slice(0, before).fill(first);
    out.slice(before + n, out.size()).fill(last);
}

template <typename T>
void convolve(const Vector<T>& in, const Vector<T>& kernel, const Vector<T>& out) {
    size_t k = kernel.size();
    if (k == 0) throw std::invalid_argument("convolve: empty kernel");
    if (in.size() < k)
        throw std::invalid_argument("convolve: input of size " + std::to_string(in.size()) +
                                    " shorter than kernel of size " + std::to_string(k));
    size_t n_out = in.size() - k + 1;
    if (out.size() != n_out)
        throw std::invalid_argument("convolve: output size " + std::to_string(out.size()) + " != " +
                                    std::to_string(n_out));

    LinearAccess<T> x = in.access();
    LinearAccess<T> w = kernel.access();
    write_through(out, out.shares_buffer(in) || out.shares_buffer(kernel), [&](const Array<T>& target) {
        LinearAccess<T> o = vector_access(target.storage());
        cpu::kernels<T>().conv(x.base, x.stride, w.base, w.stride, o.base, o.stride, n_out, k);
    });
}

// ----------------- Running sum -----------------
// The kernel leaves out[0] = 0 and never adds in[0], so seed out[1] with the
// first two inputs and restore out[0] afterwards.

template <typename T>
void cumsum(const Vector<T>& in, const Vector<T>& out) {
    size_t n = in.size();
    if (n == 0) throw std::invalid_argument("cumsum: empty input");
    check_same_shape("cumsum", in, out);

    T a0 = in[0];
    if (n == 1) {
        out[0] = a0;
        return;
    }
    T a1 = in[1];
    out.assign(in);
    out[1] = a0 + a1;
    LinearAccess<T> o = out.access();
    cpu::kernels<T>().vrsum(o.base, o.stride, T(1), o.base, o.stride, n);
    out[0] = a0;
}

// ----------------- Element-wise -----------------

template <typename T>
void multiply(const Vector<T>& a, const Vector<T>& b, const Vector<T>& out) {
    element_wise_multiply<T>(a, b, out);
}

#define CNUM_INSTANTIATE_VECTOR_OPS(T)                                                           \
    template void linspace<T>(T, T, const Vector<T>&);                                          \
    template Vector<T> linspace<T>(T, T, size_t);                                               \
    template Vector<T> range<T>(T, T, T);                                                       \
    template void median<T>(const Vector<T>&, size_t, const Vector<T>&);                        \
    template void pad<T>(const Vector<T>&, size_t, size_t, PaddingMode, const Vector<T>&);      \
    template void convolve<T>(const Vector<T>&, const Vector<T>&, const Vector<T>&);            \
    template void cumsum<T>(const Vector<T>&, const Vector<T>&);                                \
    template void multiply<T>(const Vector<T>&, const Vector<T>&, const Vector<T>&);

CNUM_INSTANTIATE_VECTOR_OPS(float)
CNUM_INSTANTIATE_VECTOR_OPS(double)

#undef CNUM_INSTANTIATE_VECTOR_OPS

} // namespace Ops
} // namespace cnum
