#pragma once
#include "array.h"
#include "kernels.h"
#include "matrix.h"
#include "vector.h"
#include <type_traits>

namespace cnum {

template <typename C>
using enable_if_array_t = std::enable_if_t<std::is_base_of<Array<typename C::value_type>, C>::value, int>;

// ======================================================================================
//                                   OPERATIONS
// ======================================================================================
// Floating element types (float, double). Every operation validates its
// operands before writing, so a throwing call leaves its output untouched.
// Outputs are written through the handle and may alias an input view.

namespace Ops {

// ----------------- Element-wise (any rank) -----------------
template <typename T> void add(const Array<T>& a, const Array<T>& b, const Array<T>& out);
template <typename T> void add(const Array<T>& a, typename Array<T>::value_type s, const Array<T>& out);
template <typename T> void subtract(const Array<T>& a, const Array<T>& b, const Array<T>& out);
template <typename T> void subtract(const Array<T>& a, typename Array<T>::value_type s, const Array<T>& out);
template <typename T> void multiply(const Array<T>& a, typename Array<T>::value_type s, const Array<T>& out);
template <typename T> void multiply(typename Array<T>::value_type s, const Array<T>& a, const Array<T>& out);
// Non-compact operands are processed one innermost run (row) at a time.
template <typename T> void element_wise_multiply(const Array<T>& a, const Array<T>& b, const Array<T>& out);
template <typename T> void divide(const Array<T>& a, const Array<T>& b, const Array<T>& out);
// out = a * as + b * bs
template <typename T>
void scaled_add(const Array<T>& a, typename Array<T>::value_type as, const Array<T>& b,
                typename Array<T>::value_type bs, const Array<T>& out);
// out = a * (1 - t) + b * t
template <typename T>
void lerp(const Array<T>& a, const Array<T>& b, typename Array<T>::value_type t, const Array<T>& out);

// ----------------- Reductions (any rank) -----------------
// mean of an empty array is 0; minimum/maximum of an empty array are +inf/-inf.
template <typename T> T mean(const Array<T>& a);
template <typename T> T mean_square(const Array<T>& a);
template <typename T> T minimum(const Array<T>& a);
template <typename T> T maximum(const Array<T>& a);

// ----------------- Vector -----------------
// Stop included; out.size() >= 2.
template <typename T> void linspace(T start, T stop, const Vector<T>& out);
template <typename T> Vector<T> linspace(T start, T stop, size_t count);
// Stop excluded; step non-zero and pointing from start to stop.
template <typename T> Vector<T> range(T start, T stop, T step);
// Sliding median over an odd window, edges replicated.
template <typename T> void median(const Vector<T>& in, size_t window, const Vector<T>& out);
template <typename T> void pad(const Vector<T>& in, size_t before, size_t after, PaddingMode mode, const Vector<T>& out);
// Valid-domain correlation: out[i] = sum_k in[i + k] * kernel[k]. Pass
// kernel.reversed() for a true convolution.
template <typename T> void convolve(const Vector<T>& in, const Vector<T>& kernel, const Vector<T>& out);
template <typename T> void cumsum(const Vector<T>& in, const Vector<T>& out);
// Element-wise
template <typename T> void multiply(const Vector<T>& a, const Vector<T>& b, const Vector<T>& out);

// ----------------- Matrix -----------------
template <typename T> void multiply(const Matrix<T>& a, const Matrix<T>& b, const Matrix<T>& out);
template <typename T> void multiply(const Matrix<T>& a, const Vector<T>& v, const Vector<T>& out);
template <typename T> void transpose(const Matrix<T>& src, const Matrix<T>& out);
// Image correlation; out-of-image pixels per edge.
void convolve(const Matrix<float>& in, const Matrix<float>& kernel, const Matrix<float>& out,
              EdgeMode edge = EdgeMode::background, float background = 0.0f);

// ----------------- Derived results -----------------

template <typename C, enable_if_array_t<C> = 0>
C add(const C& a, const C& b) { return a.derive([&](const C& out) { add(a, b, out); }); }

template <typename C, enable_if_array_t<C> = 0>
C add(const C& a, typename C::value_type s) { return a.derive([&](const C& out) { add(a, s, out); }); }

template <typename C, enable_if_array_t<C> = 0>
C subtract(const C& a, const C& b) { return a.derive([&](const C& out) { subtract(a, b, out); }); }

template <typename C, enable_if_array_t<C> = 0>
C subtract(const C& a, typename C::value_type s) { return a.derive([&](const C& out) { subtract(a, s, out); }); }

template <typename C, enable_if_array_t<C> = 0>
C multiply(const C& a, typename C::value_type s) { return a.derive([&](const C& out) { multiply(a, s, out); }); }

template <typename C, enable_if_array_t<C> = 0>
C multiply(typename C::value_type s, const C& a) { return a.derive([&](const C& out) { multiply(a, s, out); }); }

template <typename C, enable_if_array_t<C> = 0>
C element_wise_multiply(const C& a, const C& b) {
    return a.derive([&](const C& out) { element_wise_multiply(a, b, out); });
}

template <typename C, enable_if_array_t<C> = 0>
C divide(const C& a, const C& b) { return a.derive([&](const C& out) { divide(a, b, out); }); }

template <typename C, enable_if_array_t<C> = 0>
C scaled_add(const C& a, typename C::value_type as, const C& b, typename C::value_type bs) {
    return a.derive([&](const C& out) { scaled_add(a, as, b, bs, out); });
}

template <typename C, enable_if_array_t<C> = 0>
C lerp(const C& a, const C& b, typename C::value_type t) {
    return a.derive([&](const C& out) { lerp(a, b, t, out); });
}

template <typename T>
Vector<T> median(const Vector<T>& in, size_t window) {
    return in.derive([&](const Vector<T>& out) { median(in, window, out); });
}

template <typename T>
Vector<T> convolve(const Vector<T>& in, const Vector<T>& kernel) {
    if (kernel.size() == 0 || in.size() < kernel.size())
        throw std::invalid_argument("convolve: kernel of size " + std::to_string(kernel.size()) +
                                    " does not fit input of size " + std::to_string(in.size()));
    Vector<T> out(in.size() - kernel.size() + 1);
    convolve(in, kernel, out);
    return out;
}

template <typename T>
Vector<T> multiply(const Vector<T>& a, const Vector<T>& b) {
    return a.derive([&](const Vector<T>& out) { multiply(a, b, out); });
}

template <typename T>
Matrix<T> multiply(const Matrix<T>& a, const Matrix<T>& b) {
    if (a.columns() != b.rows())
        throw std::invalid_argument("multiply: inner dimensions differ " + shape_to_str(a.shape()) + " x " +
                                    shape_to_str(b.shape()));
    Matrix<T> out(a.rows(), b.columns());
    multiply(a, b, out);
    return out;
}

template <typename T>
Vector<T> multiply(const Matrix<T>& a, const Vector<T>& v) {
    if (a.columns() != v.size())
        throw std::invalid_argument("multiply: matrix " + shape_to_str(a.shape()) + " x vector " +
                                    shape_to_str(v.shape()));
    Vector<T> out(a.rows());
    multiply(a, v, out);
    return out;
}

inline Matrix<float> convolve(const Matrix<float>& in, const Matrix<float>& kernel,
                              EdgeMode edge = EdgeMode::background, float background = 0.0f) {
    return in.derive([&](const Matrix<float>& out) { convolve(in, kernel, out, edge, background); });
}

} // namespace Ops

// ======================================================================================
//                              MEMBER DEFINITIONS
// ======================================================================================

#define CNUM_REQUIRE_FLOATING(T) \
    static_assert(ElementTraits<T>::is_floating, "operation requires a floating element type")

template <typename T>
Vector<T> Vector<T>::linspace(T start, T stop, size_t count) {
    CNUM_REQUIRE_FLOATING(T);
    return Ops::linspace(start, stop, count);
}

template <typename T>
Vector<T> Vector<T>::range(T start, T stop, T step) {
    CNUM_REQUIRE_FLOATING(T);
    return Ops::range(start, stop, step);
}

template <typename T>
T Vector<T>::mean() const { CNUM_REQUIRE_FLOATING(T); return Ops::mean(*this); }

template <typename T>
T Vector<T>::mean_square() const { CNUM_REQUIRE_FLOATING(T); return Ops::mean_square(*this); }

template <typename T>
T Vector<T>::minimum() const { CNUM_REQUIRE_FLOATING(T); return Ops::minimum(*this); }

template <typename T>
T Vector<T>::maximum() const { CNUM_REQUIRE_FLOATING(T); return Ops::maximum(*this); }

template <typename T>
Vector<T> Vector<T>::padding(size_t before, size_t after, PaddingMode mode) const {
    CNUM_REQUIRE_FLOATING(T);
    Vector<T> out(before + this->size() + after);
    Ops::pad(*this, before, after, mode, out);
    return out;
}

// same: edge-pad by kernel.size() / 2 before and the rest after, one output per input.
template <typename T>
Vector<T> Vector<T>::convolving(const Vector& kernel, ConvolutionDomain domain, PaddingMode mode) const {
    CNUM_REQUIRE_FLOATING(T);
    size_t k = kernel.size();
    if (k == 0 || this->size() < k)
        throw std::invalid_argument("convolving: kernel of size " + std::to_string(k) +
                                    " does not fit input of size " + std::to_string(this->size()));
    if (domain == ConvolutionDomain::valid) return Ops::convolve(*this, kernel);

    Vector<T> padded = this->padding(k / 2, k - 1 - k / 2, mode);
    Vector<T> out(this->size());
    Ops::convolve(padded, kernel, out);
    return out;
}

template <typename T>
Vector<T> Vector<T>::cumsum() const {
    CNUM_REQUIRE_FLOATING(T);
    return derive([&](const Vector<T>& out) { Ops::cumsum(*this, out); });
}

template <typename T>
T Matrix<T>::mean() const { CNUM_REQUIRE_FLOATING(T); return Ops::mean(*this); }

template <typename T>
T Matrix<T>::mean_square() const { CNUM_REQUIRE_FLOATING(T); return Ops::mean_square(*this); }

template <typename T>
T Matrix<T>::minimum() const { CNUM_REQUIRE_FLOATING(T); return Ops::minimum(*this); }

template <typename T>
T Matrix<T>::maximum() const { CNUM_REQUIRE_FLOATING(T); return Ops::maximum(*this); }

template <typename T>
Matrix<T> Matrix<T>::transposed() const {
    CNUM_REQUIRE_FLOATING(T);
    Matrix<T> out(columns(), rows());
    Ops::transpose(*this, out);
    return out;
}

#undef CNUM_REQUIRE_FLOATING

// ======================================================================================
//                                   OPERATORS
// ======================================================================================

// ----------------- Vector -----------------
template <typename T>
Vector<T> operator+(const Vector<T>& a, typename Vector<T>::value_type s) { return Ops::add(a, s); }
template <typename T>
Vector<T> operator-(const Vector<T>& a, typename Vector<T>::value_type s) { return Ops::subtract(a, s); }
template <typename T>
Vector<T> operator*(const Vector<T>& a, typename Vector<T>::value_type s) { return Ops::multiply(a, s); }
template <typename T>
Vector<T> operator*(typename Vector<T>::value_type s, const Vector<T>& a) { return Ops::multiply(s, a); }
template <typename T>
Vector<T> operator*(const Vector<T>& a, const Vector<T>& b) { return Ops::multiply(a, b); }
template <typename T>
Vector<T> operator+(const Vector<T>& a, const Vector<T>& b) { return Ops::add(a, b); }
template <typename T>
Vector<T> operator-(const Vector<T>& a, const Vector<T>& b) { return Ops::subtract(a, b); }

template <typename T>
Vector<T>& operator+=(Vector<T>& a, typename Vector<T>::value_type s) { Ops::add(a, s, a); return a; }
template <typename T>
Vector<T>& operator-=(Vector<T>& a, typename Vector<T>::value_type s) { Ops::subtract(a, s, a); return a; }
template <typename T>
Vector<T>& operator+=(Vector<T>& a, const Vector<T>& b) { Ops::add(a, b, a); return a; }
template <typename T>
Vector<T>& operator-=(Vector<T>& a, const Vector<T>& b) { Ops::subtract(a, b, a); return a; }
template <typename T>
Vector<T>& operator*=(Vector<T>& a, typename Vector<T>::value_type s) { Ops::multiply(a, s, a); return a; }
template <typename T>
Vector<T>& operator*=(Vector<T>& a, const Vector<T>& b) { Ops::multiply(a, b, a); return a; }

// ----------------- Matrix -----------------
template <typename T>
Matrix<T> operator-(const Matrix<T>& a, const Matrix<T>& b) { return Ops::subtract(a, b); }
template <typename T>
Matrix<T> operator+(const Matrix<T>& a, const Matrix<T>& b) { return Ops::add(a, b); }
template <typename T>
Matrix<T> operator*(const Matrix<T>& a, const Matrix<T>& b) { return Ops::multiply(a, b); }
template <typename T>
Vector<T> operator*(const Matrix<T>& a, const Vector<T>& v) { return Ops::multiply(a, v); }
template <typename T>
Matrix<T> operator/(const Matrix<T>& a, typename Matrix<T>::value_type s) { return Ops::multiply(a, T(1) / s); }
template <typename T>
Matrix<T> operator*(const Matrix<T>& a, typename Matrix<T>::value_type s) { return Ops::multiply(a, s); }
template <typename T>
Matrix<T> operator*(typename Matrix<T>::value_type s, const Matrix<T>& a) { return Ops::multiply(s, a); }
template <typename T>
Matrix<T>& operator*=(Matrix<T>& a, typename Matrix<T>::value_type s) { Ops::multiply(a, s, a); return a; }
template <typename T>
Matrix<T>& operator/=(Matrix<T>& a, const Matrix<T>& b) { Ops::divide(a, b, a); return a; }

} // namespace cnum
