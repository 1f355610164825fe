#pragma once
#include "array.h"
#include <stdexcept>
#include <string>

namespace cnum {
namespace detail {

// Compact temporary of any rank.
template <typename T>
class Scratch : public Array<T> {
public:
    explicit Scratch(const Shape& shape) : Array<T>(Storage<T>(shape)) {}
};

template <typename T>
void check_same_shape(const char* op, const Array<T>& a, const Array<T>& b) {
    if (a.shape() != b.shape())
        throw std::invalid_argument(std::string(op) + ": shape mismatch " + shape_to_str(a.shape()) + " vs " +
                                    shape_to_str(b.shape()));
}

template <typename T>
bool same_view(const Array<T>& a, const Array<T>& b) {
    return a.shares_buffer(b) && a.storage().offset() == b.storage().offset() &&
           a.storage().strides() == b.storage().strides();
}

// Output overlaps an input through a different view.
template <typename T>
bool overlaps(const Array<T>& out, const Array<T>& in) {
    return out.shares_buffer(in) && !same_view(out, in);
}

// Runs compute(target) on out directly, or on a compact temporary that is
// copied into out afterwards.
template <typename T, typename F>
void write_through(const Array<T>& out, bool staged, F&& compute) {
    if (!staged) {
        compute(out);
        return;
    }
    Scratch<T> tmp(out.shape());
    compute(static_cast<const Array<T>&>(tmp));
    out.assign(tmp);
}

} // namespace detail
} // namespace cnum
