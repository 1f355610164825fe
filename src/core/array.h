#pragma once
#include "access.h"
#include "element.h"
#include "storage.h"
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace cnum {

// ======================================================================================
//                              DIMENSIONAL ARRAY
// ======================================================================================
// Rank-generic base of Vector and Matrix. An Array is a handle: copying it
// yields another view of the same buffer, and element writes go through const
// handles the same way they go through a pointer. Use clone() for a deep copy.

template <typename T>
class Array {
public:
    using value_type = T;

    size_t rank() const { return storage_.rank(); }
    size_t size() const { return storage_.size(); }
    bool empty() const { return size() == 0; }
    const Shape& shape() const { return storage_.shape(); }
    bool is_compact() const { return storage_.is_compact(); }
    const Storage<T>& storage() const { return storage_; }

    // Element at the zero index.
    T* data() const { return storage_.origin(); }

    bool shares_buffer(const Array& other) const { return storage_.shares_buffer(other.storage_); }
    long use_count() const { return storage_.buffer().use_count(); }

    void fill(T value) const {
        with_linearized_accesses(storage_, [&](LinearAccess<T> acc) {
            for (size_t i = 0; i < acc.count; ++i) acc.base[(std::ptrdiff_t)i * acc.stride] = value;
        });
    }

    // Copies src element-wise into this view. Shapes must match.
    void assign(const Array& src) const {
        if (shape() != src.shape())
            throw std::invalid_argument("assign: shape mismatch " + shape_to_str(shape()) + " vs " + shape_to_str(src.shape()));
        if (shares_buffer(src)) {
            // Overlap is possible; stage through a temporary
            std::vector<T> values = src.to_vector();
            size_t k = 0;
            with_linearized_accesses(storage_, [&](LinearAccess<T> acc) {
                for (size_t i = 0; i < acc.count; ++i) acc.base[(std::ptrdiff_t)i * acc.stride] = values[k++];
            });
            return;
        }
        with_linearized_accesses(src.storage_, storage_, [](LinearAccess<T> s, LinearAccess<T> d) {
            for (size_t i = 0; i < s.count; ++i)
                d.base[(std::ptrdiff_t)i * d.stride] = s.base[(std::ptrdiff_t)i * s.stride];
        });
    }

    template <typename G>
    void fill_random(T min, T max, G& gen) const {
        with_linearized_accesses(storage_, [&](LinearAccess<T> acc) {
            for (size_t i = 0; i < acc.count; ++i)
                acc.base[(std::ptrdiff_t)i * acc.stride] = ElementTraits<T>::random(min, max, gen);
        });
    }

    // Elements in logical (row-major) order.
    std::vector<T> to_vector() const {
        std::vector<T> out;
        out.reserve(size());
        with_linearized_accesses(storage_, [&](LinearAccess<T> acc) {
            for (size_t i = 0; i < acc.count; ++i) out.push_back(acc.base[(std::ptrdiff_t)i * acc.stride]);
        });
        return out;
    }

    bool equals(const Array& other) const {
        if (shape() != other.shape()) return false;
        bool same = true;
        with_linearized_accesses(storage_, other.storage_, [&](LinearAccess<T> a, LinearAccess<T> b) {
            for (size_t i = 0; i < a.count && same; ++i)
                same = a.base[(std::ptrdiff_t)i * a.stride] == b.base[(std::ptrdiff_t)i * b.stride];
        });
        return same;
    }

    // e.g. "(2, 3) float32", with " strided" for non-compact views.
    void print_shape(std::ostream& os = std::cout) const {
        os << shape_to_str(shape()) << " " << dtype_to_str(ElementTraits<T>::dtype);
        if (!is_compact()) os << " strided";
        os << "\n";
    }

protected:
    Array() = default;
    explicit Array(Storage<T> storage) : storage_(std::move(storage)) {}

    Storage<T> storage_;
};

template <typename T>
bool operator==(const Array<T>& a, const Array<T>& b) { return a.equals(b); }

template <typename T>
bool operator!=(const Array<T>& a, const Array<T>& b) { return !a.equals(b); }

// Debugging / testing: 0, 1, 2, ... in logical order.
template <typename T, enable_if_additive_t<T> = 0>
void set_index_ramp(const Array<T>& a) {
    T val = ElementTraits<T>::none();
    with_linearized_accesses(a.storage(), [&](LinearAccess<T> acc) {
        for (size_t i = 0; i < acc.count; ++i) {
            acc.base[(std::ptrdiff_t)i * acc.stride] = val;
            val += ElementTraits<T>::one();
        }
    });
}

} // namespace cnum
