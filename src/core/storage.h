#pragma once
#include "memory_pool.h"
#include "small_vector.h"
#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>

namespace cnum {

using Shape = SmallVector<size_t, 4>;
using Strides = SmallVector<std::ptrdiff_t, 4>;

inline std::string shape_to_str(const Shape& shape) {
    std::ostringstream os;
    os << "(";
    for (size_t i = 0; i < shape.size(); ++i) {
        os << shape[i];
        if (i + 1 < shape.size()) os << ", ";
    }
    os << ")";
    return os.str();
}

inline size_t shape_numel(const Shape& shape) {
    size_t n = 1;
    for (auto s : shape) n *= s;
    return n;
}

// Row-major strides, innermost dimension last.
inline Strides canonical_strides(const Shape& shape) {
    Strides st(shape.size(), 0);
    std::ptrdiff_t expected = 1;
    for (int i = (int)shape.size() - 1; i >= 0; --i) {
        st[i] = expected;
        expected *= (std::ptrdiff_t)shape[i];
    }
    return st;
}

// ----------------- Storage -----------------
// A buffer plus the shape/stride/offset that select elements from it. Views
// share the buffer; the buffer goes back to the pool with its last holder.
template <typename T>
class Storage {
public:
    Storage() = default;

    explicit Storage(const Shape& shape)
        : buffer_(Buffer<T>::allocate(shape_numel(shape))),
          offset_(0),
          shape_(shape),
          strides_(canonical_strides(shape)) {}

    Storage(Buffer<T> buffer, std::ptrdiff_t offset, const Shape& shape, const Strides& strides)
        : buffer_(std::move(buffer)), offset_(offset), shape_(shape), strides_(strides) {
        check_bounds();
    }

    size_t rank() const { return shape_.size(); }
    size_t size() const { return shape_numel(shape_); }
    const Shape& shape() const { return shape_; }
    const Strides& strides() const { return strides_; }
    std::ptrdiff_t offset() const { return offset_; }
    const Buffer<T>& buffer() const { return buffer_; }

    // Extent-1 dimensions do not constrain the layout.
    bool is_compact() const {
        std::ptrdiff_t expected = 1;
        for (int i = (int)rank() - 1; i >= 0; --i) {
            if (shape_[i] != 1) {
                if (strides_[i] != expected) return false;
                expected *= (std::ptrdiff_t)shape_[i];
            }
        }
        return true;
    }

    // Element at the zero multi-index.
    T* origin() const { return buffer_.get() + offset_; }

    std::ptrdiff_t position(const size_t* index) const {
        std::ptrdiff_t pos = 0;
        for (size_t d = 0; d < rank(); ++d) pos += (std::ptrdiff_t)index[d] * strides_[d];
        return pos;
    }

    Storage view(std::ptrdiff_t offset, const Shape& shape, const Strides& strides) const {
        return Storage(buffer_, offset, shape, strides);
    }

    bool shares_buffer(const Storage& other) const {
        return buffer_.get() != nullptr && buffer_.get() == other.buffer_.get();
    }

private:
    void check_bounds() const {
        if (shape_.size() != strides_.size())
            throw std::invalid_argument("Storage: shape and strides rank differ");
        if (size() == 0) return;
        std::ptrdiff_t lo = offset_, hi = offset_;
        for (size_t d = 0; d < rank(); ++d) {
            std::ptrdiff_t span = (std::ptrdiff_t)(shape_[d] - 1) * strides_[d];
            if (span < 0) lo += span; else hi += span;
        }
        if (lo < 0 || hi >= (std::ptrdiff_t)buffer_.capacity)
            throw std::out_of_range("Storage: view " + shape_to_str(shape_) + " exceeds buffer bounds");
    }

    Buffer<T> buffer_;
    std::ptrdiff_t offset_ = 0;
    Shape shape_;
    Strides strides_;
};

} // namespace cnum
