#pragma once
#include <algorithm>
#include <array>
#include <cstddef>
#include <initializer_list>
#include <vector>

namespace cnum {

// ======================================================================================
//                              SMALL VECTOR
// ======================================================================================
// Shape and stride lists. Up to N entries live inline; past that every entry
// moves to the heap, and moves back once resized to N or fewer.

template <typename T, size_t N>
class SmallVector {
public:
    SmallVector() = default;
    SmallVector(size_t count, const T& value) { resize(count, value); }
    SmallVector(std::initializer_list<T> values) {
        resize(values.size());
        std::copy(values.begin(), values.end(), begin());
    }

    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    bool spilled() const { return size_ > N; }

    T* data() { return spilled() ? heap_.data() : inline_.data(); }
    const T* data() const { return spilled() ? heap_.data() : inline_.data(); }

    T& operator[](size_t i) { return data()[i]; }
    const T& operator[](size_t i) const { return data()[i]; }
    T& back() { return data()[size_ - 1]; }
    const T& back() const { return data()[size_ - 1]; }

    T* begin() { return data(); }
    T* end() { return data() + size_; }
    const T* begin() const { return data(); }
    const T* end() const { return data() + size_; }

    // New entries take value.
    void resize(size_t n, const T& value = T()) {
        if (n <= N) {
            if (spilled()) std::copy(heap_.begin(), heap_.begin() + n, inline_.begin());
            heap_.clear();
            for (size_t i = size_; i < n; ++i) inline_[i] = value;
        } else {
            if (!spilled()) heap_.assign(inline_.begin(), inline_.begin() + size_);
            heap_.resize(n, value);
        }
        size_ = n;
    }

    void push_back(const T& value) { resize(size_ + 1, value); }

    bool operator==(const SmallVector& other) const {
        return size_ == other.size_ && std::equal(begin(), end(), other.begin());
    }
    bool operator!=(const SmallVector& other) const { return !(*this == other); }

private:
    std::array<T, N> inline_{};
    std::vector<T> heap_;
    size_t size_ = 0;
};

} // namespace cnum
