#pragma once
#include "array.h"
#include <cstdlib>
#include <initializer_list>
#include <ostream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace cnum {

enum class PaddingMode { edge };
enum class ConvolutionDomain { same, valid };

// ======================================================================================
//                                   VECTOR
// ======================================================================================

template <typename T>
class Vector : public Array<T> {
public:
    Vector() : Vector(0) {}
    explicit Vector(size_t size) : Array<T>(Storage<T>(Shape{size})) {}
    Vector(size_t size, T value) : Vector(size) { this->fill(value); }

    Vector(std::initializer_list<T> values) : Vector(values.size()) {
        T* p = this->data();
        for (const T& v : values) *p++ = v;
    }

    explicit Vector(Storage<T> storage) : Array<T>(std::move(storage)) {
        if (this->rank() != 1)
            throw std::invalid_argument("Vector: storage has rank " + std::to_string(this->rank()));
    }

    static Vector from_vector(const std::vector<T>& values) {
        Vector out(values.size());
        for (size_t i = 0; i < values.size(); ++i) out.data()[i] = values[i];
        return out;
    }

    static Vector zeros(size_t n) { return Vector(n, ElementTraits<T>::none()); }
    static Vector ones(size_t n) { return Vector(n, ElementTraits<T>::one()); }

    static Vector random(size_t n, T min, T max) {
        std::random_device rd;
        std::mt19937 gen(rd());
        Vector out(n);
        out.fill_random(min, max, gen);
        return out;
    }

    // Defined in ops.h (floating element types only)
    static Vector linspace(T start, T stop, size_t count);
    static Vector range(T start, T stop, T step = T(1));

    std::ptrdiff_t stride() const { return this->storage_.strides()[0]; }
    LinearAccess<T> access() const { return vector_access(this->storage_); }

    T& operator[](size_t i) const { return this->data()[(std::ptrdiff_t)i * stride()]; }

    T& at(size_t i) const {
        if (i >= this->size())
            throw std::out_of_range("Vector::at: index " + std::to_string(i) + " out of range for size " +
                                    std::to_string(this->size()));
        return (*this)[i];
    }

    T& first() const {
        if (this->empty()) throw std::out_of_range("Vector::first: empty vector");
        return (*this)[0];
    }

    T& last() const {
        if (this->empty()) throw std::out_of_range("Vector::last: empty vector");
        return (*this)[this->size() - 1];
    }

    // Elements [start, end) as a view.
    Vector slice(size_t start, size_t end) const {
        if (start > end || end > this->size())
            throw std::out_of_range("Vector::slice: [" + std::to_string(start) + ", " + std::to_string(end) +
                                    ") out of range for size " + std::to_string(this->size()));
        const Storage<T>& s = this->storage_;
        return Vector(s.view(s.offset() + (std::ptrdiff_t)start * stride(), Shape{end - start}, Strides{stride()}));
    }

    // Every step-th element as a view. A negative step walks back from the last element.
    Vector strided(std::ptrdiff_t step) const {
        if (step == 0) throw std::invalid_argument("Vector::strided: step must be non-zero");
        const Storage<T>& s = this->storage_;
        size_t n = this->size();
        size_t mag = (size_t)std::llabs(step);
        size_t count = (n + mag - 1) / mag;
        std::ptrdiff_t offset = s.offset();
        if (step < 0 && n > 0) offset += (std::ptrdiff_t)(n - 1) * stride();
        return Vector(s.view(offset, Shape{count}, Strides{stride() * step}));
    }

    Vector reversed() const { return strided(-1); }

    Vector clone() const {
        Vector out(this->size());
        out.assign(*this);
        return out;
    }

    // New compact vector of the same size, filled by f(out).
    template <typename F>
    Vector derive(F&& f) const {
        Vector out(this->size());
        f(out);
        return out;
    }

    // Defined in ops.h (floating element types only)
    T mean() const;
    T mean_square() const;
    T minimum() const;
    T maximum() const;
    Vector padding(size_t before, size_t after, PaddingMode mode = PaddingMode::edge) const;
    Vector convolving(const Vector& kernel, ConvolutionDomain domain = ConvolutionDomain::same,
                      PaddingMode mode = PaddingMode::edge) const;
    Vector cumsum() const;
};

template <typename T>
std::ostream& operator<<(std::ostream& os, const Vector<T>& v) {
    os << "[";
    for (size_t i = 0; i < v.size(); ++i) {
        os << ElementTraits<T>::describe(v[i]);
        if (i + 1 < v.size()) os << ", ";
    }
    os << "]";
    return os;
}

} // namespace cnum
