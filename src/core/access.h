#pragma once
#include "storage.h"
#include <array>
#include <cstddef>
#include <vector>

namespace cnum {

// ======================================================================================
//                              ACCESS PROTOCOL
// ======================================================================================

// One strided pass: count elements starting at base, stride apart.
template <typename T>
struct LinearAccess {
    T* base;
    std::ptrdiff_t stride;
    size_t count;
};

// Rank-2 layout. Compact accesses report canonical strides.
template <typename T>
struct MatrixAccess {
    T* base;
    struct { std::ptrdiff_t row, column; } stride;
    struct { size_t row, column; } count;
    bool compact;

    std::ptrdiff_t position(size_t i, size_t j) const {
        return (std::ptrdiff_t)i * stride.row + (std::ptrdiff_t)j * stride.column;
    }
    T* row_base(size_t i) const { return base + (std::ptrdiff_t)i * stride.row; }
};

template <typename T>
MatrixAccess<T> matrix_access(const Storage<T>& s) {
    if (s.rank() != 2) throw std::invalid_argument("matrix_access: storage is not rank 2");
    MatrixAccess<T> acc;
    acc.base = s.origin();
    acc.count.row = s.shape()[0];
    acc.count.column = s.shape()[1];
    acc.compact = s.is_compact();
    if (acc.compact) {
        acc.stride.row = (std::ptrdiff_t)acc.count.column;
        acc.stride.column = 1;
    } else {
        acc.stride.row = s.strides()[0];
        acc.stride.column = s.strides()[1];
    }
    return acc;
}

template <typename T>
LinearAccess<T> vector_access(const Storage<T>& s) {
    if (s.rank() != 1) throw std::invalid_argument("vector_access: storage is not rank 1");
    return LinearAccess<T>{s.origin(), s.strides()[0], s.shape()[0]};
}

// ----------------- Linearized runs -----------------
// Visits the elements of N same-shape storages in logical order. When every
// operand is compact this is a single run over all elements; otherwise there
// is one run per outer multi-index, along the innermost dimension, so the
// callback may be invoked many times and must accumulate.
template <typename T, size_t N>
class RunIterator {
public:
    using Accesses = std::array<LinearAccess<T>, N>;

    explicit RunIterator(const std::array<const Storage<T>*, N>& operands) : ops_(operands) {}

    bool single_run() const {
        for (auto* s : ops_)
            if (!s->is_compact()) return false;
        return true;
    }

    template <typename F>
    void for_each(F&& f) const {
        const Storage<T>& lead = *ops_[0];
        size_t n = lead.size();
        if (n == 0) return;

        Accesses acc;
        if (single_run()) {
            for (size_t k = 0; k < N; ++k) acc[k] = LinearAccess<T>{ops_[k]->origin(), 1, n};
            f(acc);
            return;
        }

        size_t rank = lead.rank();
        size_t inner = lead.shape()[rank - 1];
        size_t outer = n / inner;

        // Dimensional carry-over over the outer indices
        std::vector<size_t> coords(rank, 0);
        std::array<std::ptrdiff_t, N> pos{};
        for (size_t r = 0; r < outer; ++r) {
            for (size_t k = 0; k < N; ++k) {
                acc[k] = LinearAccess<T>{ops_[k]->origin() + pos[k], ops_[k]->strides()[rank - 1], inner};
            }
            f(acc);

            for (int d = (int)rank - 2; d >= 0; --d) {
                coords[d]++;
                for (size_t k = 0; k < N; ++k) pos[k] += ops_[k]->strides()[d];
                if (coords[d] < lead.shape()[d]) break;
                for (size_t k = 0; k < N; ++k) pos[k] -= (std::ptrdiff_t)lead.shape()[d] * ops_[k]->strides()[d];
                coords[d] = 0;
            }
        }
    }

private:
    std::array<const Storage<T>*, N> ops_;
};

template <typename T, typename F>
void with_linearized_accesses(const Storage<T>& a, F&& f) {
    RunIterator<T, 1>(std::array<const Storage<T>*, 1>{{&a}}).for_each([&](const typename RunIterator<T, 1>::Accesses& acc) {
        f(acc[0]);
    });
}

template <typename T, typename F>
void with_linearized_accesses(const Storage<T>& a, const Storage<T>& b, F&& f) {
    RunIterator<T, 2>(std::array<const Storage<T>*, 2>{{&a, &b}}).for_each([&](const typename RunIterator<T, 2>::Accesses& acc) {
        f(acc[0], acc[1]);
    });
}

template <typename T, typename F>
void with_linearized_accesses(const Storage<T>& a, const Storage<T>& b, const Storage<T>& c, F&& f) {
    RunIterator<T, 3>(std::array<const Storage<T>*, 3>{{&a, &b, &c}}).for_each([&](const typename RunIterator<T, 3>::Accesses& acc) {
        f(acc[0], acc[1], acc[2]);
    });
}

} // namespace cnum
