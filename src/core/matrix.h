#pragma once
#include "vector.h"
#include <initializer_list>
#include <ostream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace cnum {

// ======================================================================================
//                                   MATRIX
// ======================================================================================
// Row-major rank-2 array. Slices, row/column views and transposed_view share
// the buffer; transposed() materializes.

template <typename T>
class Matrix : public Array<T> {
public:
    Matrix() : Matrix(0, 0) {}
    Matrix(size_t rows, size_t columns) : Array<T>(Storage<T>(Shape{rows, columns})) {}
    Matrix(size_t rows, size_t columns, T value) : Matrix(rows, columns) { this->fill(value); }

    Matrix(std::initializer_list<std::initializer_list<T>> values)
        : Matrix(values.size(), values.size() ? values.begin()->size() : 0) {
        size_t i = 0;
        for (const auto& row : values) {
            if (row.size() != columns())
                throw std::invalid_argument("Matrix: ragged initializer, row " + std::to_string(i) + " has " +
                                            std::to_string(row.size()) + " columns, expected " +
                                            std::to_string(columns()));
            size_t j = 0;
            for (const T& v : row) (*this)(i, j++) = v;
            ++i;
        }
    }

    explicit Matrix(Storage<T> storage) : Array<T>(std::move(storage)) {
        if (this->rank() != 2)
            throw std::invalid_argument("Matrix: storage has rank " + std::to_string(this->rank()));
    }

    static Matrix from_vector(const std::vector<T>& values, size_t rows, size_t columns) {
        if (values.size() != rows * columns)
            throw std::invalid_argument("Matrix::from_vector: " + std::to_string(values.size()) +
                                        " values for shape (" + std::to_string(rows) + ", " +
                                        std::to_string(columns) + ")");
        Matrix out(rows, columns);
        for (size_t i = 0; i < values.size(); ++i) out.data()[i] = values[i];
        return out;
    }

    static Matrix zeros(size_t rows, size_t columns) { return Matrix(rows, columns, ElementTraits<T>::none()); }
    static Matrix ones(size_t rows, size_t columns) { return Matrix(rows, columns, ElementTraits<T>::one()); }

    static Matrix random(size_t rows, size_t columns, T min, T max) {
        std::random_device rd;
        std::mt19937 gen(rd());
        Matrix out(rows, columns);
        out.fill_random(min, max, gen);
        return out;
    }

    size_t rows() const { return this->shape()[0]; }
    size_t columns() const { return this->shape()[1]; }
    MatrixAccess<T> access() const { return matrix_access(this->storage_); }

    T& operator()(size_t i, size_t j) const {
        const Strides& st = this->storage_.strides();
        return this->data()[(std::ptrdiff_t)i * st[0] + (std::ptrdiff_t)j * st[1]];
    }

    T& at(size_t i, size_t j) const {
        if (i >= rows() || j >= columns())
            throw std::out_of_range("Matrix::at: index (" + std::to_string(i) + ", " + std::to_string(j) +
                                    ") out of range for shape " + shape_to_str(this->shape()));
        return (*this)(i, j);
    }

    // Rows [row_start, row_end) x columns [col_start, col_end) as a view.
    Matrix slice(size_t row_start, size_t row_end, size_t col_start, size_t col_end) const {
        if (row_start > row_end || row_end > rows() || col_start > col_end || col_end > columns())
            throw std::out_of_range("Matrix::slice: rows [" + std::to_string(row_start) + ", " +
                                    std::to_string(row_end) + "), columns [" + std::to_string(col_start) + ", " +
                                    std::to_string(col_end) + ") out of range for shape " +
                                    shape_to_str(this->shape()));
        const Storage<T>& s = this->storage_;
        std::ptrdiff_t offset = s.offset() + (std::ptrdiff_t)row_start * s.strides()[0] +
                                (std::ptrdiff_t)col_start * s.strides()[1];
        return Matrix(s.view(offset, Shape{row_end - row_start, col_end - col_start}, s.strides()));
    }

    Vector<T> row(size_t i) const {
        if (i >= rows()) throw std::out_of_range("Matrix::row: " + std::to_string(i) + " >= " + std::to_string(rows()));
        const Storage<T>& s = this->storage_;
        return Vector<T>(s.view(s.offset() + (std::ptrdiff_t)i * s.strides()[0], Shape{columns()},
                                Strides{s.strides()[1]}));
    }

    Vector<T> column(size_t j) const {
        if (j >= columns())
            throw std::out_of_range("Matrix::column: " + std::to_string(j) + " >= " + std::to_string(columns()));
        const Storage<T>& s = this->storage_;
        return Vector<T>(s.view(s.offset() + (std::ptrdiff_t)j * s.strides()[1], Shape{rows()},
                                Strides{s.strides()[0]}));
    }

    // Transpose by swapping strides; no data moves.
    Matrix transposed_view() const {
        const Storage<T>& s = this->storage_;
        return Matrix(s.view(s.offset(), Shape{columns(), rows()}, Strides{s.strides()[1], s.strides()[0]}));
    }

    Matrix clone() const {
        Matrix out(rows(), columns());
        out.assign(*this);
        return out;
    }

    template <typename F>
    Matrix derive(F&& f) const {
        Matrix out(rows(), columns());
        f(out);
        return out;
    }

    // Defined in ops.h (floating element types only)
    T mean() const;
    T mean_square() const;
    T minimum() const;
    T maximum() const;
    Matrix transposed() const;
};

template <typename T>
std::ostream& operator<<(std::ostream& os, const Matrix<T>& m) {
    os << "[";
    for (size_t i = 0; i < m.rows(); ++i) {
        if (i) os << "\n ";
        os << "[";
        for (size_t j = 0; j < m.columns(); ++j) {
            os << ElementTraits<T>::describe(m(i, j));
            if (j + 1 < m.columns()) os << ", ";
        }
        os << "]";
    }
    os << "]";
    return os;
}

} // namespace cnum
