#include "ops.h"
#include "ops_support.h"

namespace cnum {
namespace Ops {

using detail::write_through;

namespace {

// GEMM needs compact operands; anything else is materialized first.
template <typename T>
Matrix<T> compact_operand(const Matrix<T>& m) { return m.is_compact() ? m : m.clone(); }

template <typename T>
Vector<T> compact_operand(const Vector<T>& v) { return v.is_compact() ? v : v.clone(); }

} // namespace

// ----------------- Matrix x Matrix -----------------

template <typename T>
void multiply(const Matrix<T>& a, const Matrix<T>& b, const Matrix<T>& out) {
    if (a.columns() != b.rows())
        throw std::invalid_argument("multiply: inner dimensions differ " + shape_to_str(a.shape()) + " x " +
                                    shape_to_str(b.shape()));
    if (out.rows() != a.rows() || out.columns() != b.columns())
        throw std::invalid_argument("multiply: output " + shape_to_str(out.shape()) + " for " +
                                    shape_to_str(a.shape()) + " x " + shape_to_str(b.shape()));

    Matrix<T> lhs = compact_operand(a);
    Matrix<T> rhs = compact_operand(b);
    bool staged = !out.is_compact() || out.shares_buffer(a) || out.shares_buffer(b);

    write_through(out, staged, [&](const Array<T>& target) {
        MatrixAccess<T> A = lhs.access();
        MatrixAccess<T> B = rhs.access();
        MatrixAccess<T> C = matrix_access(target.storage());
        cpu::kernels<T>().gemm(A.count.row, B.count.column, A.count.column, T(1), A.base, (size_t)A.stride.row,
                               B.base, (size_t)B.stride.row, T(0), C.base, (size_t)C.stride.row);
    });
}

// ----------------- Matrix x Vector -----------------
// N = 1 GEMM: the vector is a K x 1 column, the output an M x 1 column.

template <typename T>
void multiply(const Matrix<T>& a, const Vector<T>& v, const Vector<T>& out) {
    if (a.columns() != v.size())
        throw std::invalid_argument("multiply: matrix " + shape_to_str(a.shape()) + " x vector " +
                                    shape_to_str(v.shape()));
    if (out.size() != a.rows())
        throw std::invalid_argument("multiply: output size " + std::to_string(out.size()) + " != " +
                                    std::to_string(a.rows()));

    Matrix<T> lhs = compact_operand(a);
    Vector<T> x = compact_operand(v);
    bool staged = !out.is_compact() || out.shares_buffer(a) || out.shares_buffer(v);

    write_through(out, staged, [&](const Array<T>& target) {
        MatrixAccess<T> A = lhs.access();
        cpu::kernels<T>().gemm(A.count.row, 1, A.count.column, T(1), A.base, (size_t)A.stride.row, x.data(), 1,
                               T(0), target.data(), 1);
    });
}

// ----------------- Transpose -----------------

template <typename T>
void transpose(const Matrix<T>& src, const Matrix<T>& out) {
    if (out.rows() != src.columns() || out.columns() != src.rows())
        throw std::invalid_argument("transpose: output " + shape_to_str(out.shape()) + " for source " +
                                    shape_to_str(src.shape()));

    write_through(out, out.shares_buffer(src), [&](const Array<T>& target) {
        MatrixAccess<T> s = src.access();
        MatrixAccess<T> o = matrix_access(target.storage());
        if (s.compact && o.compact) {
            cpu::kernels<T>().mtrans(s.base, 1, o.base, 1, s.count.column, s.count.row);
            return;
        }
        for (size_t i = 0; i < s.count.row; ++i) {
            for (size_t j = 0; j < s.count.column; ++j) o.base[o.position(j, i)] = s.base[s.position(i, j)];
        }
    });
}

// ----------------- 2-D convolution (float) -----------------

void convolve(const Matrix<float>& in, const Matrix<float>& kernel, const Matrix<float>& out, EdgeMode edge,
              float background) {
    if (kernel.rows() % 2 == 0 || kernel.columns() % 2 == 0)
        throw std::invalid_argument("convolve: kernel extents must be odd, got " + shape_to_str(kernel.shape()));
    if (!kernel.is_compact()) throw std::invalid_argument("convolve: kernel must be compact");
    if (out.shape() != in.shape())
        throw std::invalid_argument("convolve: output " + shape_to_str(out.shape()) + " for input " +
                                    shape_to_str(in.shape()));

    Matrix<float> src = in.access().stride.column == 1 ? in : in.clone();
    bool staged = out.access().stride.column != 1 || out.shares_buffer(in) || out.shares_buffer(kernel);

    write_through(out, staged, [&](const Array<float>& target) {
        MatrixAccess<float> s = src.access();
        MatrixAccess<float> o = matrix_access(target.storage());
        cpu::conv2d_f32(s.base, s.stride.row, o.base, o.stride.row, s.count.row, s.count.column, kernel.data(),
                        kernel.rows(), kernel.columns(), background, edge);
    });
}

#define CNUM_INSTANTIATE_MATRIX_OPS(T)                                                     \
    template void multiply<T>(const Matrix<T>&, const Matrix<T>&, const Matrix<T>&);      \
    template void multiply<T>(const Matrix<T>&, const Vector<T>&, const Vector<T>&);      \
    template void transpose<T>(const Matrix<T>&, const Matrix<T>&);

CNUM_INSTANTIATE_MATRIX_OPS(float)
CNUM_INSTANTIATE_MATRIX_OPS(double)

#undef CNUM_INSTANTIATE_MATRIX_OPS

} // namespace Ops
} // namespace cnum
