#pragma once
#include <cstddef>

namespace cnum {

// Out-of-image pixels for 2-D convolution: a constant, or the nearest edge pixel.
enum class EdgeMode { background, extend };

namespace cpu {

// -------------------------------------------------------------
//                Kernel contract (strides in elements)
// -------------------------------------------------------------
// Element-wise, scalar-affine, scaled-sum and running-sum kernels tolerate
// out == in at identical strides. conv, gemm and mtrans must not alias.

template <typename T>
struct KernelTable {
    using BinaryFn = void (*)(const T* a, std::ptrdiff_t sa, const T* b, std::ptrdiff_t sb, T* out,
                              std::ptrdiff_t so, size_t n);
    using ScalarFn = void (*)(const T* a, std::ptrdiff_t sa, T s, T* out, std::ptrdiff_t so, size_t n);
    using ScaledSumFn = void (*)(const T* a, std::ptrdiff_t sa, T as, const T* b, std::ptrdiff_t sb, T bs, T* out,
                                 std::ptrdiff_t so, size_t n);
    using RampFn = void (*)(T start, T step, T* out, std::ptrdiff_t so, size_t n);
    using ReduceFn = T (*)(const T* a, std::ptrdiff_t sa, size_t n);
    using RunningSumFn = void (*)(const T* a, std::ptrdiff_t sa, T scale, T* out, std::ptrdiff_t so, size_t n);
    using ConvFn = void (*)(const T* in, std::ptrdiff_t si, const T* kernel, std::ptrdiff_t sk, T* out,
                            std::ptrdiff_t so, size_t n_out, size_t n_kernel);
    using GemmFn = void (*)(size_t M, size_t N, size_t K, T alpha, const T* A, size_t lda, const T* B, size_t ldb,
                            T beta, T* C, size_t ldc);
    using TransposeFn = void (*)(const T* a, std::ptrdiff_t sa, T* out, std::ptrdiff_t so, size_t m, size_t n);

    BinaryFn vadd, vsub, vmul, vdiv;   // out = a op b
    ScalarFn vsmul;                    // out = a * s
    ScalarFn vsadd;                    // out = a + s
    ScaledSumFn vsmsma;                // out = a * as + b * bs
    RampFn vramp;                      // out[i] = start + i * step
    ReduceFn meanv, measqv, minv, maxv;
    RunningSumFn vrsum;                // out[0] = 0, out[i] = out[i-1] + scale * a[i]
    ConvFn conv;                       // valid-domain correlation
    GemmFn gemm;                       // row-major C = alpha * A * B + beta * C
    TransposeFn mtrans;                // m x n out from n x m a
};

enum class Backend { generic, avx2 };

// Kernels of the active backend.
template <typename T>
const KernelTable<T>& kernels();

template <>
const KernelTable<float>& kernels<float>();
template <>
const KernelTable<double>& kernels<double>();

Backend active_backend();
// Throws std::runtime_error if the backend is not compiled in or the CPU lacks it.
void set_backend(Backend backend);
bool backend_available(Backend backend);
const char* backend_name(Backend backend);
inline const char* backend_name() { return backend_name(active_backend()); }

// Image correlation over a height x width float plane. The kernel is compact
// and has odd extents.
void conv2d_f32(const float* src, std::ptrdiff_t src_row_stride, float* dst, std::ptrdiff_t dst_row_stride,
                size_t height, size_t width, const float* kernel, size_t kernel_rows, size_t kernel_columns,
                float background, EdgeMode edge);

} // namespace cpu
} // namespace cnum
