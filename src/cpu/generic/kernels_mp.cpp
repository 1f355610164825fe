#include "kernels_mp.h"
#include <omp.h>
#include <algorithm>
#include <limits>

namespace cnum {
namespace cpu {

namespace {

constexpr size_t PARALLEL_THRESHOLD = 1024;

template <typename F>
inline void parallel_for(size_t n, F func) {
    if (n < PARALLEL_THRESHOLD) {
        for (size_t i = 0; i < n; ++i) {
            func(i);
        }
    } else {
        #pragma omp parallel for schedule(static)
        for (size_t i = 0; i < n; ++i) {
            func(i);
        }
    }
}

inline std::ptrdiff_t at(size_t i, std::ptrdiff_t stride) { return (std::ptrdiff_t)i * stride; }

template <typename T, typename Op>
inline void binary_mp(const T* a, std::ptrdiff_t sa, const T* b, std::ptrdiff_t sb, T* out, std::ptrdiff_t so,
                      size_t n, Op op) {
    parallel_for(n, [=](size_t i) { out[at(i, so)] = op(a[at(i, sa)], b[at(i, sb)]); });
}

} // namespace

// ----------------- Element-wise -----------------

template <typename T>
void vadd_mp(const T* a, std::ptrdiff_t sa, const T* b, std::ptrdiff_t sb, T* out, std::ptrdiff_t so, size_t n) {
    binary_mp(a, sa, b, sb, out, so, n, [](T x, T y) { return x + y; });
}

template <typename T>
void vsub_mp(const T* a, std::ptrdiff_t sa, const T* b, std::ptrdiff_t sb, T* out, std::ptrdiff_t so, size_t n) {
    binary_mp(a, sa, b, sb, out, so, n, [](T x, T y) { return x - y; });
}

template <typename T>
void vmul_mp(const T* a, std::ptrdiff_t sa, const T* b, std::ptrdiff_t sb, T* out, std::ptrdiff_t so, size_t n) {
    binary_mp(a, sa, b, sb, out, so, n, [](T x, T y) { return x * y; });
}

template <typename T>
void vdiv_mp(const T* a, std::ptrdiff_t sa, const T* b, std::ptrdiff_t sb, T* out, std::ptrdiff_t so, size_t n) {
    binary_mp(a, sa, b, sb, out, so, n, [](T x, T y) { return x / y; });
}

// ----------------- Scalar-affine -----------------

template <typename T>
void vsmul_mp(const T* a, std::ptrdiff_t sa, T s, T* out, std::ptrdiff_t so, size_t n) {
    parallel_for(n, [=](size_t i) { out[at(i, so)] = a[at(i, sa)] * s; });
}

template <typename T>
void vsadd_mp(const T* a, std::ptrdiff_t sa, T s, T* out, std::ptrdiff_t so, size_t n) {
    parallel_for(n, [=](size_t i) { out[at(i, so)] = a[at(i, sa)] + s; });
}

template <typename T>
void vsmsma_mp(const T* a, std::ptrdiff_t sa, T as, const T* b, std::ptrdiff_t sb, T bs, T* out, std::ptrdiff_t so,
               size_t n) {
    parallel_for(n, [=](size_t i) { out[at(i, so)] = a[at(i, sa)] * as + b[at(i, sb)] * bs; });
}

template <typename T>
void vramp_mp(T start, T step, T* out, std::ptrdiff_t so, size_t n) {
    parallel_for(n, [=](size_t i) { out[at(i, so)] = start + (T)i * step; });
}

// ----------------- Reductions -----------------
// Sums accumulate in double.

template <typename T>
T meanv_mp(const T* a, std::ptrdiff_t sa, size_t n) {
    if (n == 0) return T(0);
    double sum = 0.0;
    #pragma omp parallel for reduction(+:sum) if(n >= PARALLEL_THRESHOLD)
    for (size_t i = 0; i < n; ++i) sum += (double)a[at(i, sa)];
    return (T)(sum / (double)n);
}

template <typename T>
T measqv_mp(const T* a, std::ptrdiff_t sa, size_t n) {
    if (n == 0) return T(0);
    double sum = 0.0;
    #pragma omp parallel for reduction(+:sum) if(n >= PARALLEL_THRESHOLD)
    for (size_t i = 0; i < n; ++i) {
        double v = (double)a[at(i, sa)];
        sum += v * v;
    }
    return (T)(sum / (double)n);
}

template <typename T>
T minv_mp(const T* a, std::ptrdiff_t sa, size_t n) {
    T result = std::numeric_limits<T>::infinity();
    #pragma omp parallel for reduction(min:result) if(n >= PARALLEL_THRESHOLD)
    for (size_t i = 0; i < n; ++i) result = std::min(result, a[at(i, sa)]);
    return result;
}

template <typename T>
T maxv_mp(const T* a, std::ptrdiff_t sa, size_t n) {
    T result = -std::numeric_limits<T>::infinity();
    #pragma omp parallel for reduction(max:result) if(n >= PARALLEL_THRESHOLD)
    for (size_t i = 0; i < n; ++i) result = std::max(result, a[at(i, sa)]);
    return result;
}

// ----------------- Running sum -----------------
// Sequential; a[0] never contributes.

template <typename T>
void vrsum_mp(const T* a, std::ptrdiff_t sa, T scale, T* out, std::ptrdiff_t so, size_t n) {
    if (n == 0) return;
    out[0] = T(0);
    for (size_t i = 1; i < n; ++i) out[at(i, so)] = out[at(i - 1, so)] + scale * a[at(i, sa)];
}

// ----------------- 1-D convolution (valid domain) -----------------

template <typename T>
void conv_mp(const T* in, std::ptrdiff_t si, const T* kernel, std::ptrdiff_t sk, T* out, std::ptrdiff_t so,
             size_t n_out, size_t n_kernel) {
    #pragma omp parallel for schedule(static) if(n_out * n_kernel >= PARALLEL_THRESHOLD)
    for (size_t i = 0; i < n_out; ++i) {
        T acc = T(0);
        for (size_t k = 0; k < n_kernel; ++k) acc += in[at(i + k, si)] * kernel[at(k, sk)];
        out[at(i, so)] = acc;
    }
}

// ----------------- GEMM -----------------
// i-k-j order keeps the inner loop unit-stride on B and C.

template <typename T>
void gemm_mp(size_t M, size_t N, size_t K, T alpha, const T* A, size_t lda, const T* B, size_t ldb, T beta, T* C,
             size_t ldc) {
    #pragma omp parallel for schedule(static) if(M * N * K >= PARALLEL_THRESHOLD)
    for (size_t i = 0; i < M; ++i) {
        T* c_row = C + i * ldc;
        if (beta == T(0)) {
            for (size_t j = 0; j < N; ++j) c_row[j] = T(0);
        } else if (beta != T(1)) {
            for (size_t j = 0; j < N; ++j) c_row[j] *= beta;
        }
        for (size_t k = 0; k < K; ++k) {
            T aik = alpha * A[i * lda + k];
            const T* b_row = B + k * ldb;
            for (size_t j = 0; j < N; ++j) c_row[j] += aik * b_row[j];
        }
    }
}

// ----------------- Transpose -----------------

template <typename T>
void mtrans_mp(const T* a, std::ptrdiff_t sa, T* out, std::ptrdiff_t so, size_t m, size_t n) {
    #pragma omp parallel for schedule(static) if(m * n >= PARALLEL_THRESHOLD)
    for (size_t i = 0; i < m; ++i) {
        for (size_t j = 0; j < n; ++j) out[at(i * n + j, so)] = a[at(j * m + i, sa)];
    }
}

template <typename T>
KernelTable<T> generic_table() {
    KernelTable<T> t;
    t.vadd = vadd_mp<T>;
    t.vsub = vsub_mp<T>;
    t.vmul = vmul_mp<T>;
    t.vdiv = vdiv_mp<T>;
    t.vsmul = vsmul_mp<T>;
    t.vsadd = vsadd_mp<T>;
    t.vsmsma = vsmsma_mp<T>;
    t.vramp = vramp_mp<T>;
    t.meanv = meanv_mp<T>;
    t.measqv = measqv_mp<T>;
    t.minv = minv_mp<T>;
    t.maxv = maxv_mp<T>;
    t.vrsum = vrsum_mp<T>;
    t.conv = conv_mp<T>;
    t.gemm = gemm_mp<T>;
    t.mtrans = mtrans_mp<T>;
    return t;
}

// ----------------- 2-D convolution (float) -----------------

void conv2d_f32(const float* src, std::ptrdiff_t src_row_stride, float* dst, std::ptrdiff_t dst_row_stride,
                size_t height, size_t width, const float* kernel, size_t kernel_rows, size_t kernel_columns,
                float background, EdgeMode edge) {
    const std::ptrdiff_t half_r = (std::ptrdiff_t)(kernel_rows / 2);
    const std::ptrdiff_t half_c = (std::ptrdiff_t)(kernel_columns / 2);
    const std::ptrdiff_t h = (std::ptrdiff_t)height;
    const std::ptrdiff_t w = (std::ptrdiff_t)width;

    #pragma omp parallel for schedule(static) if(height * width >= PARALLEL_THRESHOLD)
    for (size_t y = 0; y < height; ++y) {
        for (size_t x = 0; x < width; ++x) {
            float acc = 0.0f;
            for (size_t i = 0; i < kernel_rows; ++i) {
                std::ptrdiff_t sy = (std::ptrdiff_t)y + (std::ptrdiff_t)i - half_r;
                for (size_t j = 0; j < kernel_columns; ++j) {
                    std::ptrdiff_t sx = (std::ptrdiff_t)x + (std::ptrdiff_t)j - half_c;
                    float pixel;
                    if (sy >= 0 && sy < h && sx >= 0 && sx < w) {
                        pixel = src[sy * src_row_stride + sx];
                    } else if (edge == EdgeMode::extend) {
                        std::ptrdiff_t cy = std::min(std::max(sy, (std::ptrdiff_t)0), h - 1);
                        std::ptrdiff_t cx = std::min(std::max(sx, (std::ptrdiff_t)0), w - 1);
                        pixel = src[cy * src_row_stride + cx];
                    } else {
                        pixel = background;
                    }
                    acc += kernel[i * kernel_columns + j] * pixel;
                }
            }
            dst[(std::ptrdiff_t)y * dst_row_stride + (std::ptrdiff_t)x] = acc;
        }
    }
}

#define CNUM_INSTANTIATE_MP(T)                                                                              \
    template void vadd_mp<T>(const T*, std::ptrdiff_t, const T*, std::ptrdiff_t, T*, std::ptrdiff_t, size_t); \
    template void vsub_mp<T>(const T*, std::ptrdiff_t, const T*, std::ptrdiff_t, T*, std::ptrdiff_t, size_t); \
    template void vmul_mp<T>(const T*, std::ptrdiff_t, const T*, std::ptrdiff_t, T*, std::ptrdiff_t, size_t); \
    template void vdiv_mp<T>(const T*, std::ptrdiff_t, const T*, std::ptrdiff_t, T*, std::ptrdiff_t, size_t); \
    template void vsmul_mp<T>(const T*, std::ptrdiff_t, T, T*, std::ptrdiff_t, size_t);                       \
    template void vsadd_mp<T>(const T*, std::ptrdiff_t, T, T*, std::ptrdiff_t, size_t);                       \
    template void vsmsma_mp<T>(const T*, std::ptrdiff_t, T, const T*, std::ptrdiff_t, T, T*, std::ptrdiff_t,  \
                               size_t);                                                                     \
    template void vramp_mp<T>(T, T, T*, std::ptrdiff_t, size_t);                                            \
    template T meanv_mp<T>(const T*, std::ptrdiff_t, size_t);                                               \
    template T measqv_mp<T>(const T*, std::ptrdiff_t, size_t);                                              \
    template T minv_mp<T>(const T*, std::ptrdiff_t, size_t);                                                \
    template T maxv_mp<T>(const T*, std::ptrdiff_t, size_t);                                                \
    template void vrsum_mp<T>(const T*, std::ptrdiff_t, T, T*, std::ptrdiff_t, size_t);                     \
    template void conv_mp<T>(const T*, std::ptrdiff_t, const T*, std::ptrdiff_t, T*, std::ptrdiff_t, size_t,  \
                             size_t);                                                                       \
    template void gemm_mp<T>(size_t, size_t, size_t, T, const T*, size_t, const T*, size_t, T, T*, size_t);   \
    template void mtrans_mp<T>(const T*, std::ptrdiff_t, T*, std::ptrdiff_t, size_t, size_t);                \
    template KernelTable<T> generic_table<T>();

CNUM_INSTANTIATE_MP(float)
CNUM_INSTANTIATE_MP(double)

#undef CNUM_INSTANTIATE_MP

} // namespace cpu
} // namespace cnum
