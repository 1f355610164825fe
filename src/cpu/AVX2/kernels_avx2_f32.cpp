#include "kernels_avx2_f32.h"
#include "kernels_mp.h"
#include <immintrin.h>
#include <omp.h>
#include <algorithm>
#include <limits>

#if defined(__AVX2__) && defined(__FMA__)

namespace cnum {
namespace cpu {

namespace {

constexpr size_t PARALLEL_THRESHOLD = 1024;

// --- Masked Load/Store Helpers ---
static inline __m256 masked_loadu_ps(const float* ptr, size_t valid_count, float fill = 0.0f) {
    alignas(32) float tmp[8] = {fill, fill, fill, fill, fill, fill, fill, fill};
    for (size_t i = 0; i < valid_count; ++i) tmp[i] = ptr[i];
    return _mm256_load_ps(tmp);
}

static inline void masked_storeu_ps(float* ptr, __m256 v, size_t valid_count) {
    alignas(32) float tmp[8];
    _mm256_store_ps(tmp, v);
    for (size_t i = 0; i < valid_count; ++i) ptr[i] = tmp[i];
}

// --- Horizontal Reductions ---
inline double hsum256_pd(__m256d v) {
    __m256d v2 = _mm256_permute2f128_pd(v, v, 1);
    v = _mm256_add_pd(v, v2);
    __m256d v3 = _mm256_permute_pd(v, 0x5);
    v = _mm256_add_pd(v, v3);
    return _mm256_cvtsd_f64(v);
}

// Sums run in double lanes: lower and upper four floats widened.
inline __m256d low_pd(__m256 v) { return _mm256_cvtps_pd(_mm256_castps256_ps128(v)); }
inline __m256d high_pd(__m256 v) { return _mm256_cvtps_pd(_mm256_extractf128_ps(v, 1)); }

inline float hmin256_ps(__m256 v) {
    alignas(32) float tmp[8];
    _mm256_store_ps(tmp, v);
    return *std::min_element(tmp, tmp + 8);
}

inline float hmax256_ps(__m256 v) {
    alignas(32) float tmp[8];
    _mm256_store_ps(tmp, v);
    return *std::max_element(tmp, tmp + 8);
}

// out[i] = op(a[i], b[i]) over unit-stride arrays
template <typename VecOp>
inline void binary_avx2(const float* a, const float* b, float* out, size_t n, VecOp op) {
    #pragma omp parallel for schedule(static) if(n >= PARALLEL_THRESHOLD)
    for (size_t i = 0; i < n; i += 8) {
        size_t tail = (n - i < 8) ? (n - i) : 8;
        if (tail == 8) {
            _mm256_storeu_ps(out + i, op(_mm256_loadu_ps(a + i), _mm256_loadu_ps(b + i)));
        } else {
            masked_storeu_ps(out + i, op(masked_loadu_ps(a + i, tail), masked_loadu_ps(b + i, tail, 1.0f)), tail);
        }
    }
}

template <typename VecOp>
inline void unary_avx2(const float* a, float* out, size_t n, VecOp op) {
    #pragma omp parallel for schedule(static) if(n >= PARALLEL_THRESHOLD)
    for (size_t i = 0; i < n; i += 8) {
        size_t tail = (n - i < 8) ? (n - i) : 8;
        if (tail == 8) {
            _mm256_storeu_ps(out + i, op(_mm256_loadu_ps(a + i)));
        } else {
            masked_storeu_ps(out + i, op(masked_loadu_ps(a + i, tail)), tail);
        }
    }
}

inline bool unit(std::ptrdiff_t sa, std::ptrdiff_t sb, std::ptrdiff_t so) { return sa == 1 && sb == 1 && so == 1; }

} // namespace

// ========================================================================
//                     Element-wise
// ========================================================================

void vadd_avx2_f32(const float* a, std::ptrdiff_t sa, const float* b, std::ptrdiff_t sb, float* out, std::ptrdiff_t so, size_t n) {
    if (!unit(sa, sb, so)) return vadd_mp<float>(a, sa, b, sb, out, so, n);
    binary_avx2(a, b, out, n, [](__m256 x, __m256 y) { return _mm256_add_ps(x, y); });
}

void vsub_avx2_f32(const float* a, std::ptrdiff_t sa, const float* b, std::ptrdiff_t sb, float* out, std::ptrdiff_t so, size_t n) {
    if (!unit(sa, sb, so)) return vsub_mp<float>(a, sa, b, sb, out, so, n);
    binary_avx2(a, b, out, n, [](__m256 x, __m256 y) { return _mm256_sub_ps(x, y); });
}

void vmul_avx2_f32(const float* a, std::ptrdiff_t sa, const float* b, std::ptrdiff_t sb, float* out, std::ptrdiff_t so, size_t n) {
    if (!unit(sa, sb, so)) return vmul_mp<float>(a, sa, b, sb, out, so, n);
    binary_avx2(a, b, out, n, [](__m256 x, __m256 y) { return _mm256_mul_ps(x, y); });
}

void vdiv_avx2_f32(const float* a, std::ptrdiff_t sa, const float* b, std::ptrdiff_t sb, float* out, std::ptrdiff_t so, size_t n) {
    if (!unit(sa, sb, so)) return vdiv_mp<float>(a, sa, b, sb, out, so, n);
    binary_avx2(a, b, out, n, [](__m256 x, __m256 y) { return _mm256_div_ps(x, y); });
}

// ========================================================================
//                     Scalar-affine
// ========================================================================

void vsmul_avx2_f32(const float* a, std::ptrdiff_t sa, float s, float* out, std::ptrdiff_t so, size_t n) {
    if (!unit(sa, 1, so)) return vsmul_mp<float>(a, sa, s, out, so, n);
    const __m256 vs = _mm256_set1_ps(s);
    unary_avx2(a, out, n, [vs](__m256 x) { return _mm256_mul_ps(x, vs); });
}

void vsadd_avx2_f32(const float* a, std::ptrdiff_t sa, float s, float* out, std::ptrdiff_t so, size_t n) {
    if (!unit(sa, 1, so)) return vsadd_mp<float>(a, sa, s, out, so, n);
    const __m256 vs = _mm256_set1_ps(s);
    unary_avx2(a, out, n, [vs](__m256 x) { return _mm256_add_ps(x, vs); });
}

void vsmsma_avx2_f32(const float* a, std::ptrdiff_t sa, float as, const float* b, std::ptrdiff_t sb, float bs, float* out, std::ptrdiff_t so, size_t n) {
    if (!unit(sa, sb, so)) return vsmsma_mp<float>(a, sa, as, b, sb, bs, out, so, n);
    const __m256 vas = _mm256_set1_ps(as);
    const __m256 vbs = _mm256_set1_ps(bs);
    binary_avx2(a, b, out, n, [vas, vbs](__m256 x, __m256 y) {
        return _mm256_fmadd_ps(x, vas, _mm256_mul_ps(y, vbs));
    });
}

// ========================================================================
//                     Reductions
// ========================================================================

float meanv_avx2_f32(const float* a, std::ptrdiff_t sa, size_t n) {
    if (sa != 1) return meanv_mp<float>(a, sa, n);
    if (n == 0) return 0.0f;
    double global_sum = 0.0;

    #pragma omp parallel if(n >= PARALLEL_THRESHOLD)
    {
        __m256d vlo = _mm256_setzero_pd();
        __m256d vhi = _mm256_setzero_pd();
        #pragma omp for nowait
        for (size_t i = 0; i < n; i += 8) {
            size_t tail = (n - i < 8) ? (n - i) : 8;
            __m256 v = (tail == 8) ? _mm256_loadu_ps(a + i) : masked_loadu_ps(a + i, tail);
            vlo = _mm256_add_pd(vlo, low_pd(v));
            vhi = _mm256_add_pd(vhi, high_pd(v));
        }
        double local_sum = hsum256_pd(_mm256_add_pd(vlo, vhi));
        #pragma omp atomic
        global_sum += local_sum;
    }
    return (float)(global_sum / (double)n);
}

float measqv_avx2_f32(const float* a, std::ptrdiff_t sa, size_t n) {
    if (sa != 1) return measqv_mp<float>(a, sa, n);
    if (n == 0) return 0.0f;
    double global_sum = 0.0;

    #pragma omp parallel if(n >= PARALLEL_THRESHOLD)
    {
        __m256d vlo = _mm256_setzero_pd();
        __m256d vhi = _mm256_setzero_pd();
        #pragma omp for nowait
        for (size_t i = 0; i < n; i += 8) {
            size_t tail = (n - i < 8) ? (n - i) : 8;
            __m256 v = (tail == 8) ? _mm256_loadu_ps(a + i) : masked_loadu_ps(a + i, tail);
            __m256d lo = low_pd(v);
            __m256d hi = high_pd(v);
            vlo = _mm256_fmadd_pd(lo, lo, vlo);
            vhi = _mm256_fmadd_pd(hi, hi, vhi);
        }
        double local_sum = hsum256_pd(_mm256_add_pd(vlo, vhi));
        #pragma omp atomic
        global_sum += local_sum;
    }
    return (float)(global_sum / (double)n);
}

float minv_avx2_f32(const float* a, std::ptrdiff_t sa, size_t n) {
    if (sa != 1) return minv_mp<float>(a, sa, n);
    const float inf = std::numeric_limits<float>::infinity();
    float global_min = inf;

    #pragma omp parallel if(n >= PARALLEL_THRESHOLD)
    {
        __m256 vmin = _mm256_set1_ps(inf);
        #pragma omp for nowait
        for (size_t i = 0; i < n; i += 8) {
            size_t tail = (n - i < 8) ? (n - i) : 8;
            __m256 v = (tail == 8) ? _mm256_loadu_ps(a + i) : masked_loadu_ps(a + i, tail, inf);
            vmin = _mm256_min_ps(vmin, v);
        }
        float local_min = hmin256_ps(vmin);
        #pragma omp critical
        global_min = std::min(global_min, local_min);
    }
    return global_min;
}

float maxv_avx2_f32(const float* a, std::ptrdiff_t sa, size_t n) {
    if (sa != 1) return maxv_mp<float>(a, sa, n);
    const float ninf = -std::numeric_limits<float>::infinity();
    float global_max = ninf;

    #pragma omp parallel if(n >= PARALLEL_THRESHOLD)
    {
        __m256 vmax = _mm256_set1_ps(ninf);
        #pragma omp for nowait
        for (size_t i = 0; i < n; i += 8) {
            size_t tail = (n - i < 8) ? (n - i) : 8;
            __m256 v = (tail == 8) ? _mm256_loadu_ps(a + i) : masked_loadu_ps(a + i, tail, ninf);
            vmax = _mm256_max_ps(vmax, v);
        }
        float local_max = hmax256_ps(vmax);
        #pragma omp critical
        global_max = std::max(global_max, local_max);
    }
    return global_max;
}

// ========================================================================
//                     GEMM (row broadcast, FMA)
// ========================================================================

void gemm_avx2_f32(size_t M, size_t N, size_t K, float alpha, const float* A, size_t lda, const float* B, size_t ldb, float beta, float* C, size_t ldc) {
    #pragma omp parallel for schedule(static) if(M * N * K >= PARALLEL_THRESHOLD)
    for (size_t i = 0; i < M; ++i) {
        float* c_row = C + i * ldc;
        if (beta == 0.0f) {
            std::fill(c_row, c_row + N, 0.0f);
        } else if (beta != 1.0f) {
            for (size_t j = 0; j < N; ++j) c_row[j] *= beta;
        }
        for (size_t k = 0; k < K; ++k) {
            __m256 va = _mm256_set1_ps(alpha * A[i * lda + k]);
            const float* b_row = B + k * ldb;
            size_t j = 0;
            for (; j + 8 <= N; j += 8) {
                __m256 vc = _mm256_loadu_ps(c_row + j);
                __m256 vb = _mm256_loadu_ps(b_row + j);
                vc = _mm256_fmadd_ps(va, vb, vc);
                _mm256_storeu_ps(c_row + j, vc);
            }
            if (j < N) {
                size_t tail = N - j;
                __m256 vc = masked_loadu_ps(c_row + j, tail);
                __m256 vb = masked_loadu_ps(b_row + j, tail);
                vc = _mm256_fmadd_ps(va, vb, vc);
                masked_storeu_ps(c_row + j, vc, tail);
            }
        }
    }
}

KernelTable<float> avx2_table_f32() {
    KernelTable<float> t = generic_table<float>();
    t.vadd = vadd_avx2_f32;
    t.vsub = vsub_avx2_f32;
    t.vmul = vmul_avx2_f32;
    t.vdiv = vdiv_avx2_f32;
    t.vsmul = vsmul_avx2_f32;
    t.vsadd = vsadd_avx2_f32;
    t.vsmsma = vsmsma_avx2_f32;
    t.meanv = meanv_avx2_f32;
    t.measqv = measqv_avx2_f32;
    t.minv = minv_avx2_f32;
    t.maxv = maxv_avx2_f32;
    t.gemm = gemm_avx2_f32;
    return t;
}

} // namespace cpu
} // namespace cnum

#endif // __AVX2__ && __FMA__
