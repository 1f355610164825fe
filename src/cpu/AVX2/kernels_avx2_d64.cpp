#include "kernels_avx2_d64.h"
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
static inline __m256d masked_loadu_pd(const double* ptr, size_t valid_count, double fill = 0.0) {
    alignas(32) double tmp[4] = {fill, fill, fill, fill};
    for (size_t i = 0; i < valid_count; ++i) tmp[i] = ptr[i];
    return _mm256_load_pd(tmp);
}

static inline void masked_storeu_pd(double* ptr, __m256d v, size_t valid_count) {
    alignas(32) double tmp[4];
    _mm256_store_pd(tmp, v);
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

inline double hmin256_pd(__m256d v) {
    alignas(32) double tmp[4];
    _mm256_store_pd(tmp, v);
    return *std::min_element(tmp, tmp + 4);
}

inline double hmax256_pd(__m256d v) {
    alignas(32) double tmp[4];
    _mm256_store_pd(tmp, v);
    return *std::max_element(tmp, tmp + 4);
}

// out[i] = op(a[i], b[i]) over unit-stride arrays
template <typename VecOp>
inline void binary_avx2(const double* a, const double* b, double* out, size_t n, VecOp op) {
    #pragma omp parallel for schedule(static) if(n >= PARALLEL_THRESHOLD)
    for (size_t i = 0; i < n; i += 4) {
        size_t tail = (n - i < 4) ? (n - i) : 4;
        if (tail == 4) {
            _mm256_storeu_pd(out + i, op(_mm256_loadu_pd(a + i), _mm256_loadu_pd(b + i)));
        } else {
            masked_storeu_pd(out + i, op(masked_loadu_pd(a + i, tail), masked_loadu_pd(b + i, tail, 1.0)), tail);
        }
    }
}

template <typename VecOp>
inline void unary_avx2(const double* a, double* out, size_t n, VecOp op) {
    #pragma omp parallel for schedule(static) if(n >= PARALLEL_THRESHOLD)
    for (size_t i = 0; i < n; i += 4) {
        size_t tail = (n - i < 4) ? (n - i) : 4;
        if (tail == 4) {
            _mm256_storeu_pd(out + i, op(_mm256_loadu_pd(a + i)));
        } else {
            masked_storeu_pd(out + i, op(masked_loadu_pd(a + i, tail)), tail);
        }
    }
}

inline bool unit(std::ptrdiff_t sa, std::ptrdiff_t sb, std::ptrdiff_t so) { return sa == 1 && sb == 1 && so == 1; }

} // namespace

// ========================================================================
//                     Element-wise
// ========================================================================

void vadd_avx2_d64(const double* a, std::ptrdiff_t sa, const double* b, std::ptrdiff_t sb, double* out, std::ptrdiff_t so, size_t n) {
    if (!unit(sa, sb, so)) return vadd_mp<double>(a, sa, b, sb, out, so, n);
    binary_avx2(a, b, out, n, [](__m256d x, __m256d y) { return _mm256_add_pd(x, y); });
}

void vsub_avx2_d64(const double* a, std::ptrdiff_t sa, const double* b, std::ptrdiff_t sb, double* out, std::ptrdiff_t so, size_t n) {
    if (!unit(sa, sb, so)) return vsub_mp<double>(a, sa, b, sb, out, so, n);
    binary_avx2(a, b, out, n, [](__m256d x, __m256d y) { return _mm256_sub_pd(x, y); });
}

void vmul_avx2_d64(const double* a, std::ptrdiff_t sa, const double* b, std::ptrdiff_t sb, double* out, std::ptrdiff_t so, size_t n) {
    if (!unit(sa, sb, so)) return vmul_mp<double>(a, sa, b, sb, out, so, n);
    binary_avx2(a, b, out, n, [](__m256d x, __m256d y) { return _mm256_mul_pd(x, y); });
}

void vdiv_avx2_d64(const double* a, std::ptrdiff_t sa, const double* b, std::ptrdiff_t sb, double* out, std::ptrdiff_t so, size_t n) {
    if (!unit(sa, sb, so)) return vdiv_mp<double>(a, sa, b, sb, out, so, n);
    binary_avx2(a, b, out, n, [](__m256d x, __m256d y) { return _mm256_div_pd(x, y); });
}

// ========================================================================
//                     Scalar-affine
// ========================================================================

void vsmul_avx2_d64(const double* a, std::ptrdiff_t sa, double s, double* out, std::ptrdiff_t so, size_t n) {
    if (!unit(sa, 1, so)) return vsmul_mp<double>(a, sa, s, out, so, n);
    const __m256d vs = _mm256_set1_pd(s);
    unary_avx2(a, out, n, [vs](__m256d x) { return _mm256_mul_pd(x, vs); });
}

void vsadd_avx2_d64(const double* a, std::ptrdiff_t sa, double s, double* out, std::ptrdiff_t so, size_t n) {
    if (!unit(sa, 1, so)) return vsadd_mp<double>(a, sa, s, out, so, n);
    const __m256d vs = _mm256_set1_pd(s);
    unary_avx2(a, out, n, [vs](__m256d x) { return _mm256_add_pd(x, vs); });
}

void vsmsma_avx2_d64(const double* a, std::ptrdiff_t sa, double as, const double* b, std::ptrdiff_t sb, double bs, double* out, std::ptrdiff_t so, size_t n) {
    if (!unit(sa, sb, so)) return vsmsma_mp<double>(a, sa, as, b, sb, bs, out, so, n);
    const __m256d vas = _mm256_set1_pd(as);
    const __m256d vbs = _mm256_set1_pd(bs);
    binary_avx2(a, b, out, n, [vas, vbs](__m256d x, __m256d y) {
        return _mm256_fmadd_pd(x, vas, _mm256_mul_pd(y, vbs));
    });
}

// ========================================================================
//                     Reductions
// ========================================================================

double meanv_avx2_d64(const double* a, std::ptrdiff_t sa, size_t n) {
    if (sa != 1) return meanv_mp<double>(a, sa, n);
    if (n == 0) return 0.0;
    double global_sum = 0.0;

    #pragma omp parallel if(n >= PARALLEL_THRESHOLD)
    {
        __m256d vsum = _mm256_setzero_pd();
        #pragma omp for nowait
        for (size_t i = 0; i < n; i += 4) {
            size_t tail = (n - i < 4) ? (n - i) : 4;
            __m256d v = (tail == 4) ? _mm256_loadu_pd(a + i) : masked_loadu_pd(a + i, tail);
            vsum = _mm256_add_pd(vsum, v);
        }
        double local_sum = hsum256_pd(vsum);
        #pragma omp atomic
        global_sum += local_sum;
    }
    return global_sum / (double)n;
}

double measqv_avx2_d64(const double* a, std::ptrdiff_t sa, size_t n) {
    if (sa != 1) return measqv_mp<double>(a, sa, n);
    if (n == 0) return 0.0;
    double global_sum = 0.0;

    #pragma omp parallel if(n >= PARALLEL_THRESHOLD)
    {
        __m256d vsum = _mm256_setzero_pd();
        #pragma omp for nowait
        for (size_t i = 0; i < n; i += 4) {
            size_t tail = (n - i < 4) ? (n - i) : 4;
            __m256d v = (tail == 4) ? _mm256_loadu_pd(a + i) : masked_loadu_pd(a + i, tail);
            vsum = _mm256_fmadd_pd(v, v, vsum);
        }
        double local_sum = hsum256_pd(vsum);
        #pragma omp atomic
        global_sum += local_sum;
    }
    return global_sum / (double)n;
}

double minv_avx2_d64(const double* a, std::ptrdiff_t sa, size_t n) {
    if (sa != 1) return minv_mp<double>(a, sa, n);
    const double inf = std::numeric_limits<double>::infinity();
    double global_min = inf;

    #pragma omp parallel if(n >= PARALLEL_THRESHOLD)
    {
        __m256d vmin = _mm256_set1_pd(inf);
        #pragma omp for nowait
        for (size_t i = 0; i < n; i += 4) {
            size_t tail = (n - i < 4) ? (n - i) : 4;
            __m256d v = (tail == 4) ? _mm256_loadu_pd(a + i) : masked_loadu_pd(a + i, tail, inf);
            vmin = _mm256_min_pd(vmin, v);
        }
        double local_min = hmin256_pd(vmin);
        #pragma omp critical
        global_min = std::min(global_min, local_min);
    }
    return global_min;
}

double maxv_avx2_d64(const double* a, std::ptrdiff_t sa, size_t n) {
    if (sa != 1) return maxv_mp<double>(a, sa, n);
    const double ninf = -std::numeric_limits<double>::infinity();
    double global_max = ninf;

    #pragma omp parallel if(n >= PARALLEL_THRESHOLD)
    {
        __m256d vmax = _mm256_set1_pd(ninf);
        #pragma omp for nowait
        for (size_t i = 0; i < n; i += 4) {
            size_t tail = (n - i < 4) ? (n - i) : 4;
            __m256d v = (tail == 4) ? _mm256_loadu_pd(a + i) : masked_loadu_pd(a + i, tail, ninf);
            vmax = _mm256_max_pd(vmax, v);
        }
        double local_max = hmax256_pd(vmax);
        #pragma omp critical
        global_max = std::max(global_max, local_max);
    }
    return global_max;
}

// ========================================================================
//                     GEMM (row broadcast, FMA)
// ========================================================================

void gemm_avx2_d64(size_t M, size_t N, size_t K, double alpha, const double* A, size_t lda, const double* B, size_t ldb, double beta, double* C, size_t ldc) {
    #pragma omp parallel for schedule(static) if(M * N * K >= PARALLEL_THRESHOLD)
    for (size_t i = 0; i < M; ++i) {
        double* c_row = C + i * ldc;
        if (beta == 0.0) {
            std::fill(c_row, c_row + N, 0.0);
        } else if (beta != 1.0) {
            for (size_t j = 0; j < N; ++j) c_row[j] *= beta;
        }
        for (size_t k = 0; k < K; ++k) {
            __m256d va = _mm256_set1_pd(alpha * A[i * lda + k]);
            const double* b_row = B + k * ldb;
            size_t j = 0;
            for (; j + 4 <= N; j += 4) {
                __m256d vc = _mm256_loadu_pd(c_row + j);
                __m256d vb = _mm256_loadu_pd(b_row + j);
                vc = _mm256_fmadd_pd(va, vb, vc);
                _mm256_storeu_pd(c_row + j, vc);
            }
            if (j < N) {
                size_t tail = N - j;
                __m256d vc = masked_loadu_pd(c_row + j, tail);
                __m256d vb = masked_loadu_pd(b_row + j, tail);
                vc = _mm256_fmadd_pd(va, vb, vc);
                masked_storeu_pd(c_row + j, vc, tail);
            }
        }
    }
}

KernelTable<double> avx2_table_d64() {
    KernelTable<double> t = generic_table<double>();
    t.vadd = vadd_avx2_d64;
    t.vsub = vsub_avx2_d64;
    t.vmul = vmul_avx2_d64;
    t.vdiv = vdiv_avx2_d64;
    t.vsmul = vsmul_avx2_d64;
    t.vsadd = vsadd_avx2_d64;
    t.vsmsma = vsmsma_avx2_d64;
    t.meanv = meanv_avx2_d64;
    t.measqv = measqv_avx2_d64;
    t.minv = minv_avx2_d64;
    t.maxv = maxv_avx2_d64;
    t.gemm = gemm_avx2_d64;
    return t;
}

} // namespace cpu
} // namespace cnum

#endif // __AVX2__ && __FMA__
