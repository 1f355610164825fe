#pragma once
#include "kernels.h"

namespace cnum {
namespace cpu {

// ========================================================================
//                     AVX2 / FMA kernels (Double64)
// ========================================================================

#if defined(CNUM_HAVE_AVX2)

void vadd_avx2_d64(const double* a, std::ptrdiff_t sa, const double* b, std::ptrdiff_t sb, double* out, std::ptrdiff_t so, size_t n);
void vsub_avx2_d64(const double* a, std::ptrdiff_t sa, const double* b, std::ptrdiff_t sb, double* out, std::ptrdiff_t so, size_t n);
void vmul_avx2_d64(const double* a, std::ptrdiff_t sa, const double* b, std::ptrdiff_t sb, double* out, std::ptrdiff_t so, size_t n);
void vdiv_avx2_d64(const double* a, std::ptrdiff_t sa, const double* b, std::ptrdiff_t sb, double* out, std::ptrdiff_t so, size_t n);

void vsmul_avx2_d64(const double* a, std::ptrdiff_t sa, double s, double* out, std::ptrdiff_t so, size_t n);
void vsadd_avx2_d64(const double* a, std::ptrdiff_t sa, double s, double* out, std::ptrdiff_t so, size_t n);
void vsmsma_avx2_d64(const double* a, std::ptrdiff_t sa, double as, const double* b, std::ptrdiff_t sb, double bs, double* out, std::ptrdiff_t so, size_t n);

double meanv_avx2_d64(const double* a, std::ptrdiff_t sa, size_t n);
double measqv_avx2_d64(const double* a, std::ptrdiff_t sa, size_t n);
double minv_avx2_d64(const double* a, std::ptrdiff_t sa, size_t n);
double maxv_avx2_d64(const double* a, std::ptrdiff_t sa, size_t n);

void gemm_avx2_d64(size_t M, size_t N, size_t K, double alpha, const double* A, size_t lda, const double* B, size_t ldb, double beta, double* C, size_t ldc);

KernelTable<double> avx2_table_d64();

#endif // CNUM_HAVE_AVX2

} // namespace cpu
} // namespace cnum
