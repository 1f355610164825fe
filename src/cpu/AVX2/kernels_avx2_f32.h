#pragma once
#include "kernels.h"

namespace cnum {
namespace cpu {

// ========================================================================
//                     AVX2 / FMA kernels (Float32)
// ========================================================================
// Unit-stride paths are vectorized; any other stride falls back to the
// portable kernel. Only declared when the build compiled them in.

#if defined(CNUM_HAVE_AVX2)

void vadd_avx2_f32(const float* a, std::ptrdiff_t sa, const float* b, std::ptrdiff_t sb, float* out, std::ptrdiff_t so, size_t n);
void vsub_avx2_f32(const float* a, std::ptrdiff_t sa, const float* b, std::ptrdiff_t sb, float* out, std::ptrdiff_t so, size_t n);
void vmul_avx2_f32(const float* a, std::ptrdiff_t sa, const float* b, std::ptrdiff_t sb, float* out, std::ptrdiff_t so, size_t n);
void vdiv_avx2_f32(const float* a, std::ptrdiff_t sa, const float* b, std::ptrdiff_t sb, float* out, std::ptrdiff_t so, size_t n);

void vsmul_avx2_f32(const float* a, std::ptrdiff_t sa, float s, float* out, std::ptrdiff_t so, size_t n);
void vsadd_avx2_f32(const float* a, std::ptrdiff_t sa, float s, float* out, std::ptrdiff_t so, size_t n);
void vsmsma_avx2_f32(const float* a, std::ptrdiff_t sa, float as, const float* b, std::ptrdiff_t sb, float bs, float* out, std::ptrdiff_t so, size_t n);

float meanv_avx2_f32(const float* a, std::ptrdiff_t sa, size_t n);
float measqv_avx2_f32(const float* a, std::ptrdiff_t sa, size_t n);
float minv_avx2_f32(const float* a, std::ptrdiff_t sa, size_t n);
float maxv_avx2_f32(const float* a, std::ptrdiff_t sa, size_t n);

void gemm_avx2_f32(size_t M, size_t N, size_t K, float alpha, const float* A, size_t lda, const float* B, size_t ldb, float beta, float* C, size_t ldc);

// Portable table with the AVX2 entries swapped in.
KernelTable<float> avx2_table_f32();

#endif // CNUM_HAVE_AVX2

} // namespace cpu
} // namespace cnum
