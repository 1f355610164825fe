#pragma once
#include "kernels.h"
#include <cstddef>

namespace cnum {
namespace cpu {

// ======================================================================================
//                     PORTABLE KERNELS (OpenMP, any stride)
// ======================================================================================
// Instantiated for float and double in kernels_mp.cpp.

template <typename T> void vadd_mp(const T* a, std::ptrdiff_t sa, const T* b, std::ptrdiff_t sb, T* out, std::ptrdiff_t so, size_t n);
template <typename T> void vsub_mp(const T* a, std::ptrdiff_t sa, const T* b, std::ptrdiff_t sb, T* out, std::ptrdiff_t so, size_t n);
template <typename T> void vmul_mp(const T* a, std::ptrdiff_t sa, const T* b, std::ptrdiff_t sb, T* out, std::ptrdiff_t so, size_t n);
template <typename T> void vdiv_mp(const T* a, std::ptrdiff_t sa, const T* b, std::ptrdiff_t sb, T* out, std::ptrdiff_t so, size_t n);

template <typename T> void vsmul_mp(const T* a, std::ptrdiff_t sa, T s, T* out, std::ptrdiff_t so, size_t n);
template <typename T> void vsadd_mp(const T* a, std::ptrdiff_t sa, T s, T* out, std::ptrdiff_t so, size_t n);
template <typename T> void vsmsma_mp(const T* a, std::ptrdiff_t sa, T as, const T* b, std::ptrdiff_t sb, T bs, T* out, std::ptrdiff_t so, size_t n);
template <typename T> void vramp_mp(T start, T step, T* out, std::ptrdiff_t so, size_t n);

template <typename T> T meanv_mp(const T* a, std::ptrdiff_t sa, size_t n);
template <typename T> T measqv_mp(const T* a, std::ptrdiff_t sa, size_t n);
template <typename T> T minv_mp(const T* a, std::ptrdiff_t sa, size_t n);
template <typename T> T maxv_mp(const T* a, std::ptrdiff_t sa, size_t n);

template <typename T> void vrsum_mp(const T* a, std::ptrdiff_t sa, T scale, T* out, std::ptrdiff_t so, size_t n);
template <typename T> void conv_mp(const T* in, std::ptrdiff_t si, const T* kernel, std::ptrdiff_t sk, T* out, std::ptrdiff_t so, size_t n_out, size_t n_kernel);
template <typename T> void gemm_mp(size_t M, size_t N, size_t K, T alpha, const T* A, size_t lda, const T* B, size_t ldb, T beta, T* C, size_t ldc);
template <typename T> void mtrans_mp(const T* a, std::ptrdiff_t sa, T* out, std::ptrdiff_t so, size_t m, size_t n);

// Table of the portable kernels for T.
template <typename T> KernelTable<T> generic_table();

} // namespace cpu
} // namespace cnum
