#include "kernels.h"
#include "kernels_mp.h"
#include "kernels_avx2_f32.h"
#include "kernels_avx2_d64.h"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

#if defined(__GNUC__) || defined(__clang__)
  #if defined(__x86_64__) || defined(__i386__)
    #define HAS_BUILTIN_CPU_SUPPORTS 1
  #endif
#endif

namespace cnum {
namespace cpu {

// CPU Feature Detection
static inline bool cpu_has_avx2_fma() {
#ifdef HAS_BUILTIN_CPU_SUPPORTS
    return __builtin_cpu_supports("avx2") && __builtin_cpu_supports("fma");
#else
    return false;
#endif
}

// ========================================================================
//                     STATIC DISPATCH REGISTRY
// ========================================================================

struct DispatchTable {
    Backend backend;
    KernelTable<float> f32;
    KernelTable<double> d64;

    DispatchTable() {
        // 1. Best backend the CPU supports
        Backend chosen = backend_available(Backend::avx2) ? Backend::avx2 : Backend::generic;

        // 2. Environment override
        if (const char* env = std::getenv("CNUM_BACKEND")) {
            if (std::strcmp(env, "generic") == 0) {
                chosen = Backend::generic;
            } else if (std::strcmp(env, "avx2") == 0) {
                if (backend_available(Backend::avx2)) chosen = Backend::avx2;
                else std::cerr << "[cnum] Warning: CNUM_BACKEND=avx2 requested but not available, using "
                               << backend_name(chosen) << "\n";
            } else {
                std::cerr << "[cnum] Warning: unknown CNUM_BACKEND '" << env << "', using "
                          << backend_name(chosen) << "\n";
            }
        }
        install(chosen);
    }

    void install(Backend b) {
        backend = b;
        f32 = generic_table<float>();
        d64 = generic_table<double>();
#if defined(CNUM_HAVE_AVX2)
        if (b == Backend::avx2) {
            f32 = avx2_table_f32();
            d64 = avx2_table_d64();
        }
#endif
    }
};

static DispatchTable& get_registry() {
    static DispatchTable table;
    return table;
}

template <>
const KernelTable<float>& kernels<float>() { return get_registry().f32; }

template <>
const KernelTable<double>& kernels<double>() { return get_registry().d64; }

Backend active_backend() { return get_registry().backend; }

bool backend_available(Backend backend) {
    switch (backend) {
        case Backend::generic: return true;
        case Backend::avx2:
#if defined(CNUM_HAVE_AVX2)
            return cpu_has_avx2_fma();
#else
            return false;
#endif
    }
    return false;
}

void set_backend(Backend backend) {
    if (!backend_available(backend))
        throw std::runtime_error(std::string("set_backend: backend '") + backend_name(backend) +
                                 "' is not available on this build or CPU");
    get_registry().install(backend);
}

const char* backend_name(Backend backend) {
    switch (backend) {
        case Backend::generic: return "generic";
        case Backend::avx2:    return "avx2";
        default:               return "unknown";
    }
}

} // namespace cpu
} // namespace cnum
