#pragma once
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "kernels.h"

// --- Simple Test Framework ---
#define ASSERT_CLOSE(a, b, eps) \
    do { \
        if (std::abs((a) - (b)) > (eps)) { \
            std::cerr << "Assertion failed: " << (a) << " != " << (b) \
                      << " (diff: " << std::abs((a)-(b)) << ") at line " \
                      << __LINE__ << std::endl; \
            std::exit(1); \
        } \
    } while(0)

#define ASSERT_TRUE(cond) \
    do { \
        if (!(cond)) { \
            std::cerr << "Assertion failed: " << #cond << " at line " << __LINE__ << std::endl; \
            std::exit(1); \
        } \
    } while(0)

#define ASSERT_THROWS(expr, exception_type) \
    do { \
        bool caught_ = false; \
        try { expr; } catch (const exception_type&) { caught_ = true; } \
        if (!caught_) { \
            std::cerr << "Expected " << #exception_type << " from " << #expr \
                      << " at line " << __LINE__ << std::endl; \
            std::exit(1); \
        } \
    } while(0)

inline void log_test(const std::string& name) {
    std::cout << "[TEST] " << name << "..." << std::endl;
}
inline void passed() {
    std::cout << " -> PASSED\n" << std::endl;
}

// Runs body once per kernel backend this build and CPU support.
template <typename F>
void for_each_backend(F body) {
    for (auto b : {cnum::cpu::Backend::generic, cnum::cpu::Backend::avx2}) {
        if (!cnum::cpu::backend_available(b)) continue;
        cnum::cpu::set_backend(b);
        std::cout << "  backend: " << cnum::cpu::backend_name() << std::endl;
        body();
    }
}
