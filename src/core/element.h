#pragma once
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>
#include <type_traits>

namespace cnum {

// ----------------- DType System -----------------
enum class DType {
    Float32,
    Double64,
    Int64,
    Bool
};

inline const char* dtype_to_str(DType dt) {
    switch (dt) {
        case DType::Float32:  return "float32";
        case DType::Double64: return "double64";
        case DType::Int64:    return "int64";
        case DType::Bool:     return "bool";
        default:              return "unknown";
    }
}

// ----------------- Element Traits -----------------
// Admissible element types specialize this. Floating types additionally get
// the arithmetic kernels (see cpu/kernels.h).
template <typename T>
struct ElementTraits;

template <typename T>
struct FloatingElementTraits {
    static constexpr bool is_floating = true;
    static constexpr bool is_additive = true;

    static T none() { return T(0); }
    static T one() { return T(1); }

    template <typename G>
    static T random(T min, T max, G& gen) {
        std::uniform_real_distribution<T> dist(min, max);
        return dist(gen);
    }

    // "%6.3f"
    static std::string describe(T v) {
        std::ostringstream os;
        os << std::fixed << std::setprecision(3) << std::setw(6) << static_cast<double>(v);
        return os.str();
    }
};

template <>
struct ElementTraits<float> : FloatingElementTraits<float> {
    static constexpr DType dtype = DType::Float32;
};

template <>
struct ElementTraits<double> : FloatingElementTraits<double> {
    static constexpr DType dtype = DType::Double64;
};

template <>
struct ElementTraits<int64_t> {
    static constexpr DType dtype = DType::Int64;
    static constexpr bool is_floating = false;
    static constexpr bool is_additive = true;

    static int64_t none() { return 0; }
    static int64_t one() { return 1; }

    template <typename G>
    static int64_t random(int64_t min, int64_t max, G& gen) {
        std::uniform_int_distribution<int64_t> dist(min, max);
        return dist(gen);
    }

    static std::string describe(int64_t v) {
        std::ostringstream os;
        os << std::setw(6) << v;
        return os.str();
    }
};

template <>
struct ElementTraits<bool> {
    static constexpr DType dtype = DType::Bool;
    static constexpr bool is_floating = false;
    static constexpr bool is_additive = false;

    static bool none() { return false; }

    // min == max pins the value, otherwise a fair coin.
    template <typename G>
    static bool random(bool min, bool max, G& gen) {
        if (min == max) return min;
        std::bernoulli_distribution dist(0.5);
        return dist(gen);
    }

    static std::string describe(bool v) { return v ? "true" : "false"; }
};

template <typename T>
using enable_if_floating_t = std::enable_if_t<ElementTraits<T>::is_floating, int>;

template <typename T>
using enable_if_additive_t = std::enable_if_t<ElementTraits<T>::is_additive, int>;

} // namespace cnum
