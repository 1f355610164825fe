#include "ops.h"
#include "ops_support.h"
#include "reduction.h"

namespace cnum {
namespace Ops {

using detail::check_same_shape;
using detail::overlaps;
using detail::write_through;

namespace {

template <typename T>
void binary_op(const char* name, typename cpu::KernelTable<T>::BinaryFn fn, const Array<T>& a, const Array<T>& b,
               const Array<T>& out) {
    check_same_shape(name, a, b);
    check_same_shape(name, a, out);
    write_through(out, overlaps(out, a) || overlaps(out, b), [&](const Array<T>& target) {
        with_linearized_accesses(a.storage(), b.storage(), target.storage(),
                                 [&](LinearAccess<T> x, LinearAccess<T> y, LinearAccess<T> o) {
                                     fn(x.base, x.stride, y.base, y.stride, o.base, o.stride, x.count);
                                 });
    });
}

template <typename T>
void scalar_op(const char* name, typename cpu::KernelTable<T>::ScalarFn fn, const Array<T>& a, T s,
               const Array<T>& out) {
    check_same_shape(name, a, out);
    write_through(out, overlaps(out, a), [&](const Array<T>& target) {
        with_linearized_accesses(a.storage(), target.storage(), [&](LinearAccess<T> x, LinearAccess<T> o) {
            fn(x.base, x.stride, s, o.base, o.stride, x.count);
        });
    });
}

template <typename Fold, typename T>
T reduce(typename cpu::KernelTable<T>::ReduceFn fn, const Array<T>& a) {
    Fold fold;
    with_linearized_accesses(a.storage(), [&](LinearAccess<T> acc) {
        fold.add(fn(acc.base, acc.stride, acc.count), acc.count);
    });
    return fold.result();
}

} // namespace

// ----------------- Element-wise -----------------

template <typename T>
void add(const Array<T>& a, const Array<T>& b, const Array<T>& out) {
    binary_op<T>("add", cpu::kernels<T>().vadd, a, b, out);
}

template <typename T>
void add(const Array<T>& a, typename Array<T>::value_type s, const Array<T>& out) {
    scalar_op<T>("add", cpu::kernels<T>().vsadd, a, s, out);
}

template <typename T>
void subtract(const Array<T>& a, const Array<T>& b, const Array<T>& out) {
    binary_op<T>("subtract", cpu::kernels<T>().vsub, a, b, out);
}

template <typename T>
void subtract(const Array<T>& a, typename Array<T>::value_type s, const Array<T>& out) {
    scalar_op<T>("subtract", cpu::kernels<T>().vsadd, a, -s, out);
}

template <typename T>
void multiply(const Array<T>& a, typename Array<T>::value_type s, const Array<T>& out) {
    scalar_op<T>("multiply", cpu::kernels<T>().vsmul, a, s, out);
}

template <typename T>
void multiply(typename Array<T>::value_type s, const Array<T>& a, const Array<T>& out) {
    scalar_op<T>("multiply", cpu::kernels<T>().vsmul, a, s, out);
}

template <typename T>
void element_wise_multiply(const Array<T>& a, const Array<T>& b, const Array<T>& out) {
    binary_op<T>("element_wise_multiply", cpu::kernels<T>().vmul, a, b, out);
}

template <typename T>
void divide(const Array<T>& a, const Array<T>& b, const Array<T>& out) {
    binary_op<T>("divide", cpu::kernels<T>().vdiv, a, b, out);
}

template <typename T>
void scaled_add(const Array<T>& a, typename Array<T>::value_type as, const Array<T>& b,
                typename Array<T>::value_type bs, const Array<T>& out) {
    check_same_shape("scaled_add", a, b);
    check_same_shape("scaled_add", a, out);
    auto fn = cpu::kernels<T>().vsmsma;
    write_through(out, overlaps(out, a) || overlaps(out, b), [&](const Array<T>& target) {
        with_linearized_accesses(a.storage(), b.storage(), target.storage(),
                                 [&](LinearAccess<T> x, LinearAccess<T> y, LinearAccess<T> o) {
                                     fn(x.base, x.stride, as, y.base, y.stride, bs, o.base, o.stride, x.count);
                                 });
    });
}

template <typename T>
void lerp(const Array<T>& a, const Array<T>& b, typename Array<T>::value_type t, const Array<T>& out) {
    scaled_add(a, T(1) - t, b, t, out);
}

// ----------------- Reductions -----------------

template <typename T>
T mean(const Array<T>& a) { return reduce<MeanFold<T>>(cpu::kernels<T>().meanv, a); }

template <typename T>
T mean_square(const Array<T>& a) { return reduce<MeanFold<T>>(cpu::kernels<T>().measqv, a); }

template <typename T>
T minimum(const Array<T>& a) { return reduce<MinFold<T>>(cpu::kernels<T>().minv, a); }

template <typename T>
T maximum(const Array<T>& a) { return reduce<MaxFold<T>>(cpu::kernels<T>().maxv, a); }

#define CNUM_INSTANTIATE_OPS(T)                                                                         \
    template void add<T>(const Array<T>&, const Array<T>&, const Array<T>&);                           \
    template void add<T>(const Array<T>&, T, const Array<T>&);                                          \
    template void subtract<T>(const Array<T>&, const Array<T>&, const Array<T>&);                      \
    template void subtract<T>(const Array<T>&, T, const Array<T>&);                                     \
    template void multiply<T>(const Array<T>&, T, const Array<T>&);                                     \
    template void multiply<T>(T, const Array<T>&, const Array<T>&);                                     \
    template void element_wise_multiply<T>(const Array<T>&, const Array<T>&, const Array<T>&);         \
    template void divide<T>(const Array<T>&, const Array<T>&, const Array<T>&);                        \
    template void scaled_add<T>(const Array<T>&, T, const Array<T>&, T, const Array<T>&);              \
    template void lerp<T>(const Array<T>&, const Array<T>&, T, const Array<T>&);                       \
    template T mean<T>(const Array<T>&);                                                                \
    template T mean_square<T>(const Array<T>&);                                                         \
    template T minimum<T>(const Array<T>&);                                                             \
    template T maximum<T>(const Array<T>&);

CNUM_INSTANTIATE_OPS(float)
CNUM_INSTANTIATE_OPS(double)

#undef CNUM_INSTANTIATE_OPS

} // namespace Ops
} // namespace cnum
