#include <limits>
#include <vector>

#include "numerics.h"
#include "test_common.h"

using namespace cnum;

template <typename T>
void assert_values(const Vector<T>& v, const std::vector<double>& expected, double eps = 1e-6) {
    ASSERT_TRUE(v.size() == expected.size());
    for (size_t i = 0; i < expected.size(); ++i) ASSERT_CLOSE((double)v[i], expected[i], eps);
}

// --- Test Cases ---

void test_add_subtract_roundtrip() {
    log_test("Add / Subtract Roundtrip");
    for_each_backend([] {
        Vector<double> a = Vector<double>::linspace(-3.0, 7.0, 41);
        Vector<double> b = Vector<double>::random(41, -5.0, 5.0);
        Vector<double> back = Ops::subtract(Ops::add(a, b), b);
        for (size_t i = 0; i < a.size(); ++i) ASSERT_CLOSE(back[i], a[i], 1e-12);

        // Strided operands
        Vector<float> big = Vector<float>::linspace(0.0f, 99.0f, 100);
        Vector<float> even = big.strided(2);
        Vector<float> odd = big.slice(1, 100).strided(2);
        Vector<float> sum = Ops::add(even, odd);
        for (size_t i = 0; i < sum.size(); ++i) ASSERT_CLOSE(sum[i], (float)(4 * i + 1), 1e-4);

        Vector<double> shifted = Ops::add(a, 2.5);
        ASSERT_CLOSE(shifted[0], -0.5, 1e-12);
        Vector<double> lowered = Ops::subtract(a, 2.5);
        ASSERT_CLOSE(lowered[40], 4.5, 1e-12);
    });
    passed();
}

void test_scalar_multiply_roundtrip() {
    log_test("Scalar Multiply Roundtrip");
    for_each_backend([] {
        Vector<double> a = Vector<double>::random(1500, -10.0, 10.0);
        double s = 3.75;
        Vector<double> back = Ops::multiply(Ops::multiply(a, s), 1.0 / s);
        for (size_t i = 0; i < a.size(); ++i) ASSERT_CLOSE(back[i], a[i], 1e-12);

        Vector<double> left = Ops::multiply(2.0, a);
        Vector<double> right = a * 2.0;
        ASSERT_TRUE(left == right);
        ASSERT_TRUE((2.0 * a) == right);
    });
    passed();
}

void test_shape_mismatch() {
    log_test("Shape Mismatch Errors");
    Vector<double> a(3), b(4);
    bool caught = false;
    try {
        Ops::add(a, b);
    } catch (const std::invalid_argument& e) {
        caught = std::string(e.what()) == "add: shape mismatch (3) vs (4)";
    }
    ASSERT_TRUE(caught);
    ASSERT_THROWS(Ops::subtract(a, b), std::invalid_argument);
    ASSERT_THROWS(Ops::divide(a, b), std::invalid_argument);
    ASSERT_THROWS(Ops::multiply(a, 2.0, b), std::invalid_argument);
    ASSERT_THROWS(a += b, std::invalid_argument);

    // Output left untouched on failure
    Vector<double> out(4, 9.0);
    ASSERT_THROWS(Ops::add(a, a, out), std::invalid_argument);
    ASSERT_TRUE(out == Vector<double>(4, 9.0));
    passed();
}

void test_cumsum() {
    log_test("Cumulative Sum");
    for_each_backend([] {
        Vector<double> a{3, 1, 4, 1, 5, 9, 2, 6};
        Vector<double> c = a.cumsum();
        ASSERT_TRUE(c[0] == a[0]);
        double run = 0;
        for (size_t i = 0; i < a.size(); ++i) {
            run += a[i];
            ASSERT_CLOSE(c[i], run, 1e-12);
        }

        // In place equals out of place on a copy
        Vector<double> inplace = a.clone();
        Ops::cumsum(inplace, inplace);
        ASSERT_TRUE(inplace == c);

        // Reversed input and a reversed output view
        Vector<float> f{1, 2, 3, 4};
        assert_values(f.reversed().cumsum(), {4, 7, 9, 10});
        Vector<float> g(4);
        Ops::cumsum(f, g.reversed());
        assert_values(g, {10, 6, 3, 1});

        assert_values(Vector<double>{7}.cumsum(), {7});
        ASSERT_THROWS(Vector<double>().cumsum(), std::invalid_argument);
        ASSERT_THROWS(Ops::cumsum(a, Vector<double>(3)), std::invalid_argument);
    });
    passed();
}

void test_linspace_range() {
    log_test("Linspace & Range");
    for_each_backend([] {
        assert_values(Vector<double>::linspace(0.0, 10.0, 11), {0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10}, 1e-12);
        Vector<float> l = Ops::linspace(1.0f, 0.0f, 3);
        assert_values(l, {1, 0.5, 0});
        Vector<double> out(5);
        Ops::linspace(-1.0, 1.0, out.reversed());
        assert_values(out, {1, 0.5, 0, -0.5, -1}, 1e-12);
        ASSERT_THROWS(Vector<double>::linspace(0.0, 1.0, 1), std::invalid_argument);

        assert_values(Vector<double>::range(0.0, 10.0, 2.0), {0, 2, 4, 6, 8});
        assert_values(Vector<double>::range(0.0, 9.0, 2.0), {0, 2, 4, 6, 8});
        assert_values(Vector<double>::range(5.0, 0.0, -1.5), {5, 3.5, 2, 0.5});
        assert_values(Vector<float>::range(0.0f, 3.0f), {0, 1, 2});
        ASSERT_TRUE(Vector<double>::range(1.0, 1.0, 1.0).empty());
        ASSERT_THROWS(Vector<double>::range(0.0, 10.0, -1.0), std::invalid_argument);
        ASSERT_THROWS(Vector<double>::range(0.0, 10.0, 0.0), std::invalid_argument);

        // Non-finite bounds or step
        const double inf = std::numeric_limits<double>::infinity();
        const double nan = std::numeric_limits<double>::quiet_NaN();
        ASSERT_THROWS(Vector<double>::range(0.0, inf, 1.0), std::invalid_argument);
        ASSERT_THROWS(Vector<double>::range(0.0, nan, 1.0), std::invalid_argument);
        ASSERT_THROWS(Vector<double>::range(-inf, 0.0, 1.0), std::invalid_argument);
        ASSERT_THROWS(Vector<double>::range(0.0, 1.0, nan), std::invalid_argument);
        ASSERT_THROWS(Vector<double>::range(0.0, 1e300, 1e-300), std::invalid_argument);
        ASSERT_THROWS(Vector<float>::range(0.0f, 1.0f, std::numeric_limits<float>::infinity()),
                      std::invalid_argument);
    });
    passed();
}

void test_median() {
    log_test("Sliding Median");
    Vector<double> v{1, 5, 2, 8, 3};
    // Position 0 sees the window {1, 1, 5}
    assert_values(Ops::median(v, 3), {1, 2, 5, 3, 3});
    assert_values(Ops::median(v, 1), {1, 5, 2, 8, 3});
    // Window wider than the input: edges keep replicating
    assert_values(Ops::median(Vector<double>{4, 1}, 5), {4, 1});

    // In place
    Vector<double> w = v.clone();
    Ops::median(w, 3, w);
    assert_values(w, {1, 2, 5, 3, 3});

    ASSERT_TRUE(Ops::median(Vector<double>(), 3).empty());
    ASSERT_THROWS(Ops::median(v, 4), std::invalid_argument);
    ASSERT_THROWS(Ops::median(v, 0), std::invalid_argument);
    passed();
}

void test_padding() {
    log_test("Edge Padding");
    Vector<double> v{1, 2, 3};
    assert_values(v.padding(2, 1), {1, 1, 1, 2, 3, 3});
    assert_values(v.padding(0, 0), {1, 2, 3});
    assert_values(v.reversed().padding(1, 2), {3, 3, 2, 1, 1, 1});

    Vector<double> out(4);
    ASSERT_THROWS(Ops::pad(v, 2, 1, PaddingMode::edge, out), std::invalid_argument);
    ASSERT_THROWS(Vector<double>().padding(1, 1), std::invalid_argument);

    // Output overlapping the input
    Vector<double> buf{1, 2, 3, 0, 0};
    Ops::pad(buf.slice(0, 3), 1, 1, PaddingMode::edge, buf);
    assert_values(buf, {1, 1, 2, 3, 3});
    passed();
}

void test_convolution() {
    log_test("1-D Convolution Domains");
    for_each_backend([] {
        Vector<double> v{1, 2, 4, 7, 11, 16};
        Vector<double> k{1, -1};

        // Correlation: in[i] - in[i + 1]
        assert_values(Ops::convolve(v, k), {-1, -2, -3, -4, -5});
        assert_values(v.convolving(k, ConvolutionDomain::valid), {-1, -2, -3, -4, -5});
        // Reversed kernel gives the true convolution
        assert_values(v.convolving(k.reversed(), ConvolutionDomain::valid), {1, 2, 3, 4, 5});

        // same == valid over the edge-padded input
        Vector<double> k3{0.25, 0.5, 0.25};
        Vector<double> same = v.convolving(k3, ConvolutionDomain::same);
        Vector<double> manual = v.padding(1, 1).convolving(k3, ConvolutionDomain::valid);
        ASSERT_TRUE(same.size() == v.size());
        for (size_t i = 0; i < v.size(); ++i) ASSERT_CLOSE(same[i], manual[i], 1e-12);
        ASSERT_CLOSE(same[0], 0.25 * 1 + 0.5 * 1 + 0.25 * 2, 1e-12);

        Vector<double> k4{1, 2, 3, 4};
        Vector<double> same4 = v.convolving(k4);
        Vector<double> manual4 = v.padding(2, 1).convolving(k4, ConvolutionDomain::valid);
        ASSERT_TRUE(same4 == manual4);

        ASSERT_THROWS((Vector<double>{1, 2}.convolving(k3)), std::invalid_argument);
        ASSERT_THROWS(Ops::convolve(v, k, Vector<double>(3)), std::invalid_argument);
        ASSERT_THROWS(Ops::convolve(v, Vector<double>()), std::invalid_argument);
    });
    passed();
}

void test_operators_inplace() {
    log_test("Vector Operators & In-place Forms");
    for_each_backend([] {
        Vector<double> a{1, 2, 3, 4};
        Vector<double> b{0.5, 0.25, 2, -1};

        assert_values(a + b, {1.5, 2.25, 5, 3});
        assert_values(a - b, {0.5, 1.75, 1, 5});
        assert_values(a * b, {0.5, 0.5, 6, -4});
        assert_values(a + 1.0, {2, 3, 4, 5});
        assert_values(a - 1.0, {0, 1, 2, 3});

        Vector<double> c = a.clone();
        c += b;
        ASSERT_TRUE(c == a + b);
        c = a.clone();
        c -= b;
        ASSERT_TRUE(c == a - b);
        c = a.clone();
        c *= b;
        ASSERT_TRUE(c == a * b);
        c = a.clone();
        c *= 3.0;
        ASSERT_TRUE(c == a * 3.0);
        c = a.clone();
        c += 2.0;
        c -= 0.5;
        assert_values(c, {2.5, 3.5, 4.5, 5.5});

        // Compound assignment writes through views
        Vector<double> d{1, 2, 3, 4, 5, 6};
        Vector<double> tail = d.slice(3, 6);
        tail *= 10.0;
        assert_values(d, {1, 2, 3, 40, 50, 60});

        // Output aliasing the input through a reversed view
        Vector<double> e{1, 2, 3};
        Ops::add(e, e, e.reversed());
        assert_values(e, {6, 4, 2});

        assert_values(Ops::scaled_add(a, 2.0, b, 4.0), {4, 5, 14, 4});
        assert_values(Ops::lerp(a, b, 0.5), {0.75, 1.125, 2.5, 1.5});
        assert_values(Ops::divide(a, b), {2, 8, 1.5, -4});
        assert_values(Ops::element_wise_multiply(a, b), {0.5, 0.5, 6, -4});
    });
    passed();
}

void test_reductions() {
    log_test("Reductions over Compact and Strided Views");
    for_each_backend([] {
        Vector<double> v = Vector<double>::random(3001, -50.0, 50.0);
        for (const Vector<double>& view : {v, v.reversed(), v.strided(3), v.slice(7, 2000).strided(-5)}) {
            Vector<double> compact = view.clone();
            ASSERT_CLOSE(view.mean(), compact.mean(), 1e-9);
            ASSERT_CLOSE(view.mean_square(), compact.mean_square(), 1e-6);
            ASSERT_TRUE(view.minimum() == compact.minimum());
            ASSERT_TRUE(view.maximum() == compact.maximum());
        }

        Vector<float> f{2, -1, 4, 3};
        ASSERT_CLOSE(f.mean(), 2.0f, 1e-6);
        ASSERT_CLOSE(f.mean_square(), 7.5f, 1e-6);
        ASSERT_TRUE(f.minimum() == -1.0f);
        ASSERT_TRUE(f.maximum() == 4.0f);

        Vector<double> empty;
        ASSERT_TRUE(empty.mean() == 0.0);
        ASSERT_TRUE(empty.minimum() == std::numeric_limits<double>::infinity());
        ASSERT_TRUE(empty.maximum() == -std::numeric_limits<double>::infinity());
    });
    passed();
}

int main() {
    std::cout << "      RUNNING VECTOR OPS TESTS       " << std::endl;

    test_add_subtract_roundtrip();
    test_scalar_multiply_roundtrip();
    test_shape_mismatch();
    test_cumsum();
    test_linspace_range();
    test_median();
    test_padding();
    test_convolution();
    test_operators_inplace();
    test_reductions();

    std::cout << "All tests completed successfully." << std::endl;
    return 0;
}
