#include <random>
#include <vector>

#include "numerics.h"
#include "test_common.h"

using namespace cnum;

template <typename T>
Matrix<T> naive_multiply(const Matrix<T>& a, const Matrix<T>& b) {
    Matrix<T> out(a.rows(), b.columns());
    for (size_t i = 0; i < a.rows(); ++i)
        for (size_t j = 0; j < b.columns(); ++j) {
            double acc = 0;
            for (size_t k = 0; k < a.columns(); ++k) acc += (double)a(i, k) * (double)b(k, j);
            out(i, j) = (T)acc;
        }
    return out;
}

template <typename T>
void assert_matrix_close(const Matrix<T>& got, const Matrix<T>& expected, double eps) {
    ASSERT_TRUE(got.rows() == expected.rows() && got.columns() == expected.columns());
    for (size_t i = 0; i < got.rows(); ++i)
        for (size_t j = 0; j < got.columns(); ++j) ASSERT_CLOSE((double)got(i, j), (double)expected(i, j), eps);
}

Matrix<double> ramp(size_t rows, size_t columns) {
    Matrix<double> m(rows, columns);
    set_index_ramp(m);
    return m;
}

// --- Test Cases ---

void test_matmul_compact() {
    log_test("Matrix Multiply (compact)");
    for_each_backend([] {
        Matrix<double> a{{1, 2, 3}, {4, 5, 6}};
        Matrix<double> b{{7, 8}, {9, 10}, {11, 12}};
        Matrix<double> c = Ops::multiply(a, b);
        ASSERT_TRUE((c == Matrix<double>{{58, 64}, {139, 154}}));

        Matrix<float> x = Matrix<float>::random(19, 33, -1.0f, 1.0f);
        Matrix<float> y = Matrix<float>::random(33, 11, -1.0f, 1.0f);
        assert_matrix_close(Ops::multiply(x, y), naive_multiply(x, y), 1e-4);
        assert_matrix_close(x * y, naive_multiply(x, y), 1e-4);
    });
    passed();
}

void test_matmul_views() {
    log_test("Matrix Multiply (sliced / transposed operands and outputs)");
    for_each_backend([] {
        Matrix<double> big = ramp(6, 6);
        Matrix<double> a = big.slice(1, 4, 0, 5);                      // 3x5, row stride 6
        Matrix<double> b = big.transposed_view().slice(0, 5, 1, 3);    // 5x2, swapped strides
        Matrix<double> expected = naive_multiply(a, b);
        assert_matrix_close(Ops::multiply(a, b), expected, 1e-9);

        // Non-compact output view
        Matrix<double> canvas(4, 4, -1.0);
        Ops::multiply(a, b, canvas.slice(0, 3, 1, 3));
        assert_matrix_close(canvas.slice(0, 3, 1, 3), expected, 1e-9);
        ASSERT_TRUE(canvas(0, 0) == -1.0 && canvas(3, 3) == -1.0 && canvas(0, 3) == -1.0);

        // Output aliasing both operands
        Matrix<double> m{{1, 2}, {3, 4}};
        Matrix<double> square = naive_multiply(m, m);
        Ops::multiply(m, m, m);
        ASSERT_TRUE(m == square);
    });
    passed();
}

void test_matmul_errors() {
    log_test("Matrix Multiply Dimension Checks");
    Matrix<double> a(2, 3), b(2, 3);
    ASSERT_THROWS(Ops::multiply(a, b), std::invalid_argument);
    ASSERT_THROWS(a * b, std::invalid_argument);

    Matrix<double> out(2, 2, 5.0);
    ASSERT_THROWS(Ops::multiply(a, b.transposed_view(), Matrix<double>(3, 3)), std::invalid_argument);
    ASSERT_THROWS(Ops::multiply(a, Matrix<double>(3, 4), out), std::invalid_argument);
    ASSERT_TRUE(out == Matrix<double>(2, 2, 5.0));

    ASSERT_THROWS(Ops::multiply(a, Vector<double>(2)), std::invalid_argument);
    ASSERT_THROWS(Ops::multiply(a, Vector<double>(3), Vector<double>(3)), std::invalid_argument);
    ASSERT_THROWS((void)Matrix<double>(Storage<double>(Shape{3})), std::invalid_argument);
    passed();
}

void test_matvec() {
    log_test("Matrix x Vector");
    for_each_backend([] {
        Matrix<double> a{{1, 2, 3}, {4, 5, 6}};
        Vector<double> v{1, 0, -1};
        Vector<double> r = Ops::multiply(a, v);
        ASSERT_TRUE(r.size() == 2);
        ASSERT_CLOSE(r[0], -2.0, 1e-12);
        ASSERT_CLOSE(r[1], -2.0, 1e-12);
        ASSERT_TRUE((a * v) == r);

        // Strided vector (a matrix column) into a strided output
        Matrix<double> big = ramp(6, 6);
        Matrix<double> m = big.slice(0, 3, 0, 5);
        Vector<double> col = big.column(2).slice(0, 5);
        ASSERT_TRUE(!col.is_compact());
        Vector<double> out(6, 9.0);
        Ops::multiply(m, col, out.strided(2));
        for (size_t i = 0; i < 3; ++i) {
            double acc = 0;
            for (size_t k = 0; k < 5; ++k) acc += m(i, k) * col[k];
            ASSERT_CLOSE(out[2 * i], acc, 1e-9);
            ASSERT_TRUE(out[2 * i + 1] == 9.0);
        }

        // Output is a row of the operand matrix
        Matrix<float> sq{{2, 0}, {1, 1}};
        Vector<float> x{3, 4};
        Ops::multiply(sq, x, sq.row(1));
        ASSERT_CLOSE(sq(1, 0), 6.0f, 1e-6);
        ASSERT_CLOSE(sq(1, 1), 7.0f, 1e-6);
    });
    passed();
}

void test_elementwise_on_slices() {
    log_test("Element-wise Multiply / Divide on Slices");
    for_each_backend([] {
        Matrix<double> big = ramp(5, 7);
        Matrix<double> a = big.slice(1, 4, 2, 6);
        Matrix<double> b = big.transposed_view().slice(0, 3, 0, 4);
        Matrix<double> ac = a.clone(), bc = b.clone();

        Matrix<double> prod = Ops::element_wise_multiply(a, b);
        Matrix<double> quot = Ops::divide(a, Ops::add(b, 1.0));
        for (size_t i = 0; i < 3; ++i)
            for (size_t j = 0; j < 4; ++j) {
                ASSERT_CLOSE(prod(i, j), ac(i, j) * bc(i, j), 1e-12);
                ASSERT_CLOSE(quot(i, j), ac(i, j) / (bc(i, j) + 1.0), 1e-12);
            }

        Matrix<double> m{{2, 9}, {8, 3}};
        Matrix<double> d{{2, 3}, {4, 3}};
        m /= d;
        ASSERT_TRUE((m == Matrix<double>{{1, 3}, {2, 1}}));

        ASSERT_THROWS(Ops::divide(m, Matrix<double>(2, 3)), std::invalid_argument);
    });
    passed();
}

void test_transpose() {
    log_test("Transpose Roundtrip");
    for_each_backend([] {
        Matrix<double> m = ramp(4, 7);
        Matrix<double> t = m.transposed();
        ASSERT_TRUE(t.rows() == 7 && t.columns() == 4);
        ASSERT_TRUE(t(6, 1) == m(1, 6));
        ASSERT_TRUE(t.transposed() == m);
        ASSERT_TRUE(t == m.transposed_view());

        // Sliced source and a sliced destination
        Matrix<double> s = m.slice(1, 4, 2, 6);
        ASSERT_TRUE(s.transposed().transposed() == s);
        Matrix<double> canvas(6, 6, 0.0);
        Ops::transpose(s, canvas.slice(1, 5, 2, 5));
        ASSERT_TRUE(canvas.slice(1, 5, 2, 5) == s.transposed_view());
        ASSERT_TRUE(canvas(0, 0) == 0.0);

        // In place through the same buffer
        Matrix<float> sq{{1, 2, 3}, {4, 5, 6}, {7, 8, 9}};
        Ops::transpose(sq, sq);
        ASSERT_TRUE((sq == Matrix<float>{{1, 4, 7}, {2, 5, 8}, {3, 6, 9}}));

        ASSERT_THROWS(Ops::transpose(m, Matrix<double>(4, 7)), std::invalid_argument);
    });
    passed();
}

void test_conv2d() {
    log_test("2-D Convolution (float)");
    for_each_backend([] {
        Matrix<float> img{{1, 2, 3}, {4, 5, 6}, {7, 8, 9}};
        Matrix<float> box = Matrix<float>::ones(3, 3);

        Matrix<float> bg = Ops::convolve(img, box);
        ASSERT_CLOSE(bg(1, 1), 45.0f, 1e-5);
        ASSERT_CLOSE(bg(0, 0), 12.0f, 1e-5);
        ASSERT_CLOSE(bg(2, 2), 5.0f + 6 + 8 + 9, 1e-5);

        Matrix<float> ext = Ops::convolve(img, box, EdgeMode::extend);
        ASSERT_CLOSE(ext(1, 1), 45.0f, 1e-5);
        ASSERT_CLOSE(ext(0, 0), 1 * 4 + 2 * 2 + 4 * 2 + 5, 1e-5);

        // Correlation, not convolution: a shift kernel picks the right neighbour
        Matrix<float> shift{{0, 0, 0}, {0, 0, 1}, {0, 0, 0}};
        Matrix<float> shifted = Ops::convolve(img, shift, EdgeMode::background, -1.0f);
        ASSERT_CLOSE(shifted(0, 0), 2.0f, 1e-6);
        ASSERT_CLOSE(shifted(1, 2), -1.0f, 1e-6);

        // Views give the same result as their clone
        std::mt19937 gen(3);
        Matrix<float> big(6, 6);
        big.fill_random(-1.0f, 1.0f, gen);
        Matrix<float> window = big.slice(1, 5, 1, 6);
        assert_matrix_close(Ops::convolve(window, box), Ops::convolve(window.clone(), box), 1e-5);
        Matrix<float> flipped = big.transposed_view();
        assert_matrix_close(Ops::convolve(flipped, box, EdgeMode::extend),
                            Ops::convolve(flipped.clone(), box, EdgeMode::extend), 1e-5);
    });
    passed();
}

void test_conv2d_errors() {
    log_test("2-D Convolution Argument Checks");
    Matrix<float> img(4, 4, 1.0f);
    ASSERT_THROWS(Ops::convolve(img, Matrix<float>(2, 3, 1.0f)), std::invalid_argument);
    ASSERT_THROWS(Ops::convolve(img, Matrix<float>(3, 4, 1.0f).slice(0, 3, 0, 3)), std::invalid_argument);
    ASSERT_THROWS(Ops::convolve(img, Matrix<float>::ones(3, 3), Matrix<float>(4, 3)), std::invalid_argument);
    passed();
}

void test_matrix_operators() {
    log_test("Matrix Operators");
    for_each_backend([] {
        Matrix<double> a{{1, 2}, {3, 4}};
        Matrix<double> b{{5, 6}, {7, 8}};
        ASSERT_TRUE(((a + b) == Matrix<double>{{6, 8}, {10, 12}}));
        ASSERT_TRUE(((b - a) == Matrix<double>(2, 2, 4.0)));
        ASSERT_TRUE(((a * b) == Matrix<double>{{19, 22}, {43, 50}}));
        ASSERT_TRUE(((a * 2.0) == Matrix<double>{{2, 4}, {6, 8}}));
        ASSERT_TRUE(((2.0 * a) == (a * 2.0)));
        assert_matrix_close(b / 2.0, Matrix<double>{{2.5, 3}, {3.5, 4}}, 1e-12);

        // In place equals out of place on a copy
        Matrix<double> c = a.clone();
        c *= 3.0;
        ASSERT_TRUE(c == a * 3.0);
        ASSERT_TRUE(a(1, 1) == 4.0);

        Matrix<double> view = b.slice(0, 2, 1, 2);
        view *= 10.0;
        ASSERT_TRUE(b(0, 1) == 60.0 && b(1, 1) == 80.0 && b(0, 0) == 5.0);
    });
    passed();
}

void test_matrix_reductions() {
    log_test("Matrix Reductions on Views");
    for_each_backend([] {
        Matrix<double> m = Matrix<double>::random(40, 50, -3.0, 3.0);
        for (const Matrix<double>& v : {m.slice(3, 37, 5, 44), m.transposed_view(), m.slice(0, 40, 10, 11)}) {
            Matrix<double> c = v.clone();
            ASSERT_TRUE(c.is_compact());
            ASSERT_CLOSE(v.mean(), c.mean(), 1e-9);
            ASSERT_CLOSE(v.mean_square(), c.mean_square(), 1e-9);
            ASSERT_TRUE(v.minimum() == c.minimum());
            ASSERT_TRUE(v.maximum() == c.maximum());
        }

        // Compact and transposed float views take different kernel paths
        Matrix<float> flat(4000, 5000, 0.1f);
        ASSERT_CLOSE((double)flat.mean(), (double)0.1f, 1e-6);
        ASSERT_CLOSE((double)flat.transposed_view().mean(), (double)flat.mean(), 1e-6);
        ASSERT_CLOSE((double)flat.transposed_view().mean_square(), (double)flat.mean_square(), 1e-7);
        ASSERT_CLOSE((double)flat.slice(1, 3999, 2, 4998).mean(), (double)flat.mean(), 1e-6);

        Matrix<double> k = ramp(3, 4);
        ASSERT_CLOSE(k.mean(), 5.5, 1e-12);
        ASSERT_CLOSE(k.minimum(), 0.0, 0.0);
        ASSERT_CLOSE(k.maximum(), 11.0, 0.0);
        ASSERT_CLOSE(Matrix<double>::ones(3, 3).mean_square(), 1.0, 1e-12);
        ASSERT_CLOSE(Matrix<double>::zeros(2, 5).maximum(), 0.0, 0.0);
    });
    passed();
}

int main() {
    std::cout << "      RUNNING MATRIX OPS TESTS       " << std::endl;

    test_matmul_compact();
    test_matmul_views();
    test_matmul_errors();
    test_matvec();
    test_elementwise_on_slices();
    test_transpose();
    test_conv2d();
    test_conv2d_errors();
    test_matrix_operators();
    test_matrix_reductions();

    std::cout << "All tests completed successfully." << std::endl;
    return 0;
}
