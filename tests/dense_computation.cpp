// Copyright 2020 Marcel Wagenländer

#include "dense_computation.hpp"
#include "cuda_helper.hpp"
#include "helper.hpp"
#include "tensors.hpp"

#include "catch2/catch.hpp"


int test_mat_mat_mult(bool transpose_a, bool transpose_b) {
    CudaHelper cuda_helper;
    Matrix<double> a;
    Matrix<double> b;
    Matrix<double> expected;
    if (!transpose_a && !transpose_b) {
        a = Matrix<double>(2, 3, {1, 2, 3, 4, 5, 6});
        b = Matrix<double>(3, 2, {7, 8, 9, 10, 11, 12});
        expected = Matrix<double>(2, 2, {58, 64, 139, 154});
    } else if (transpose_a) {
        a = Matrix<double>(3, 2, {1, 2, 3, 4, 5, 6});
        b = Matrix<double>(3, 2, {7, 8, 9, 10, 11, 12});
        expected = Matrix<double>(2, 2, {89, 98, 116, 128});
    } else {
        a = Matrix<double>(2, 3, {1, 2, 3, 4, 5, 6});
        b = Matrix<double>(2, 3, {7, 8, 9, 10, 11, 12});
        expected = Matrix<double>(2, 2, {50, 68, 122, 167});
    }

    Matrix<double> result;
    mat_mat_mult(&cuda_helper, a, transpose_a, b, transpose_b, 0.0, &result);

    return compare_mat(&result, &expected, 1e-12, "mat_mat_mult");
}

TEST_CASE("Matrix matrix multiplication", "[dense][gemm]") {
    CHECK(test_mat_mat_mult(false, false));
    CHECK(test_mat_mat_mult(true, false));
    CHECK(test_mat_mat_mult(false, true));
}

TEST_CASE("Matrix matrix multiplication, accumulate", "[dense][gemm]") {
    CudaHelper cuda_helper;
    Matrix<double> a(2, 3, {1, 2, 3, 4, 5, 6});
    Matrix<double> b(3, 2, {7, 8, 9, 10, 11, 12});
    Matrix<double> result(2, 2, {1, 1, 1, 1});
    mat_mat_mult(&cuda_helper, a, false, b, false, 1.0, &result);
    Matrix<double> expected(2, 2, {59, 65, 140, 155});
    CHECK(compare_mat(&result, &expected, 1e-12, "accumulate"));

    Matrix<double> wrong(3, 3);
    REQUIRE_THROWS_WITH(mat_mat_mult(&cuda_helper, a, false, b, false, 1.0, &wrong), Catch::StartsWith("Shape mismatch"));
}

TEST_CASE("Matrix matrix multiplication, shapes", "[dense][gemm]") {
    CudaHelper cuda_helper;
    Matrix<double> a(2, 3, {1, 2, 3, 4, 5, 6});
    Matrix<double> result;
    REQUIRE_THROWS_WITH(mat_mat_mult(&cuda_helper, a, false, a, false, 0.0, &result), Catch::StartsWith("Shape mismatch"));

    // empty inner dimension gives zeros
    Matrix<double> left(2, 0);
    Matrix<double> right(0, 3);
    mat_mat_mult(&cuda_helper, left, false, right, false, 0.0, &result);
    CHECK(result.num_rows_ == 2);
    CHECK(result.num_columns_ == 3);
    CHECK(result.data() == std::vector<double>(6, 0.0));
}

TEST_CASE("Sum rows", "[dense][sumrows]") {
    CudaHelper cuda_helper;
    Matrix<double> mat(3, 2, {1, 2, 3, 4, 5, 6});
    Matrix<double> result;
    sum_rows(&cuda_helper, mat, &result);
    Matrix<double> expected(1, 2, {9, 12});
    CHECK(compare_mat(&result, &expected, 1e-12, "sum_rows"));

    Matrix<double> empty(0, 2);
    sum_rows(&cuda_helper, empty, &result);
    CHECK(result.data() == std::vector<double>({0, 0}));
}

TEST_CASE("Vector vector add", "[dense][axpy]") {
    CudaHelper cuda_helper;
    std::vector<double> x = {1, 2};
    std::vector<double> y = {1, 1};
    vec_vec_add(&cuda_helper, 2.0, x, &y);
    CHECK(y == std::vector<double>({3, 5}));

    std::vector<double> z = {1};
    REQUIRE_THROWS_WITH(vec_vec_add(&cuda_helper, 1.0, x, &z), Catch::StartsWith("Shape mismatch"));
}
