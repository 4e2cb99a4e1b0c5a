// Copyright 2020 Marcel Wagenländer

#include "tensors.hpp"

#include "catch2/catch.hpp"
#include <cmath>
#include <limits>


TEST_CASE("Matrix from values", "[tensors][matrix]") {
    Matrix<double> mat(2, 3, {1, 2, 3, 4, 5, 6});
    CHECK(mat.size_ == 6);
    CHECK(mat.get(0, 2) == 3.0);
    CHECK(mat.get(1, 0) == 4.0);

    mat.set_value(1, 1, -1.0);
    CHECK(mat.values_[4] == -1.0);

    REQUIRE_THROWS_WITH(Matrix<double>(2, 2, {1, 2, 3}), Catch::StartsWith("Shape mismatch"));
    REQUIRE_THROWS_WITH(mat.get(2, 0), Catch::StartsWith("Index out of range"));
    REQUIRE_THROWS_WITH(mat.set_value(0, 3, 1.0), Catch::StartsWith("Index out of range"));
}

TEST_CASE("Matrix copy and move", "[tensors][matrix]") {
    Matrix<double> mat(2, 2, {1, 2, 3, 4});
    Matrix<double> copy = mat;
    copy.set_value(0, 0, 10.0);
    CHECK(mat.get(0, 0) == 1.0);
    CHECK(copy.get(0, 0) == 10.0);

    Matrix<double> moved = std::move(copy);
    CHECK(moved.get(0, 0) == 10.0);
    CHECK(moved.num_rows_ == 2);

    Matrix<double> empty(0, 4);
    CHECK(empty.size_ == 0);
    CHECK(empty.values_ == nullptr);
    Matrix<double> empty_copy = empty;
    CHECK(empty_copy.num_columns_ == 4);
}

static double square(double x) {
    return x * x;
}

TEST_CASE("Matrix apply", "[tensors][matrix]") {
    Matrix<double> mat(1, 3, {-2, 0, 3});
    Matrix<double> squared = mat.apply(square);
    CHECK(squared.data() == std::vector<double>({4, 0, 9}));
    CHECK(mat.get(0, 0) == -2.0);
}

TEST_CASE("Matrix slice", "[tensors][slice]") {
    std::vector<double> values = {0, 1, 2, 3, 4, 5, 6, 7, 8};
    MatrixSlice<double> slice(values.data(), 3, 3, 3);
    CHECK(slice.size() == 9);
    CHECK(slice.get(2, 1) == 7.0);

    MatrixSlice<double> rows = slice.reslice(1, 2);
    CHECK(rows.num_rows_ == 2);
    CHECK(rows.get(0, 0) == 3.0);
    CHECK(rows.to_matrix().data() == std::vector<double>({3, 4, 5, 6, 7, 8}));

    MatrixSlice<double> none = slice.reslice(3, 0);
    CHECK(none.size() == 0);

    REQUIRE_THROWS_WITH(slice.reslice(2, 2), Catch::StartsWith("Index out of range"));
    REQUIRE_THROWS_WITH(slice.get(0, 3), Catch::StartsWith("Index out of range"));
    // padded rows are not supported
    REQUIRE_THROWS(MatrixSlice<double>(values.data(), 2, 3, 4));
}

TEST_CASE("Matrix non-finite values", "[tensors]") {
    Matrix<double> mat(1, 4, {1.0, std::numeric_limits<double>::quiet_NaN(),
                              std::numeric_limits<double>::infinity(), 0.0});
    CHECK(count_non_finite(&mat) == 2);
    CHECK(check_non_finite(&mat, "mat"));

    std::vector<double> finite = {1.0, 2.0};
    CHECK(count_non_finite(&finite) == 0);
    CHECK_FALSE(check_non_finite(&finite, "finite"));
}

TEST_CASE("Matrix equality", "[tensors]") {
    Matrix<double> a(2, 1, {1.0, 2.0});
    Matrix<double> b(2, 1, {1.0, 2.0 + 1e-9});
    Matrix<double> c(1, 2, {1.0, 2.0});
    CHECK(check_equality(&a, &b, 1e-6));
    CHECK_FALSE(check_equality(&a, &b, 1e-12));
    REQUIRE_THROWS_WITH(check_equality(&a, &c, 1e-6), Catch::StartsWith("Shape mismatch"));
}
