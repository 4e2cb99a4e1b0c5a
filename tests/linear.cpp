// Copyright 2020 Marcel Wagenländer

#include "linear.hpp"
#include "cuda_helper.hpp"
#include "helper.hpp"
#include "initializer.hpp"
#include "tensors.hpp"

#include "catch2/catch.hpp"
#include <cmath>


int test_linear(bool has_bias) {
    CudaHelper cuda_helper;
    Linear linear(&cuda_helper, 2, 2, has_bias, 42);

    Matrix<double> params;
    if (has_bias) {
        params = Matrix<double>(3, 2, {0.5, -1, 1, 2, 3, 4});
    } else {
        params = Matrix<double>(2, 2, {1, 2, 3, 4});
    }
    Matrix<double> x(2, 2, {1, 0, 2, 1});
    Matrix<double> out_grad(2, 2, {1, 1, 0, 2});

    int ok = 1;

    Matrix<double> y = linear.forward(x, params);
    Matrix<double> expected_y;
    if (has_bias) {
        expected_y = Matrix<double>(2, 2, {1.5, 1, 5.5, 7});
    } else {
        expected_y = Matrix<double>(2, 2, {1, 2, 5, 8});
    }
    ok = ok * compare_mat(&y, &expected_y, 1e-12, "forward");

    Matrix<double> grad_params = linear.back_params(out_grad, x, params);
    Matrix<double> expected_grad_params;
    if (has_bias) {
        expected_grad_params = Matrix<double>(3, 2, {1, 3, 1, 5, 0, 2});
    } else {
        expected_grad_params = Matrix<double>(2, 2, {1, 5, 0, 2});
    }
    ok = ok * compare_mat(&grad_params, &expected_grad_params, 1e-12, "back_params");

    Matrix<double> grad_input = linear.back_input(out_grad, x, params);
    Matrix<double> expected_grad_input(2, 2, {3, 7, 4, 8});
    ok = ok * compare_mat(&grad_input, &expected_grad_input, 1e-12, "back_input");

    return ok;
}

TEST_CASE("Linear", "[linear]") {
    CHECK(test_linear(true));
}

TEST_CASE("Linear, no bias", "[linear][nobias]") {
    CHECK(test_linear(false));
}

TEST_CASE("Linear parameters", "[linear]") {
    CudaHelper cuda_helper;
    Linear linear(&cuda_helper, 4, 3, true, 7);
    CHECK(linear.has_bias());
    CHECK(linear.num_params() == 15);
    CHECK(linear.param_shape().num_rows == 5);
    CHECK(linear.param_shape().num_columns == 3);

    std::vector<double> params = linear.default_params();
    REQUIRE(params.size() == 15);
    double bound = xavier_bound(5, 3);
    for (double value : params) {
        CHECK(std::abs(value) <= bound);
    }

    Linear no_bias(&cuda_helper, 4, 3, false, 7);
    CHECK_FALSE(no_bias.has_bias());
    CHECK(no_bias.num_params() == 12);
}

TEST_CASE("Linear shape errors", "[linear]") {
    CudaHelper cuda_helper;
    Linear linear(&cuda_helper, 2, 2, true, 1);
    Matrix<double> params(3, 2, {0, 0, 1, 0, 0, 1});
    Matrix<double> wrong_params(2, 2, {1, 0, 0, 1});
    Matrix<double> x(1, 2, {1, 2});
    Matrix<double> wide_x(1, 3, {1, 2, 3});
    Matrix<double> out_grad(1, 3, {1, 1, 1});

    REQUIRE_THROWS_WITH(linear.forward(x, wrong_params), Catch::StartsWith("Shape mismatch"));
    REQUIRE_THROWS_WITH(linear.forward(wide_x, params), Catch::StartsWith("Shape mismatch"));
    REQUIRE_THROWS_WITH(linear.back_params(out_grad, x, params), Catch::StartsWith("Shape mismatch"));
    REQUIRE_THROWS_WITH(linear.back_input(out_grad, x, params), Catch::StartsWith("Shape mismatch"));
}

TEST_CASE("Linear, no output features", "[linear][empty]") {
    CudaHelper cuda_helper;
    Linear linear(&cuda_helper, 2, 0, true, 1);
    CHECK(linear.num_params() == 0);
    CHECK(linear.default_params().empty());

    Matrix<double> params(3, 0);
    Matrix<double> x(2, 2, {1, 2, 3, 4});
    Matrix<double> out_grad(2, 0);

    Matrix<double> y = linear.forward(x, params);
    CHECK(y.num_rows_ == 2);
    CHECK(y.num_columns_ == 0);

    Matrix<double> grad_params = linear.back_params(out_grad, x, params);
    CHECK(grad_params.num_rows_ == 3);
    CHECK(grad_params.size_ == 0);

    Matrix<double> grad_input = linear.back_input(out_grad, x, params);
    CHECK(grad_input.data() == std::vector<double>(4, 0.0));
}
