// Copyright 2020 Marcel Wagenländer

#include "cost.hpp"
#include "helper.hpp"
#include "tensors.hpp"

#include "catch2/catch.hpp"
#include <cmath>


TEST_CASE("Mean squared error", "[cost][mse]") {
    Matrix<double> outputs(2, 1, {1, 3});
    Matrix<double> targets(2, 1, {0, 1});
    CHECK(mse_cost(outputs, targets) == Approx(2.5));

    Matrix<double> grad = mse_cost_grad(outputs, targets);
    Matrix<double> expected(2, 1, {1, 2});
    CHECK(compare_mat(&grad, &expected, 1e-12, "mse gradient"));

    CHECK(mse_cost(targets, targets) == 0.0);
}

TEST_CASE("Cross entropy", "[cost][crossentropy]") {
    Matrix<double> outputs(1, 2, {0.5, 0.25});
    Matrix<double> targets(1, 2, {1, 0});
    CHECK(cross_entropy_cost(outputs, targets) == Approx(-std::log(0.5) - std::log(0.75)));

    Matrix<double> grad = cross_entropy_cost_grad(outputs, targets);
    // (o - t) / (o (1 - o))
    Matrix<double> expected(1, 2, {-2.0, 0.25 / (0.25 * 0.75)});
    CHECK(compare_mat(&grad, &expected, 1e-12, "cross entropy gradient"));
    CHECK(cross_entropy_cost(outputs, targets) >= 0.0);
}

TEST_CASE("Cost shape errors", "[cost]") {
    Matrix<double> outputs(2, 1, {1, 3});
    Matrix<double> targets(1, 2, {0, 1});
    REQUIRE_THROWS_WITH(mse_cost(outputs, targets), Catch::StartsWith("Shape mismatch"));
    REQUIRE_THROWS_WITH(mse_cost_grad(outputs, targets), Catch::StartsWith("Shape mismatch"));
    REQUIRE_THROWS_WITH(cross_entropy_cost(outputs, targets), Catch::StartsWith("Shape mismatch"));
    REQUIRE_THROWS_WITH(cross_entropy_cost_grad(outputs, targets), Catch::StartsWith("Shape mismatch"));

    Matrix<double> empty(0, 3);
    CHECK(mse_cost(empty, empty) == 0.0);
    CHECK(mse_cost_grad(empty, empty).size_ == 0);
}

TEST_CASE("Cost function table", "[cost]") {
    CostFunc mse = get_cost_func(mean_squared_error);
    CHECK(mse.kind == mean_squared_error);
    CHECK(get_cost_name(cross_entropy) == "cross_entropy");
}
