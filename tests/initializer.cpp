// Copyright 2020 Marcel Wagenländer

#include "initializer.hpp"

#include "catch2/catch.hpp"
#include <cmath>


TEST_CASE("Xavier bound", "[initializer]") {
    CHECK(xavier_bound(2, 1) == Approx(std::sqrt(2.0)));
    CHECK(xavier_bound(0, 0) == 0.0);
}

TEST_CASE("Create weights", "[initializer]") {
    std::default_random_engine generator(3);
    std::vector<double> weights = create_weights({3, 4, 2}, &generator);
    // (3 + 1) * 4 + (4 + 1) * 2
    REQUIRE(weights.size() == 26);

    for (long i = 0; i < 16; ++i) {
        CHECK(std::abs(weights[i]) <= xavier_bound(4, 4));
    }
    for (long i = 16; i < 26; ++i) {
        CHECK(std::abs(weights[i]) <= xavier_bound(5, 2));
    }

    CHECK(create_weights({5}, &generator).empty());
    REQUIRE_THROWS_WITH(create_weights({2, -1}, &generator), Catch::StartsWith("Shape mismatch"));
}
