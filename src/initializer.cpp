// Copyright 2020 Marcel Wagenländer

#include "initializer.hpp"

#include <cmath>
#include <string>


double xavier_bound(long fan_in, long fan_out) {
    if (fan_in + fan_out <= 0) {
        return 0.0;
    }
    return std::sqrt(6.0 / static_cast<double>(fan_in + fan_out));
}

std::vector<double> xavier_uniform(long fan_in, long fan_out, long count, std::default_random_engine *generator) {
    double eps_init = xavier_bound(fan_in, fan_out);
    std::uniform_real_distribution<double> distr(-eps_init, eps_init);

    std::vector<double> values(count);
    for (long i = 0; i < count; ++i) {
        values[i] = distr(*generator);
    }
    return values;
}

std::vector<double> create_weights(const std::vector<long> &layer_sizes, std::default_random_engine *generator) {
    std::vector<double> weights;
    for (size_t i = 1; i < layer_sizes.size(); ++i) {
        if (layer_sizes[i - 1] < 0 || layer_sizes[i] < 0) {
            throw(std::string) "Shape mismatch: negative layer size";
        }
        long l_in = layer_sizes[i - 1] + 1;
        long l_out = layer_sizes[i];
        std::vector<double> layer_weights = xavier_uniform(l_in, l_out, l_in * l_out, generator);
        weights.insert(weights.end(), layer_weights.begin(), layer_weights.end());
    }
    return weights;
}
