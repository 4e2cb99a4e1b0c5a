// Copyright 2020 Marcel Wagenländer

#include "adam.hpp"
#include "dense_computation.hpp"

#include <cmath>
#include <iostream>


Adam::Adam(CudaHelper *helper) : Adam(helper, 0.001, 100) {}

Adam::Adam(CudaHelper *helper, double learning_rate, long iters) : Adam(helper, learning_rate, iters, false) {}

Adam::Adam(CudaHelper *helper, double learning_rate, long iters, bool verbose) {
    cuda_helper_ = helper;
    learning_rate_ = learning_rate;
    iters_ = iters;
    verbose_ = verbose;
}

std::vector<double> Adam::optimize(const Optimizable &model,
                                   const std::vector<double> &start,
                                   const Matrix<double> &inputs,
                                   const Matrix<double> &targets) {
    std::vector<double> params = start;
    if (params.empty()) {
        return params;
    }

    long num_params = params.size();
    std::vector<double> momentum_m(num_params, 0.0);
    std::vector<double> momentum_v(num_params, 0.0);
    std::vector<double> update(num_params);

    for (long t = 1; t <= iters_; ++t) {
        CostGradient cost_gradient = model.compute_grad(params, inputs, targets);

        // learning_rate_t = learning_rate * sqrt(1 - beta_2 ^t) / (1 - beta_1 ^t)
        double learning_rate_t = learning_rate_ * std::sqrt(1 - std::pow(beta_2_, t)) / (1 - std::pow(beta_1_, t));

        for (long i = 0; i < num_params; ++i) {
            double gradient = cost_gradient.gradients[i];
            momentum_m[i] = beta_1_ * momentum_m[i] + (1 - beta_1_) * gradient;
            momentum_v[i] = beta_2_ * momentum_v[i] + (1 - beta_2_) * gradient * gradient;
            update[i] = learning_rate_t * momentum_m[i] / (std::sqrt(momentum_v[i]) + epsilon_);
        }

        vec_vec_add(cuda_helper_, -1.0, update, &params);

        if (verbose_) {
            std::cout << "iteration " << (t - 1) << " cost " << cost_gradient.cost << std::endl;
        }
    }

    return params;
}
