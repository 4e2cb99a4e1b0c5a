// Copyright 2020 Marcel Wagenländer

#include "gradient_descent.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>


GradientDesc::GradientDesc() : GradientDesc(0.3, 100) {}

GradientDesc::GradientDesc(double alpha, long iters) : GradientDesc(alpha, iters, false) {}

GradientDesc::GradientDesc(double alpha, long iters, bool verbose) {
    alpha_ = alpha;
    iters_ = iters;
    verbose_ = verbose;
}

std::vector<double> GradientDesc::optimize(const Optimizable &model,
                                           const std::vector<double> &start,
                                           const Matrix<double> &inputs,
                                           const Matrix<double> &targets) {
    std::vector<double> params = start;
    if (params.empty()) {
        return params;
    }

    for (long i = 0; i < iters_; ++i) {
        CostGradient cost_gradient = model.compute_grad(params, inputs, targets);
        for (long j = 0; j < (long) params.size(); ++j) {
            params[j] = params[j] - alpha_ * cost_gradient.gradients[j];
        }

        if (verbose_) {
            std::cout << "iteration " << i << " cost " << cost_gradient.cost << std::endl;
        }
    }

    return params;
}

StochasticGD::StochasticGD() : StochasticGD(0.1, 0.1, 20) {}

StochasticGD::StochasticGD(double alpha, double mu, long iters) : StochasticGD(alpha, mu, iters, false) {}

StochasticGD::StochasticGD(double alpha, double mu, long iters, bool verbose)
    : generator_(std::chrono::system_clock::now().time_since_epoch().count()) {
    alpha_ = alpha;
    mu_ = mu;
    iters_ = iters;
    verbose_ = verbose;
}

std::vector<double> StochasticGD::optimize(const Optimizable &model,
                                           const std::vector<double> &start,
                                           const Matrix<double> &inputs,
                                           const Matrix<double> &targets) {
    std::vector<double> params = start;
    if (params.empty() || inputs.num_rows_ == 0) {
        return params;
    }
    if (inputs.num_rows_ != targets.num_rows_) {
        throw(std::string) "Shape mismatch: " + std::to_string(inputs.num_rows_) + " input samples and " + std::to_string(targets.num_rows_) + " target samples";
    }

    std::vector<double> delta(params.size(), 0.0);
    std::vector<long> order(inputs.num_rows_);
    for (long i = 0; i < inputs.num_rows_; ++i) {
        order[i] = i;
    }

    MatrixSlice<double> input_rows(inputs);
    MatrixSlice<double> target_rows(targets);
    double start_cost = 0.0;
    for (long i = 0; i < iters_; ++i) {
        std::shuffle(order.begin(), order.end(), generator_);

        double end_cost = 0.0;
        for (long sample : order) {
            Matrix<double> input = input_rows.reslice(sample, 1).to_matrix();
            Matrix<double> target = target_rows.reslice(sample, 1).to_matrix();
            CostGradient cost_gradient = model.compute_grad(params, input, target);

            for (long j = 0; j < (long) params.size(); ++j) {
                delta[j] = alpha_ * delta[j] + mu_ * cost_gradient.gradients[j];
                params[j] = params[j] - delta[j];
            }
            end_cost = end_cost + cost_gradient.cost;
        }
        end_cost = end_cost / (double) inputs.num_rows_;

        if (verbose_) {
            std::cout << "iteration " << i << " cost " << end_cost << std::endl;
        }

        if (i > 0 && std::abs(end_cost - start_cost) < tolerance_) {
            break;
        }
        start_cost = end_cost;
    }

    return params;
}
