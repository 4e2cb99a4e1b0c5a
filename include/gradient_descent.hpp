// Copyright 2020 Marcel Wagenländer

#ifndef FLATNET_GRADIENT_DESCENT_H
#define FLATNET_GRADIENT_DESCENT_H

#include "optimizer.hpp"
#include "tensors.hpp"

#include <random>
#include <vector>


// Full-batch gradient descent
class GradientDesc : public OptimAlgorithm {
private:
    double alpha_;
    long iters_;
    bool verbose_;

public:
    GradientDesc();
    GradientDesc(double alpha, long iters);
    GradientDesc(double alpha, long iters, bool verbose);
    std::vector<double> optimize(const Optimizable &model,
                                 const std::vector<double> &start,
                                 const Matrix<double> &inputs,
                                 const Matrix<double> &targets) override;
};

// Per-sample gradient descent with momentum. Samples are visited in a new
// random order every epoch.
class StochasticGD : public OptimAlgorithm {
private:
    double alpha_;
    double mu_;
    long iters_;
    bool verbose_;
    const double tolerance_ = 1e-20;
    std::default_random_engine generator_;

public:
    StochasticGD();
    StochasticGD(double alpha, double mu, long iters);
    StochasticGD(double alpha, double mu, long iters, bool verbose);
    std::vector<double> optimize(const Optimizable &model,
                                 const std::vector<double> &start,
                                 const Matrix<double> &inputs,
                                 const Matrix<double> &targets) override;
};

#endif//FLATNET_GRADIENT_DESCENT_H
