// Copyright 2020 Marcel Wagenländer

#ifndef FLATNET_OPTIMIZER_H
#define FLATNET_OPTIMIZER_H

#include "tensors.hpp"

#include <vector>


struct CostGradient {
    double cost;
    std::vector<double> gradients;
};

// What an optimization algorithm sees of a model
class Optimizable {
public:
    virtual ~Optimizable() {}
    virtual CostGradient compute_grad(const std::vector<double> &params,
                                      const Matrix<double> &inputs,
                                      const Matrix<double> &targets) const = 0;
};

class OptimAlgorithm {
public:
    virtual ~OptimAlgorithm() {}
    // Returns the optimized parameters, start is left untouched
    virtual std::vector<double> optimize(const Optimizable &model,
                                         const std::vector<double> &start,
                                         const Matrix<double> &inputs,
                                         const Matrix<double> &targets) = 0;
};

#endif//FLATNET_OPTIMIZER_H
