// Copyright 2020 Marcel Wagenländer

#ifndef FLATNET_ADAM_H
#define FLATNET_ADAM_H

#include "cuda_helper.hpp"
#include "optimizer.hpp"
#include "tensors.hpp"

#include <vector>

// Full-batch Adam with bias correction, Kingma & Ba 2015
class Adam : public OptimAlgorithm {
private:
    CudaHelper *cuda_helper_ = NULL;
    double learning_rate_;
    long iters_;
    bool verbose_;
    const double beta_1_ = 0.9;
    const double beta_2_ = 0.999;
    const double epsilon_ = 1e-8;

public:
    explicit Adam(CudaHelper *helper);
    Adam(CudaHelper *helper, double learning_rate, long iters);
    Adam(CudaHelper *helper, double learning_rate, long iters, bool verbose);
    std::vector<double> optimize(const Optimizable &model,
                                 const std::vector<double> &start,
                                 const Matrix<double> &inputs,
                                 const Matrix<double> &targets) override;
};

#endif//FLATNET_ADAM_H
