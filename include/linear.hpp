// Copyright 2020 Marcel Wagenländer

#ifndef FLATNET_LINEAR_H
#define FLATNET_LINEAR_H

#include "cuda_helper.hpp"
#include "layer.hpp"
#include "tensors.hpp"

#include <random>
#include <vector>

// Fully connected layer. With a bias the parameters are an (in + 1, out)
// matrix whose first row holds the bias.
class Linear : public NetLayer {
protected:
    CudaHelper *cuda_helper_;
    long num_in_features_;
    long num_out_features_;
    bool has_bias_;
    std::default_random_engine generator_;

    void check_params(MatrixSlice<double> params);
    void check_input(const Matrix<double> &x);
    MatrixSlice<double> weight(MatrixSlice<double> params);

public:
    Linear(CudaHelper *helper, long in_features, long out_features, bool has_bias);
    Linear(CudaHelper *helper, long in_features, long out_features, bool has_bias, unsigned seed);
    long num_params() const override;
    ParamShape param_shape() const override;
    bool has_bias() const override;
    std::vector<double> default_params() override;
    Matrix<double> forward(const Matrix<double> &x, MatrixSlice<double> params) override;
    Matrix<double> back_params(const Matrix<double> &out_grad, const Matrix<double> &x, MatrixSlice<double> params) override;
    Matrix<double> back_input(const Matrix<double> &out_grad, const Matrix<double> &x, MatrixSlice<double> params) override;
};

#endif//FLATNET_LINEAR_H
