// Copyright 2020 Marcel Wagenländer

#ifndef FLATNET_ACTIVATION_H
#define FLATNET_ACTIVATION_H

#include "cuda_helper.hpp"
#include "layer.hpp"
#include "tensors.hpp"

#include <string>
#include <vector>


enum ActivationKind { sigmoid,
                      identity,
                      exponential,
                      relu };

struct ActivationFunc {
    ActivationKind kind;
    double (*func)(double);
    // derivative with respect to the pre-activation input
    double (*func_grad)(double);
};

ActivationFunc get_activation_func(ActivationKind kind);

std::string get_activation_name(ActivationKind kind);

// Parameterless layer applying an activation function element-wise.
// Sigmoid and ReLU run through cuDNN, the others on the host.
class Activation : public NetLayer {
private:
    CudaHelper *cuda_helper_;
    ActivationFunc activation_;
    bool use_cudnn_;
    cudnnActivationDescriptor_t activation_desc_;
    double alpha_;
    double beta_;

    void check_params(MatrixSlice<double> params);
    Matrix<double> forward_cudnn(const Matrix<double> &x);
    Matrix<double> back_input_cudnn(const Matrix<double> &out_grad, const Matrix<double> &x);

public:
    Activation(CudaHelper *helper, ActivationKind kind);
    Activation(const Activation &) = delete;
    Activation &operator=(const Activation &) = delete;
    ~Activation();
    ActivationKind kind() const;
    long num_params() const override;
    ParamShape param_shape() const override;
    std::vector<double> default_params() override;
    Matrix<double> forward(const Matrix<double> &x, MatrixSlice<double> params) override;
    Matrix<double> back_params(const Matrix<double> &out_grad, const Matrix<double> &x, MatrixSlice<double> params) override;
    Matrix<double> back_input(const Matrix<double> &out_grad, const Matrix<double> &x, MatrixSlice<double> params) override;
};

#endif//FLATNET_ACTIVATION_H
