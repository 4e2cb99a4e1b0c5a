// Copyright 2020 Marcel Wagenländer

#include "activation.hpp"
#include "device_memory.hpp"

#include <cmath>
#include <limits>


static double sigmoid_func(double x) {
    return 1.0 / (1.0 + std::exp(-x));
}

static double sigmoid_grad(double x) {
    double s = sigmoid_func(x);
    return s * (1.0 - s);
}

static double identity_func(double x) {
    return x;
}

static double identity_grad(double) {
    return 1.0;
}

static double exponential_func(double x) {
    return std::exp(x);
}

static double relu_func(double x) {
    return x > 0.0 ? x : 0.0;
}

static double relu_grad(double x) {
    return x > 0.0 ? 1.0 : 0.0;
}

ActivationFunc get_activation_func(ActivationKind kind) {
    ActivationFunc activation;
    activation.kind = kind;
    if (kind == sigmoid) {
        activation.func = sigmoid_func;
        activation.func_grad = sigmoid_grad;
    } else if (kind == identity) {
        activation.func = identity_func;
        activation.func_grad = identity_grad;
    } else if (kind == exponential) {
        activation.func = exponential_func;
        activation.func_grad = exponential_func;
    } else if (kind == relu) {
        activation.func = relu_func;
        activation.func_grad = relu_grad;
    } else {
        throw(std::string) "Unknown activation";
    }
    return activation;
}

std::string get_activation_name(ActivationKind kind) {
    if (kind == sigmoid) {
        return "sigmoid";
    } else if (kind == identity) {
        return "identity";
    } else if (kind == exponential) {
        return "exponential";
    } else if (kind == relu) {
        return "relu";
    } else {
        throw(std::string) "Unknown activation";
    }
}

Activation::Activation(CudaHelper *helper, ActivationKind kind) {
    name_ = get_activation_name(kind);
    cuda_helper_ = helper;
    activation_ = get_activation_func(kind);
    alpha_ = 1.0;
    beta_ = 0.0;

    use_cudnn_ = (kind == sigmoid || kind == relu);
    if (use_cudnn_) {
        check_cudnn(cudnnCreateActivationDescriptor(&activation_desc_));
        double coef = std::numeric_limits<double>::max();
        try {
            check_cudnn(cudnnSetActivationDescriptor(activation_desc_,
                                                     kind == sigmoid ? CUDNN_ACTIVATION_SIGMOID : CUDNN_ACTIVATION_RELU,
                                                     CUDNN_PROPAGATE_NAN,
                                                     coef));
        } catch (std::string &) {
            report_cudnn(cudnnDestroyActivationDescriptor(activation_desc_));
            throw;
        }
    }
}

Activation::~Activation() {
    if (use_cudnn_) {
        report_cudnn(cudnnDestroyActivationDescriptor(activation_desc_));
    }
}

ActivationKind Activation::kind() const {
    return activation_.kind;
}

long Activation::num_params() const {
    return 0;
}

ParamShape Activation::param_shape() const {
    ParamShape shape;
    shape.num_rows = 0;
    shape.num_columns = 0;
    return shape;
}

std::vector<double> Activation::default_params() {
    return std::vector<double>();
}

void Activation::check_params(MatrixSlice<double> params) {
    if (params.size() != 0) {
        throw(std::string) "Shape mismatch: " + name_ + " takes no parameters, got " + shape_to_string(params.num_rows_, params.num_columns_);
    }
}

Matrix<double> Activation::forward_cudnn(const Matrix<double> &x) {
    Matrix<double> y(x.num_rows_, x.num_columns_);

    DeviceMemory d_x(x.values_, x.size_);
    TensorDescriptor x_desc(x);
    DeviceMemory d_y(y.size_);
    TensorDescriptor y_desc(y);

    check_cudnn(cudnnActivationForward(cuda_helper_->cudnn_handle,
                                       activation_desc_,
                                       &alpha_, x_desc.desc_, d_x.values_,
                                       &beta_, y_desc.desc_, d_y.values_));

    d_y.copy_to_host(y.values_);

    return y;
}

Matrix<double> Activation::back_input_cudnn(const Matrix<double> &out_grad, const Matrix<double> &x) {
    // cuDNN needs the forward output to differentiate
    Matrix<double> y = forward_cudnn(x);
    Matrix<double> grad_input(x.num_rows_, x.num_columns_);

    DeviceMemory d_y(y.values_, y.size_);
    TensorDescriptor y_desc(y);
    DeviceMemory d_dy(out_grad.values_, out_grad.size_);
    TensorDescriptor dy_desc(out_grad);
    DeviceMemory d_x(x.values_, x.size_);
    TensorDescriptor x_desc(x);
    DeviceMemory d_dx(grad_input.size_);
    TensorDescriptor dx_desc(grad_input);

    check_cudnn(cudnnActivationBackward(cuda_helper_->cudnn_handle,
                                        activation_desc_,
                                        &alpha_, y_desc.desc_, d_y.values_,
                                        dy_desc.desc_, d_dy.values_,
                                        x_desc.desc_, d_x.values_,
                                        &beta_, dx_desc.desc_, d_dx.values_));

    d_dx.copy_to_host(grad_input.values_);

    return grad_input;
}

Matrix<double> Activation::forward(const Matrix<double> &x, MatrixSlice<double> params) {
    check_params(params);
    if (use_cudnn_ && x.size_ > 0) {
        return forward_cudnn(x);
    }
    return x.apply(activation_.func);
}

Matrix<double> Activation::back_params(const Matrix<double> &out_grad, const Matrix<double> &x, MatrixSlice<double> params) {
    check_params(params);
    return Matrix<double>(0, 0);
}

Matrix<double> Activation::back_input(const Matrix<double> &out_grad, const Matrix<double> &x, MatrixSlice<double> params) {
    check_params(params);
    if (out_grad.num_rows_ != x.num_rows_ || out_grad.num_columns_ != x.num_columns_) {
        throw(std::string) "Shape mismatch: " + name_ + " got output gradient " + shape_to_string(out_grad.num_rows_, out_grad.num_columns_) + " for input " + shape_to_string(x.num_rows_, x.num_columns_);
    }
    if (use_cudnn_ && x.size_ > 0) {
        return back_input_cudnn(out_grad, x);
    }

    Matrix<double> grad_input(x.num_rows_, x.num_columns_);
    for (long i = 0; i < x.size_; ++i) {
        grad_input.values_[i] = out_grad.values_[i] * activation_.func_grad(x.values_[i]);
    }
    return grad_input;
}
