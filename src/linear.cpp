// Copyright 2020 Marcel Wagenländer

#include "linear.hpp"
#include "dense_computation.hpp"
#include "initializer.hpp"
#include "parameters.hpp"

#include <chrono>
#include <cstring>
#include <string>


Linear::Linear(CudaHelper *helper, long in_features, long out_features, bool has_bias)
    : Linear(helper, in_features, out_features, has_bias,
             std::chrono::system_clock::now().time_since_epoch().count()) {}

Linear::Linear(CudaHelper *helper, long in_features, long out_features, bool has_bias, unsigned seed) {
    if (in_features < 0 || out_features < 0) {
        throw(std::string) "Shape mismatch: negative layer size " + shape_to_string(in_features, out_features);
    }
    name_ = "linear";
    cuda_helper_ = helper;
    num_in_features_ = in_features;
    num_out_features_ = out_features;
    has_bias_ = has_bias;
    generator_.seed(seed);
}

long Linear::num_params() const {
    ParamShape shape = param_shape();
    return shape.num_rows * shape.num_columns;
}

ParamShape Linear::param_shape() const {
    ParamShape shape;
    shape.num_rows = has_bias_ ? num_in_features_ + 1 : num_in_features_;
    shape.num_columns = num_out_features_;
    return shape;
}

bool Linear::has_bias() const {
    return has_bias_;
}

std::vector<double> Linear::default_params() {
    ParamShape shape = param_shape();
    return xavier_uniform(shape.num_rows, shape.num_columns, num_params(), &generator_);
}

void Linear::check_params(MatrixSlice<double> params) {
    ParamShape shape = param_shape();
    if (params.num_rows_ != shape.num_rows || params.num_columns_ != shape.num_columns) {
        throw(std::string) "Shape mismatch: " + name_ + " expects parameters " + shape_to_string(shape.num_rows, shape.num_columns) + ", got " + shape_to_string(params.num_rows_, params.num_columns_);
    }
}

void Linear::check_input(const Matrix<double> &x) {
    if (x.num_columns_ != num_in_features_) {
        throw(std::string) "Shape mismatch: " + name_ + " expects " + std::to_string(num_in_features_) + " input features, got " + shape_to_string(x.num_rows_, x.num_columns_);
    }
}

MatrixSlice<double> Linear::weight(MatrixSlice<double> params) {
    if (has_bias_) {
        return strip_first_row(params);
    }
    return params;
}

Matrix<double> Linear::forward(const Matrix<double> &x, MatrixSlice<double> params) {
    check_params(params);
    check_input(x);

    Matrix<double> y;
    double beta = 0.0;
    if (has_bias_) {
        // needs the bias in every row because GEMM accumulates into it
        y.set(x.num_rows_, num_out_features_);
        for (long i = 0; i < y.num_rows_ && num_out_features_ > 0; ++i) {
            std::memcpy(y.values_ + i * num_out_features_, params.values_, num_out_features_ * sizeof(double));
        }
        beta = 1.0;
    }

    mat_mat_mult(cuda_helper_, x, false, weight(params), false, beta, &y);

    return y;
}

Matrix<double> Linear::back_params(const Matrix<double> &out_grad, const Matrix<double> &x, MatrixSlice<double> params) {
    check_params(params);
    check_input(x);
    if (out_grad.num_rows_ != x.num_rows_ || out_grad.num_columns_ != num_out_features_) {
        throw(std::string) "Shape mismatch: " + name_ + " got output gradient " + shape_to_string(out_grad.num_rows_, out_grad.num_columns_) + " for input " + shape_to_string(x.num_rows_, x.num_columns_);
    }

    // dWeight = input.T * out_grad
    Matrix<double> grad_weight;
    mat_mat_mult(cuda_helper_, x, true, out_grad, false, 0.0, &grad_weight);
    if (!has_bias_) {
        return grad_weight;
    }

    // dBias = out_grad.T * ones
    Matrix<double> grad_bias;
    sum_rows(cuda_helper_, out_grad, &grad_bias);

    ParamShape shape = param_shape();
    Matrix<double> grad_params(shape.num_rows, shape.num_columns);
    if (num_out_features_ > 0) {
        std::memcpy(grad_params.values_, grad_bias.values_, grad_bias.size_ * sizeof(double));
        if (grad_weight.size_ > 0) {
            std::memcpy(grad_params.values_ + num_out_features_, grad_weight.values_, grad_weight.size_ * sizeof(double));
        }
    }
    return grad_params;
}

Matrix<double> Linear::back_input(const Matrix<double> &out_grad, const Matrix<double> &x, MatrixSlice<double> params) {
    check_params(params);
    if (out_grad.num_columns_ != num_out_features_) {
        throw(std::string) "Shape mismatch: " + name_ + " got output gradient " + shape_to_string(out_grad.num_rows_, out_grad.num_columns_);
    }

    // gradients_input = out_grad * weight.T
    Matrix<double> grad_input;
    mat_mat_mult(cuda_helper_, out_grad, false, weight(params), true, 0.0, &grad_input);

    return grad_input;
}
