// Copyright 2020 Marcel Wagenländer

#include "cost.hpp"

#include <cmath>


static void check_shapes(const Matrix<double> &outputs, const Matrix<double> &targets) {
    if (outputs.num_rows_ != targets.num_rows_ || outputs.num_columns_ != targets.num_columns_) {
        throw(std::string) "Shape mismatch: outputs " + shape_to_string(outputs.num_rows_, outputs.num_columns_) + " and targets " + shape_to_string(targets.num_rows_, targets.num_columns_);
    }
}

CostFunc get_cost_func(CostKind kind) {
    CostFunc cost_func;
    cost_func.kind = kind;
    if (kind == mean_squared_error) {
        cost_func.cost = mse_cost;
        cost_func.cost_grad = mse_cost_grad;
    } else if (kind == cross_entropy) {
        cost_func.cost = cross_entropy_cost;
        cost_func.cost_grad = cross_entropy_cost_grad;
    } else {
        throw(std::string) "Unknown cost function";
    }
    return cost_func;
}

std::string get_cost_name(CostKind kind) {
    if (kind == mean_squared_error) {
        return "mean_squared_error";
    } else if (kind == cross_entropy) {
        return "cross_entropy";
    } else {
        throw(std::string) "Unknown cost function";
    }
}

double mse_cost(const Matrix<double> &outputs, const Matrix<double> &targets) {
    check_shapes(outputs, targets);
    if (outputs.num_rows_ == 0) {
        return 0.0;
    }

    double cost = 0.0;
    for (long i = 0; i < outputs.size_; ++i) {
        double diff = outputs.values_[i] - targets.values_[i];
        cost = cost + diff * diff;
    }
    return cost / (double) outputs.num_rows_;
}

Matrix<double> mse_cost_grad(const Matrix<double> &outputs, const Matrix<double> &targets) {
    check_shapes(outputs, targets);
    Matrix<double> grad(outputs.num_rows_, outputs.num_columns_);
    for (long i = 0; i < outputs.size_; ++i) {
        grad.values_[i] = 2.0 * (outputs.values_[i] - targets.values_[i]) / (double) outputs.num_rows_;
    }
    return grad;
}

double cross_entropy_cost(const Matrix<double> &outputs, const Matrix<double> &targets) {
    check_shapes(outputs, targets);
    if (outputs.num_rows_ == 0) {
        return 0.0;
    }

    double cost = 0.0;
    for (long i = 0; i < outputs.size_; ++i) {
        double o = outputs.values_[i];
        double t = targets.values_[i];
        cost = cost - (t * std::log(o) + (1.0 - t) * std::log(1.0 - o));
    }
    return cost / (double) outputs.num_rows_;
}

Matrix<double> cross_entropy_cost_grad(const Matrix<double> &outputs, const Matrix<double> &targets) {
    check_shapes(outputs, targets);
    Matrix<double> grad(outputs.num_rows_, outputs.num_columns_);
    for (long i = 0; i < outputs.size_; ++i) {
        double o = outputs.values_[i];
        double t = targets.values_[i];
        grad.values_[i] = (o - t) / (o * (1.0 - o) * (double) outputs.num_rows_);
    }
    return grad;
}
