// Copyright 2020 Marcel Wagenländer

#include "regularization.hpp"

#include <cmath>


Regularization no_regularization() {
    Regularization reg;
    reg.kind = reg_none;
    reg.lambda = 0.0;
    return reg;
}

Regularization l1_regularization(double lambda) {
    Regularization reg;
    reg.kind = reg_l1;
    reg.lambda = lambda;
    return reg;
}

Regularization l2_regularization(double lambda) {
    Regularization reg;
    reg.kind = reg_l2;
    reg.lambda = lambda;
    return reg;
}

std::string get_regularization_name(RegularizationKind kind) {
    if (kind == reg_none) {
        return "none";
    } else if (kind == reg_l1) {
        return "l1";
    } else if (kind == reg_l2) {
        return "l2";
    } else {
        throw(std::string) "Unknown regularization";
    }
}

double reg_cost(Regularization reg, MatrixSlice<double> weights) {
    if (reg.kind == reg_none || weights.num_rows_ == 0) {
        return 0.0;
    }

    double sum = 0.0;
    for (long i = 0; i < weights.size(); ++i) {
        if (reg.kind == reg_l1) {
            sum = sum + std::abs(weights.values_[i]);
        } else {
            sum = sum + weights.values_[i] * weights.values_[i];
        }
    }
    return reg.lambda * sum / (2.0 * (double) weights.num_rows_);
}

Matrix<double> reg_cost_grad(Regularization reg, MatrixSlice<double> weights) {
    Matrix<double> grad(weights.num_rows_, weights.num_columns_);
    if (reg.kind == reg_none || weights.num_rows_ == 0) {
        grad.set_values(0.0);
        return grad;
    }

    double m = (double) weights.num_rows_;
    for (long i = 0; i < weights.size(); ++i) {
        double w = weights.values_[i];
        if (reg.kind == reg_l1) {
            double sign = (w > 0.0) - (w < 0.0);
            grad.values_[i] = reg.lambda * sign / (2.0 * m);
        } else {
            grad.values_[i] = reg.lambda * w / m;
        }
    }
    return grad;
}
