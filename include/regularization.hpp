// Copyright 2020 Marcel Wagenländer

#ifndef FLATNET_REGULARIZATION_H
#define FLATNET_REGULARIZATION_H

#include "tensors.hpp"

#include <string>


enum RegularizationKind { reg_none,
                          reg_l1,
                          reg_l2 };

struct Regularization {
    RegularizationKind kind;
    double lambda;
};

Regularization no_regularization();

Regularization l1_regularization(double lambda);

Regularization l2_regularization(double lambda);

std::string get_regularization_name(RegularizationKind kind);

// Both scaled by the number of rows of the weight view
double reg_cost(Regularization reg, MatrixSlice<double> weights);

Matrix<double> reg_cost_grad(Regularization reg, MatrixSlice<double> weights);

#endif//FLATNET_REGULARIZATION_H
