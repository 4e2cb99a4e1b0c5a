// Copyright 2020 Marcel Wagenländer

#ifndef FLATNET_COST_H
#define FLATNET_COST_H

#include "tensors.hpp"

#include <string>


enum CostKind { mean_squared_error,
                cross_entropy };

struct CostFunc {
    CostKind kind;
    double (*cost)(const Matrix<double> &outputs, const Matrix<double> &targets);
    // gradient of the cost with respect to the outputs
    Matrix<double> (*cost_grad)(const Matrix<double> &outputs, const Matrix<double> &targets);
};

CostFunc get_cost_func(CostKind kind);

std::string get_cost_name(CostKind kind);

// Both averaged over the number of samples (rows)
double mse_cost(const Matrix<double> &outputs, const Matrix<double> &targets);

Matrix<double> mse_cost_grad(const Matrix<double> &outputs, const Matrix<double> &targets);

double cross_entropy_cost(const Matrix<double> &outputs, const Matrix<double> &targets);

Matrix<double> cross_entropy_cost_grad(const Matrix<double> &outputs, const Matrix<double> &targets);

#endif//FLATNET_COST_H
