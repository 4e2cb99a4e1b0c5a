// Copyright 2020 Marcel Wagenländer

#include "criterion.hpp"


Criterion::Criterion(ActivationKind activation, CostKind cost, Regularization regularization) {
    activation_ = get_activation_func(activation);
    cost_ = get_cost_func(cost);
    regularization_ = regularization;
}

ActivationKind Criterion::activation_kind() const {
    return activation_.kind;
}

CostKind Criterion::cost_kind() const {
    return cost_.kind;
}

Matrix<double> Criterion::activate(const Matrix<double> &mat) const {
    return mat.apply(activation_.func);
}

Matrix<double> Criterion::grad_activ(const Matrix<double> &mat) const {
    return mat.apply(activation_.func_grad);
}

double Criterion::cost(const Matrix<double> &outputs, const Matrix<double> &targets) const {
    return cost_.cost(outputs, targets);
}

Matrix<double> Criterion::cost_grad(const Matrix<double> &outputs, const Matrix<double> &targets) const {
    return cost_.cost_grad(outputs, targets);
}

Regularization Criterion::regularization() const {
    return regularization_;
}

bool Criterion::is_regularized() const {
    return regularization_.kind != reg_none;
}

double Criterion::reg_cost(MatrixSlice<double> weights) const {
    return ::reg_cost(regularization_, weights);
}

Matrix<double> Criterion::reg_cost_grad(MatrixSlice<double> weights) const {
    return ::reg_cost_grad(regularization_, weights);
}

BCECriterion::BCECriterion() : Criterion(sigmoid, cross_entropy, no_regularization()) {}

BCECriterion::BCECriterion(Regularization regularization) : Criterion(sigmoid, cross_entropy, regularization) {}

MSECriterion::MSECriterion() : Criterion(identity, mean_squared_error, no_regularization()) {}

MSECriterion::MSECriterion(Regularization regularization) : Criterion(identity, mean_squared_error, regularization) {}
