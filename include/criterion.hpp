// Copyright 2020 Marcel Wagenländer

#ifndef FLATNET_CRITERION_H
#define FLATNET_CRITERION_H

#include "activation.hpp"
#include "cost.hpp"
#include "regularization.hpp"
#include "tensors.hpp"


// Output activation, cost and regularization used to train a network.
// Only the concrete criteria below pick an activation/cost pair.
class Criterion {
protected:
    ActivationFunc activation_;
    CostFunc cost_;
    Regularization regularization_;

    Criterion(ActivationKind activation, CostKind cost, Regularization regularization);

public:
    virtual ~Criterion() {}
    ActivationKind activation_kind() const;
    CostKind cost_kind() const;
    Matrix<double> activate(const Matrix<double> &mat) const;
    Matrix<double> grad_activ(const Matrix<double> &mat) const;
    double cost(const Matrix<double> &outputs, const Matrix<double> &targets) const;
    Matrix<double> cost_grad(const Matrix<double> &outputs, const Matrix<double> &targets) const;
    Regularization regularization() const;
    bool is_regularized() const;
    double reg_cost(MatrixSlice<double> weights) const;
    Matrix<double> reg_cost_grad(MatrixSlice<double> weights) const;
};

// Sigmoid activation with binary cross-entropy
class BCECriterion : public Criterion {
public:
    BCECriterion();
    explicit BCECriterion(Regularization regularization);
};

// Identity activation with mean squared error
class MSECriterion : public Criterion {
public:
    MSECriterion();
    explicit MSECriterion(Regularization regularization);
};

#endif//FLATNET_CRITERION_H
