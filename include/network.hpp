// Copyright 2020 Marcel Wagenländer

#ifndef FLATNET_NETWORK_H
#define FLATNET_NETWORK_H

#include "activation.hpp"
#include "criterion.hpp"
#include "cuda_helper.hpp"
#include "layer.hpp"
#include "optimizer.hpp"
#include "parameters.hpp"
#include "tensors.hpp"

#include <memory>
#include <vector>


// A linear stack of layers sharing one flat parameter vector.
// Parameters of layer i live in slot i of layout_.
class BaseNeuralNet : public Optimizable {
protected:
    std::vector<std::unique_ptr<NetLayer>> layers_;
    ParameterLayout layout_;
    std::vector<double> weights_;
    Criterion criterion_;

public:
    explicit BaseNeuralNet(const Criterion &criterion);
    // Biased linear layer followed by an activation layer for each pair of consecutive sizes
    static BaseNeuralNet mlp(CudaHelper *helper, const std::vector<long> &layer_sizes,
                             const Criterion &criterion, ActivationKind activation);
    static BaseNeuralNet default_net(CudaHelper *helper, const std::vector<long> &layer_sizes, ActivationKind activation);
    BaseNeuralNet &add_layer(std::unique_ptr<NetLayer> layer);
    long num_layers() const;
    long num_params() const;
    const Criterion &criterion() const;
    const std::vector<double> &weights() const;
    void set_weights(const std::vector<double> &weights);
    MatrixSlice<double> get_layer_weights(const std::vector<double> &weights, long idx) const;
    MatrixSlice<double> get_layer_weights(std::vector<double> &&weights, long idx) const = delete;
    MatrixSlice<double> get_net_weights(long idx) const;
    MatrixSlice<double> get_non_bias_weights(const std::vector<double> &weights, long idx) const;
    MatrixSlice<double> get_non_bias_weights(std::vector<double> &&weights, long idx) const = delete;
    Matrix<double> forward_prop(const Matrix<double> &inputs) const;
    CostGradient compute_grad(const std::vector<double> &params,
                              const Matrix<double> &inputs,
                              const Matrix<double> &targets) const override;
    void regularize(const std::vector<double> &params, CostGradient *cost_gradient) const;
    CostGradient compute_grad_regularized(const std::vector<double> &params,
                                          const Matrix<double> &inputs,
                                          const Matrix<double> &targets) const;
};

// Exposes a network's regularized cost to an optimizer
class RegularizedObjective : public Optimizable {
private:
    const BaseNeuralNet *net_;

public:
    explicit RegularizedObjective(const BaseNeuralNet *net);
    CostGradient compute_grad(const std::vector<double> &params,
                              const Matrix<double> &inputs,
                              const Matrix<double> &targets) const override;
};

#endif//FLATNET_NETWORK_H
