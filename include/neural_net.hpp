// Copyright 2020 Marcel Wagenländer

#ifndef FLATNET_NEURAL_NET_H
#define FLATNET_NEURAL_NET_H

#include "activation.hpp"
#include "criterion.hpp"
#include "cuda_helper.hpp"
#include "network.hpp"
#include "optimizer.hpp"
#include "tensors.hpp"

#include <memory>
#include <vector>


// A network together with the algorithm that trains it
class NeuralNet {
private:
    BaseNeuralNet base_;
    std::unique_ptr<OptimAlgorithm> alg_;

public:
    NeuralNet(const Criterion &criterion, std::unique_ptr<OptimAlgorithm> alg);
    NeuralNet(BaseNeuralNet base, std::unique_ptr<OptimAlgorithm> alg);
    static NeuralNet mlp(CudaHelper *helper, const std::vector<long> &layer_sizes, const Criterion &criterion,
                         std::unique_ptr<OptimAlgorithm> alg, ActivationKind activation);
    // Sigmoid layers, cross-entropy and stochastic gradient descent
    static NeuralNet default_net(CudaHelper *helper, const std::vector<long> &layer_sizes);
    NeuralNet &add_layer(std::unique_ptr<NetLayer> layer);
    const BaseNeuralNet &base() const;
    MatrixSlice<double> get_net_weights(long idx) const;
    const std::vector<double> &weights() const;
    void set_weights(const std::vector<double> &weights);
    Matrix<double> predict(const Matrix<double> &inputs) const;
    void train(const Matrix<double> &inputs, const Matrix<double> &targets);
    void train_regularized(const Matrix<double> &inputs, const Matrix<double> &targets);
};

#endif//FLATNET_NEURAL_NET_H
