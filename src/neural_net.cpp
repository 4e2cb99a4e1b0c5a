// Copyright 2020 Marcel Wagenländer

#include "neural_net.hpp"
#include "gradient_descent.hpp"


NeuralNet::NeuralNet(const Criterion &criterion, std::unique_ptr<OptimAlgorithm> alg)
    : base_(criterion), alg_(std::move(alg)) {}

NeuralNet::NeuralNet(BaseNeuralNet base, std::unique_ptr<OptimAlgorithm> alg)
    : base_(std::move(base)), alg_(std::move(alg)) {}

NeuralNet NeuralNet::mlp(CudaHelper *helper, const std::vector<long> &layer_sizes, const Criterion &criterion,
                         std::unique_ptr<OptimAlgorithm> alg, ActivationKind activation) {
    return NeuralNet(BaseNeuralNet::mlp(helper, layer_sizes, criterion, activation), std::move(alg));
}

NeuralNet NeuralNet::default_net(CudaHelper *helper, const std::vector<long> &layer_sizes) {
    return NeuralNet(BaseNeuralNet::default_net(helper, layer_sizes, sigmoid),
                     std::unique_ptr<OptimAlgorithm>(new StochasticGD()));
}

NeuralNet &NeuralNet::add_layer(std::unique_ptr<NetLayer> layer) {
    base_.add_layer(std::move(layer));
    return *this;
}

const BaseNeuralNet &NeuralNet::base() const {
    return base_;
}

MatrixSlice<double> NeuralNet::get_net_weights(long idx) const {
    return base_.get_net_weights(idx);
}

const std::vector<double> &NeuralNet::weights() const {
    return base_.weights();
}

void NeuralNet::set_weights(const std::vector<double> &weights) {
    base_.set_weights(weights);
}

Matrix<double> NeuralNet::predict(const Matrix<double> &inputs) const {
    return base_.forward_prop(inputs);
}

void NeuralNet::train(const Matrix<double> &inputs, const Matrix<double> &targets) {
    std::vector<double> optimal_weights = alg_->optimize(base_, base_.weights(), inputs, targets);
    base_.set_weights(optimal_weights);
}

void NeuralNet::train_regularized(const Matrix<double> &inputs, const Matrix<double> &targets) {
    RegularizedObjective objective(&base_);
    std::vector<double> optimal_weights = alg_->optimize(objective, base_.weights(), inputs, targets);
    base_.set_weights(optimal_weights);
}
