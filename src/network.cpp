// Copyright 2020 Marcel Wagenländer

#include "network.hpp"
#include "linear.hpp"

#include <cstring>
#include <limits>
#include <string>


BaseNeuralNet::BaseNeuralNet(const Criterion &criterion) : criterion_(criterion) {}

BaseNeuralNet BaseNeuralNet::mlp(CudaHelper *helper, const std::vector<long> &layer_sizes,
                                 const Criterion &criterion, ActivationKind activation) {
    BaseNeuralNet net(criterion);
    for (long i = 1; i < (long) layer_sizes.size(); ++i) {
        net.add_layer(std::unique_ptr<NetLayer>(new Linear(helper, layer_sizes[i - 1], layer_sizes[i], true)));
        net.add_layer(std::unique_ptr<NetLayer>(new Activation(helper, activation)));
    }
    return net;
}

BaseNeuralNet BaseNeuralNet::default_net(CudaHelper *helper, const std::vector<long> &layer_sizes, ActivationKind activation) {
    return mlp(helper, layer_sizes, BCECriterion(), activation);
}

BaseNeuralNet &BaseNeuralNet::add_layer(std::unique_ptr<NetLayer> layer) {
    std::vector<double> params = layer->default_params();
    if ((long) params.size() != layer->num_params()) {
        throw(std::string) "Shape mismatch: " + layer->name_ + " produced " + std::to_string(params.size()) + " default parameters, expected " + std::to_string(layer->num_params());
    }
    layout_.push_back(layer->num_params(), layer->param_shape());
    weights_.insert(weights_.end(), params.begin(), params.end());
    layers_.push_back(std::move(layer));
    return *this;
}

long BaseNeuralNet::num_layers() const {
    return layers_.size();
}

long BaseNeuralNet::num_params() const {
    return layout_.num_params();
}

const Criterion &BaseNeuralNet::criterion() const {
    return criterion_;
}

const std::vector<double> &BaseNeuralNet::weights() const {
    return weights_;
}

void BaseNeuralNet::set_weights(const std::vector<double> &weights) {
    layout_.check_length(weights.size());
    weights_ = weights;
}

MatrixSlice<double> BaseNeuralNet::get_layer_weights(const std::vector<double> &weights, long idx) const {
    return layout_.view(weights, idx);
}

MatrixSlice<double> BaseNeuralNet::get_net_weights(long idx) const {
    return layout_.view(weights_, idx);
}

MatrixSlice<double> BaseNeuralNet::get_non_bias_weights(const std::vector<double> &weights, long idx) const {
    return layout_.non_bias_view(weights, idx);
}

Matrix<double> BaseNeuralNet::forward_prop(const Matrix<double> &inputs) const {
    Matrix<double> outputs = inputs;
    for (long i = 0; i < num_layers(); ++i) {
        outputs = layers_[i]->forward(outputs, slot_view(weights_.data(), layout_.slot(i)));
    }
    return outputs;
}

CostGradient BaseNeuralNet::compute_grad(const std::vector<double> &params,
                                         const Matrix<double> &inputs,
                                         const Matrix<double> &targets) const {
    layout_.check_length(params.size());

    CostGradient result;
    if (layers_.empty()) {
        result.cost = criterion_.cost(inputs, targets);
        return result;
    }

    // activations[i + 1] is the output of layer i
    std::vector<Matrix<double>> activations;
    activations.reserve(num_layers() + 1);
    activations.push_back(inputs);
    for (long i = 0; i < num_layers(); ++i) {
        MatrixSlice<double> layer_params = slot_view(params.data(), layout_.slot(i));
        activations.push_back(layers_[i]->forward(activations[i], layer_params));
    }

    const Matrix<double> &outputs = activations.back();
    result.cost = criterion_.cost(outputs, targets);
    Matrix<double> out_grad = criterion_.cost_grad(outputs, targets);

#ifdef FLATNET_GRADIENT_CHECKS
    result.gradients = std::vector<double>(params.size(), std::numeric_limits<double>::quiet_NaN());
#else
    result.gradients = std::vector<double>(params.size(), 0.0);
#endif

    for (long i = num_layers() - 1; i >= 0; --i) {
        const LayerSlot &slot = layout_.slot(i);
        MatrixSlice<double> layer_params = slot_view(params.data(), slot);

        Matrix<double> param_grad = layers_[i]->back_params(out_grad, activations[i], layer_params);
        if (param_grad.size_ != slot.num_params) {
            throw(std::string) "Shape mismatch: " + layers_[i]->name_ + " returned " + std::to_string(param_grad.size_) + " parameter gradients, expected " + std::to_string(slot.num_params);
        }
        if (param_grad.size_ > 0) {
            std::memcpy(result.gradients.data() + slot.offset, param_grad.values_, param_grad.size_ * sizeof(double));
        }

        if (i > 0) {
            out_grad = layers_[i]->back_input(out_grad, activations[i], layer_params);
        }
    }

#ifdef FLATNET_GRADIENT_CHECKS
    if (check_non_finite(&result.gradients, "gradients")) {
        throw(std::string) "Gradient buffer has non-finite values after back-propagation";
    }
#endif

    return result;
}

void BaseNeuralNet::regularize(const std::vector<double> &params, CostGradient *cost_gradient) const {
    if (!criterion_.is_regularized()) {
        return;
    }
    layout_.check_length(params.size());
    layout_.check_length(cost_gradient->gradients.size());

    for (long i = 0; i < num_layers(); ++i) {
        const LayerSlot &slot = layout_.slot(i);
        if (slot.num_params == 0) {
            continue;
        }

        MatrixSlice<double> weights = slot_view(params.data(), slot);
        long grad_offset = slot.offset;
        if (layers_[i]->has_bias()) {
            // bias row first
            weights = strip_first_row(weights);
            grad_offset = grad_offset + slot.num_columns;
        }

        cost_gradient->cost = cost_gradient->cost + criterion_.reg_cost(weights);
        Matrix<double> reg_grad = criterion_.reg_cost_grad(weights);
        for (long j = 0; j < reg_grad.size_; ++j) {
            cost_gradient->gradients[grad_offset + j] = cost_gradient->gradients[grad_offset + j] + reg_grad.values_[j];
        }
    }
}

CostGradient BaseNeuralNet::compute_grad_regularized(const std::vector<double> &params,
                                                     const Matrix<double> &inputs,
                                                     const Matrix<double> &targets) const {
    CostGradient result = compute_grad(params, inputs, targets);
    regularize(params, &result);
    return result;
}

RegularizedObjective::RegularizedObjective(const BaseNeuralNet *net) {
    net_ = net;
}

CostGradient RegularizedObjective::compute_grad(const std::vector<double> &params,
                                                const Matrix<double> &inputs,
                                                const Matrix<double> &targets) const {
    return net_->compute_grad_regularized(params, inputs, targets);
}
