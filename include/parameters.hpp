// Copyright 2020 Marcel Wagenländer

#ifndef FLATNET_PARAMETERS_H
#define FLATNET_PARAMETERS_H

#include "layer.hpp"
#include "tensors.hpp"

#include <vector>


struct LayerSlot {
    long offset;
    long num_params;
    long num_rows;
    long num_columns;
};

// Where each layer's parameters live inside the network's flat parameter
// vector. Slot i starts at the sum of the parameter counts of layers 0..i-1.
class ParameterLayout {
private:
    std::vector<LayerSlot> slots_;
    long num_params_ = 0;

public:
    void push_back(long num_params, ParamShape shape);
    long num_layers() const;
    long num_params() const;
    const LayerSlot &slot(long idx) const;
    void check_length(long length) const;
    // Views borrow from weights, a temporary buffer would leave them dangling
    MatrixSlice<double> view(const std::vector<double> &weights, long idx) const;
    MatrixSlice<double> view(std::vector<double> &&weights, long idx) const = delete;
    MatrixSlice<double> non_bias_view(const std::vector<double> &weights, long idx) const;
    MatrixSlice<double> non_bias_view(std::vector<double> &&weights, long idx) const = delete;
};

// No bounds checks, the caller has run check_length on the buffer.
MatrixSlice<double> slot_view(const double *weights, const LayerSlot &slot);

MatrixSlice<double> strip_first_row(MatrixSlice<double> view);

#endif//FLATNET_PARAMETERS_H
