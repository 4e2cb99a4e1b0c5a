// Copyright 2020 Marcel Wagenländer

#include "parameters.hpp"

#include <string>


void ParameterLayout::push_back(long num_params, ParamShape shape) {
    if (num_params < 0 || shape.num_rows < 0 || shape.num_columns < 0 ||
        shape.num_rows * shape.num_columns != num_params) {
        throw(std::string) "Shape mismatch: parameter shape " + shape_to_string(shape.num_rows, shape.num_columns) + " does not hold " + std::to_string(num_params) + " parameters";
    }

    LayerSlot slot;
    slot.offset = num_params_;
    slot.num_params = num_params;
    slot.num_rows = shape.num_rows;
    slot.num_columns = shape.num_columns;
    slots_.push_back(slot);

    num_params_ = num_params_ + num_params;
}

long ParameterLayout::num_layers() const {
    return slots_.size();
}

long ParameterLayout::num_params() const {
    return num_params_;
}

const LayerSlot &ParameterLayout::slot(long idx) const {
    if (idx < 0 || idx >= (long) slots_.size()) {
        throw(std::string) "Index out of range: layer " + std::to_string(idx) + " of " + std::to_string(slots_.size());
    }
    return slots_[idx];
}

void ParameterLayout::check_length(long length) const {
    if (length != num_params_) {
        throw(std::string) "Buffer length mismatch: " + std::to_string(length) + " weights for layers holding " + std::to_string(num_params_) + " parameters";
    }
}

MatrixSlice<double> ParameterLayout::view(const std::vector<double> &weights, long idx) const {
    const LayerSlot &layer_slot = slot(idx);
    check_length(weights.size());

    return slot_view(weights.data(), layer_slot);
}

MatrixSlice<double> ParameterLayout::non_bias_view(const std::vector<double> &weights, long idx) const {
    return strip_first_row(view(weights, idx));
}

MatrixSlice<double> slot_view(const double *weights, const LayerSlot &slot) {
    const double *start = slot.num_params > 0 ? weights + slot.offset : NULL;
    return MatrixSlice<double>(start, slot.num_rows, slot.num_columns, slot.num_columns);
}

MatrixSlice<double> strip_first_row(MatrixSlice<double> view) {
    if (view.num_rows_ == 0) {
        throw(std::string) "Cannot strip bias row: view " + shape_to_string(view.num_rows_, view.num_columns_) + " has no rows";
    }
    return view.reslice(1, view.num_rows_ - 1);
}
