// Copyright 2020 Marcel Wagenländer

#ifndef FLATNET_LAYER_H
#define FLATNET_LAYER_H

#include "tensors.hpp"

#include <string>
#include <vector>


struct ParamShape {
    long num_rows;
    long num_columns;
};

// A layer owns no parameters. It is handed a view of its slice of the
// network's flat parameter vector on every call and must not keep it.
class NetLayer {
public:
    std::string name_;

    virtual ~NetLayer() {}
    virtual long num_params() const = 0;
    virtual ParamShape param_shape() const = 0;
    virtual bool has_bias() const { return false; }
    virtual std::vector<double> default_params() = 0;
    virtual Matrix<double> forward(const Matrix<double> &x, MatrixSlice<double> params) = 0;
    virtual Matrix<double> back_params(const Matrix<double> &out_grad, const Matrix<double> &x, MatrixSlice<double> params) = 0;
    virtual Matrix<double> back_input(const Matrix<double> &out_grad, const Matrix<double> &x, MatrixSlice<double> params) = 0;
};

#endif//FLATNET_LAYER_H
