// 2020 Marcel Wagenländer

#ifndef FLATNET_DENSE_COMPUTATION_H
#define FLATNET_DENSE_COMPUTATION_H

#include "cuda_helper.hpp"
#include "tensors.hpp"

#include <vector>


// result = op(a) * op(b) + beta * result, all operands row-major.
// With beta == 0 result is reshaped, otherwise it must already have the output shape.
void mat_mat_mult(CudaHelper *cuda_helper,
                  MatrixSlice<double> a, bool transpose_a,
                  MatrixSlice<double> b, bool transpose_b,
                  double beta, Matrix<double> *result);

// result(0, j) = sum_i mat(i, j)
void sum_rows(CudaHelper *cuda_helper, MatrixSlice<double> mat, Matrix<double> *result);

// y = alpha * x + y
void vec_vec_add(CudaHelper *cuda_helper, double alpha, const std::vector<double> &x, std::vector<double> *y);

#endif//FLATNET_DENSE_COMPUTATION_H
