// 2020 Marcel Wagenländer

#include "dense_computation.hpp"
#include "device_memory.hpp"

#include <string>


void mat_mat_mult(CudaHelper *cuda_helper,
                  MatrixSlice<double> a, bool transpose_a,
                  MatrixSlice<double> b, bool transpose_b,
                  double beta, Matrix<double> *result) {
    long m = transpose_a ? a.num_columns_ : a.num_rows_;
    long k = transpose_a ? a.num_rows_ : a.num_columns_;
    long k_b = transpose_b ? b.num_columns_ : b.num_rows_;
    long n = transpose_b ? b.num_rows_ : b.num_columns_;

    if (k != k_b) {
        throw(std::string) "Shape mismatch: cannot multiply " + shape_to_string(m, k) + " by " + shape_to_string(k_b, n);
    }
    if (beta == 0.0) {
        result->set(m, n);
        result->set_values(0.0);
    } else if (result->num_rows_ != m || result->num_columns_ != n) {
        throw(std::string) "Shape mismatch: accumulator " + shape_to_string(result->num_rows_, result->num_columns_) + " for product " + shape_to_string(m, n);
    }
    if (m == 0 || n == 0) {
        return;
    }
    if (k == 0) {
        for (long i = 0; i < result->size_; ++i) {
            result->values_[i] = beta * result->values_[i];
        }
        return;
    }

    DeviceMemory d_a(a.values_, a.size());
    DeviceMemory d_b(b.values_, b.size());
    DeviceMemory d_c(result->values_, result->size_);

    // a row-major matrix is its own transpose in column-major order, so
    // C^T = op(B)^T * op(A)^T is computed instead of C = op(A) * op(B)
    double alpha = 1.0;
    check_cublas(cublasDgemm(cuda_helper->cublas_handle,
                             transpose_b ? CUBLAS_OP_T : CUBLAS_OP_N,
                             transpose_a ? CUBLAS_OP_T : CUBLAS_OP_N,
                             n, m, k,
                             &alpha,
                             d_b.values_, b.num_columns_,
                             d_a.values_, a.num_columns_,
                             &beta,
                             d_c.values_, n));

    d_c.copy_to_host(result->values_);
}

void sum_rows(CudaHelper *cuda_helper, MatrixSlice<double> mat, Matrix<double> *result) {
    result->set(1, mat.num_columns_);
    result->set_values(0.0);
    if (mat.num_rows_ == 0 || mat.num_columns_ == 0) {
        return;
    }

    std::vector<double> ones(mat.num_rows_, 1.0);
    DeviceMemory d_mat(mat.values_, mat.size());
    DeviceMemory d_ones(ones.data(), mat.num_rows_);
    DeviceMemory d_sum(mat.num_columns_);

    double alpha = 1.0;
    double beta = 0.0;
    check_cublas(cublasDgemv(cuda_helper->cublas_handle,
                             CUBLAS_OP_N,
                             mat.num_columns_, mat.num_rows_,
                             &alpha, d_mat.values_, mat.num_columns_,
                             d_ones.values_, 1,
                             &beta, d_sum.values_, 1));

    d_sum.copy_to_host(result->values_);
}

void vec_vec_add(CudaHelper *cuda_helper, double alpha, const std::vector<double> &x, std::vector<double> *y) {
    if (x.size() != y->size()) {
        throw(std::string) "Shape mismatch: vectors of length " + std::to_string(x.size()) + " and " + std::to_string(y->size());
    }
    if (x.empty()) {
        return;
    }
    long size = x.size();

    DeviceMemory d_x(x.data(), size);
    DeviceMemory d_y(y->data(), size);

    check_cublas(cublasDaxpy(cuda_helper->cublas_handle,
                             size,
                             &alpha, d_x.values_, 1,
                             d_y.values_, 1));

    d_y.copy_to_host(y->data());
}
