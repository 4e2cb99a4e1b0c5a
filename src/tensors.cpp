// Copyright 2020 Marcel Wagenländer

#include "tensors.hpp"
#include "cuda_helper.hpp"

#include <cmath>
#include <cstring>
#include <iostream>
#include <utility>


template<typename T>
Matrix<T>::Matrix() {}
template Matrix<double>::Matrix();

template<typename T>
Matrix<T>::Matrix(long num_rows, long num_columns) {
    set(num_rows, num_columns);
}
template Matrix<double>::Matrix(long num_rows, long num_columns);

template<typename T>
Matrix<T>::Matrix(long num_rows, long num_columns, const std::vector<T> &values) {
    if (num_rows * num_columns != (long) values.size()) {
        throw(std::string) "Shape mismatch: " + std::to_string(values.size()) + " values do not fill a matrix of shape " + shape_to_string(num_rows, num_columns);
    }
    set(num_rows, num_columns);
    if (size_ > 0) {
        std::memcpy(values_, values.data(), size_ * sizeof(T));
    }
}
template Matrix<double>::Matrix(long num_rows, long num_columns, const std::vector<double> &values);

template<typename T>
Matrix<T>::Matrix(const Matrix<T> &other) {
    set(other.num_rows_, other.num_columns_);
    if (size_ > 0) {
        std::memcpy(values_, other.values_, size_ * sizeof(T));
    }
}
template Matrix<double>::Matrix(const Matrix<double> &other);

template<typename T>
Matrix<T>::Matrix(Matrix<T> &&other) {
    num_rows_ = other.num_rows_;
    num_columns_ = other.num_columns_;
    size_ = other.size_;
    values_ = other.values_;

    other.num_rows_ = 0;
    other.num_columns_ = 0;
    other.size_ = 0;
    other.values_ = NULL;
}
template Matrix<double>::Matrix(Matrix<double> &&other);

template<typename T>
Matrix<T> &Matrix<T>::operator=(const Matrix<T> &other) {
    if (this != &other) {
        set(other.num_rows_, other.num_columns_);
        if (size_ > 0) {
            std::memcpy(values_, other.values_, size_ * sizeof(T));
        }
    }
    return *this;
}
template Matrix<double> &Matrix<double>::operator=(const Matrix<double> &other);

template<typename T>
Matrix<T> &Matrix<T>::operator=(Matrix<T> &&other) {
    std::swap(num_rows_, other.num_rows_);
    std::swap(num_columns_, other.num_columns_);
    std::swap(size_, other.size_);
    std::swap(values_, other.values_);
    return *this;
}
template Matrix<double> &Matrix<double>::operator=(Matrix<double> &&other);

template<typename T>
Matrix<T>::~Matrix() {
    if (values_ != NULL) {
        report_cuda(cudaFreeHost(values_));
    }
}
template Matrix<double>::~Matrix();

template<typename T>
void Matrix<T>::set(long num_rows, long num_columns) {
    if (num_rows < 0 || num_columns < 0) {
        throw(std::string) "Shape mismatch: negative matrix shape " + shape_to_string(num_rows, num_columns);
    }
    num_rows_ = num_rows;
    num_columns_ = num_columns;
    size_ = num_rows_ * num_columns_;
    if (values_ != NULL) {
        check_cuda(cudaFreeHost(values_));
        values_ = NULL;
    }
    if (size_ > 0) {
        check_cuda(cudaMallocHost(&values_, size_ * sizeof(T)));
    }
}
template void Matrix<double>::set(long num_rows, long num_columns);

template<typename T>
void Matrix<T>::set_values(T value) {
    for (long i = 0; i < size_; ++i) {
        values_[i] = value;
    }
}
template void Matrix<double>::set_values(double value);

template<typename T>
void Matrix<T>::set_random_values(T low, T high, std::default_random_engine *generator) {
    std::uniform_real_distribution<T> distr(low, high);
    for (long i = 0; i < size_; ++i) {
        values_[i] = distr(*generator);
    }
}
template void Matrix<double>::set_random_values(double low, double high, std::default_random_engine *generator);

template<typename T>
T Matrix<T>::get(long row, long column) const {
    if (row < 0 || row >= num_rows_ || column < 0 || column >= num_columns_) {
        throw(std::string) "Index out of range: element (" + std::to_string(row) + ", " + std::to_string(column) + ") of matrix " + shape_to_string(num_rows_, num_columns_);
    }
    return values_[row * num_columns_ + column];
}
template double Matrix<double>::get(long row, long column) const;

template<typename T>
void Matrix<T>::set_value(long row, long column, T value) {
    if (row < 0 || row >= num_rows_ || column < 0 || column >= num_columns_) {
        throw(std::string) "Index out of range: element (" + std::to_string(row) + ", " + std::to_string(column) + ") of matrix " + shape_to_string(num_rows_, num_columns_);
    }
    values_[row * num_columns_ + column] = value;
}
template void Matrix<double>::set_value(long row, long column, double value);

template<typename T>
Matrix<T> Matrix<T>::apply(T (*func)(T)) const {
    Matrix<T> result(num_rows_, num_columns_);
    for (long i = 0; i < size_; ++i) {
        result.values_[i] = func(values_[i]);
    }
    return result;
}
template Matrix<double> Matrix<double>::apply(double (*func)(double)) const;

template<typename T>
std::vector<T> Matrix<T>::data() const {
    return std::vector<T>(values_, values_ + size_);
}
template std::vector<double> Matrix<double>::data() const;


template<typename T>
MatrixSlice<T>::MatrixSlice() {}
template MatrixSlice<double>::MatrixSlice();

template<typename T>
MatrixSlice<T>::MatrixSlice(const T *values, long num_rows, long num_columns, long row_stride) {
    if (num_rows < 0 || num_columns < 0) {
        throw(std::string) "Shape mismatch: negative view shape " + shape_to_string(num_rows, num_columns);
    }
    if (row_stride != num_columns) {
        throw(std::string) "Shape mismatch: row stride " + std::to_string(row_stride) + " differs from column count " + std::to_string(num_columns);
    }
    num_rows_ = num_rows;
    num_columns_ = num_columns;
    row_stride_ = row_stride;
    values_ = values;
}
template MatrixSlice<double>::MatrixSlice(const double *values, long num_rows, long num_columns, long row_stride);

template<typename T>
MatrixSlice<T>::MatrixSlice(const Matrix<T> &mat) {
    num_rows_ = mat.num_rows_;
    num_columns_ = mat.num_columns_;
    row_stride_ = mat.num_columns_;
    values_ = mat.values_;
}
template MatrixSlice<double>::MatrixSlice(const Matrix<double> &mat);

template<typename T>
long MatrixSlice<T>::size() const {
    return num_rows_ * num_columns_;
}
template long MatrixSlice<double>::size() const;

template<typename T>
T MatrixSlice<T>::get(long row, long column) const {
    if (row < 0 || row >= num_rows_ || column < 0 || column >= num_columns_) {
        throw(std::string) "Index out of range: element (" + std::to_string(row) + ", " + std::to_string(column) + ") of view " + shape_to_string(num_rows_, num_columns_);
    }
    return values_[row * row_stride_ + column];
}
template double MatrixSlice<double>::get(long row, long column) const;

template<typename T>
MatrixSlice<T> MatrixSlice<T>::reslice(long start_row, long num_rows) const {
    if (start_row < 0 || num_rows < 0 || start_row + num_rows > num_rows_) {
        throw(std::string) "Index out of range: rows [" + std::to_string(start_row) + ", " + std::to_string(start_row + num_rows) + ") of view " + shape_to_string(num_rows_, num_columns_);
    }
    const T *start = num_rows > 0 ? values_ + start_row * row_stride_ : NULL;
    return MatrixSlice<T>(start, num_rows, num_columns_, row_stride_);
}
template MatrixSlice<double> MatrixSlice<double>::reslice(long start_row, long num_rows) const;

template<typename T>
Matrix<T> MatrixSlice<T>::to_matrix() const {
    Matrix<T> mat(num_rows_, num_columns_);
    if (mat.size_ > 0) {
        std::memcpy(mat.values_, values_, mat.size_ * sizeof(T));
    }
    return mat;
}
template Matrix<double> MatrixSlice<double>::to_matrix() const;


std::string shape_to_string(long num_rows, long num_columns) {
    return "(" + std::to_string(num_rows) + ", " + std::to_string(num_columns) + ")";
}

template<typename T>
void print_matrix(Matrix<T> *mat) {
    std::cout << "-----" << std::endl;
    for (long i = 0; i < mat->num_rows_; i = i + 1) {
        for (long j = 0; j < mat->num_columns_; j = j + 1) {
            std::cout << mat->values_[i * mat->num_columns_ + j] << ",";
        }
        std::cout << std::endl;
    }
}
template void print_matrix<double>(Matrix<double> *mat);

template<typename T>
void print_matrix_features(Matrix<T> *mat) {
    std::cout << "Shape: " << shape_to_string(mat->num_rows_, mat->num_columns_) << std::endl;
    std::cout << "Values pointer: " << mat->values_ << std::endl;
}
template void print_matrix_features<double>(Matrix<double> *mat);

long count_non_finite(Matrix<double> *x) {
    long num_non_finite = 0;

    for (long i = 0; i < x->size_; ++i) {
        if (!std::isfinite(x->values_[i])) {
            num_non_finite = num_non_finite + 1;
        }
    }

    return num_non_finite;
}

long count_non_finite(std::vector<double> *x) {
    long num_non_finite = 0;

    for (size_t i = 0; i < x->size(); ++i) {
        if (!std::isfinite(x->at(i))) {
            num_non_finite = num_non_finite + 1;
        }
    }

    return num_non_finite;
}

bool check_non_finite(Matrix<double> *x, std::string name) {
    long num_non_finite = count_non_finite(x);
    if (num_non_finite > 0) {
        std::cout << name << " has " << num_non_finite << " non-finite values" << std::endl;
        return true;
    }
    return false;
}

bool check_non_finite(std::vector<double> *x, std::string name) {
    long num_non_finite = count_non_finite(x);
    if (num_non_finite > 0) {
        std::cout << name << " has " << num_non_finite << " non-finite values" << std::endl;
        return true;
    }
    return false;
}

bool check_equality(Matrix<double> *a, Matrix<double> *b, double tolerance) {
    if (a->num_rows_ != b->num_rows_ || a->num_columns_ != b->num_columns_) {
        throw(std::string) "Shape mismatch: " + shape_to_string(a->num_rows_, a->num_columns_) + " vs " + shape_to_string(b->num_rows_, b->num_columns_);
    }

    for (long i = 0; i < a->size_; ++i) {
        if (std::abs(a->values_[i] - b->values_[i]) > tolerance) {
            return false;
        }
    }
    return true;
}
