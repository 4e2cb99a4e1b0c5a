// Copyright 2020 Marcel Wagenländer

#ifndef FLATNET_TENSORS_H
#define FLATNET_TENSORS_H

#include <random>
#include <string>
#include <vector>


// Row-major matrix in pinned host memory.
template<typename T>
class Matrix {
public:
    long num_rows_ = 0;
    long num_columns_ = 0;
    long size_ = 0;
    T *values_ = NULL;

    Matrix();
    Matrix(long num_rows, long num_columns);
    Matrix(long num_rows, long num_columns, const std::vector<T> &values);
    Matrix(const Matrix<T> &other);
    Matrix(Matrix<T> &&other);
    Matrix<T> &operator=(const Matrix<T> &other);
    Matrix<T> &operator=(Matrix<T> &&other);
    ~Matrix();
    void set(long num_rows, long num_columns);
    void set_values(T value);
    void set_random_values(T low, T high, std::default_random_engine *generator);
    T get(long row, long column) const;
    void set_value(long row, long column, T value);
    Matrix<T> apply(T (*func)(T)) const;
    std::vector<T> data() const;
};

// Non-owning row-major view. The row stride must equal the number of columns,
// padded rows are not supported.
template<typename T>
class MatrixSlice {
public:
    long num_rows_ = 0;
    long num_columns_ = 0;
    long row_stride_ = 0;
    const T *values_ = NULL;

    MatrixSlice();
    MatrixSlice(const T *values, long num_rows, long num_columns, long row_stride);
    MatrixSlice(const Matrix<T> &mat);
    long size() const;
    T get(long row, long column) const;
    MatrixSlice<T> reslice(long start_row, long num_rows) const;
    Matrix<T> to_matrix() const;
};

std::string shape_to_string(long num_rows, long num_columns);

template<typename T>
void print_matrix(Matrix<T> *mat);

template<typename T>
void print_matrix_features(Matrix<T> *mat);

long count_non_finite(Matrix<double> *x);

long count_non_finite(std::vector<double> *x);

bool check_non_finite(Matrix<double> *x, std::string name);

bool check_non_finite(std::vector<double> *x, std::string name);

bool check_equality(Matrix<double> *a, Matrix<double> *b, double tolerance);

#endif//FLATNET_TENSORS_H
