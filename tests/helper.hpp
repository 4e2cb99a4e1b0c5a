// Copyright 2020 Marcel Wagenländer

#ifndef HELPER_HPP
#define HELPER_HPP

#include "optimizer.hpp"
#include "tensors.hpp"

#include <random>
#include <string>
#include <vector>


// Central differences of model.compute_grad's cost
std::vector<double> finite_difference_grad(const Optimizable &model, const std::vector<double> &params,
                                           const Matrix<double> &inputs, const Matrix<double> &targets,
                                           double epsilon);

Matrix<double> random_matrix(long num_rows, long num_columns, double low, double high,
                             std::default_random_engine *generator);

int compare_vec(const std::vector<double> &a, const std::vector<double> &b, double tolerance, std::string name);

int compare_mat(Matrix<double> *mat_a, Matrix<double> *mat_b, double tolerance, std::string name);

#endif//HELPER_HPP
