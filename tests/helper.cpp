// Copyright Marcel Wagenländer 2020

#include "helper.hpp"

#include <cmath>
#include <iostream>


std::vector<double> finite_difference_grad(const Optimizable &model, const std::vector<double> &params,
                                           const Matrix<double> &inputs, const Matrix<double> &targets,
                                           double epsilon) {
    std::vector<double> gradients(params.size());
    std::vector<double> perturbed = params;
    for (long i = 0; i < (long) params.size(); ++i) {
        perturbed[i] = params[i] + epsilon;
        double cost_plus = model.compute_grad(perturbed, inputs, targets).cost;
        perturbed[i] = params[i] - epsilon;
        double cost_minus = model.compute_grad(perturbed, inputs, targets).cost;
        perturbed[i] = params[i];

        gradients[i] = (cost_plus - cost_minus) / (2.0 * epsilon);
    }
    return gradients;
}

Matrix<double> random_matrix(long num_rows, long num_columns, double low, double high,
                             std::default_random_engine *generator) {
    Matrix<double> mat(num_rows, num_columns);
    mat.set_random_values(low, high, generator);
    return mat;
}

int compare_vec(const std::vector<double> &a, const std::vector<double> &b, double tolerance, std::string name) {
    if (a.size() != b.size()) {
        std::cout << name << ": lengths " << a.size() << " and " << b.size() << " differ" << std::endl;
        return 0;
    }
    long num_unequal = 0;
    for (long i = 0; i < (long) a.size(); ++i) {
        if (!(std::abs(a[i] - b[i]) <= tolerance)) {
            if (num_unequal == 0) {
                std::cout << name << ": first difference at " << i << ": " << a[i] << " vs " << b[i] << std::endl;
            }
            num_unequal = num_unequal + 1;
        }
    }
    if (num_unequal > 0) {
        std::cout << name << ": " << num_unequal << " of " << a.size() << " values differ" << std::endl;
        return 0;
    }
    return 1;
}

int compare_mat(Matrix<double> *mat_a, Matrix<double> *mat_b, double tolerance, std::string name) {
    if (mat_a->num_rows_ != mat_b->num_rows_ || mat_a->num_columns_ != mat_b->num_columns_) {
        std::cout << name << ": shapes differ" << std::endl;
        print_matrix_features(mat_a);
        print_matrix_features(mat_b);
        return 0;
    }
    int equal = compare_vec(mat_a->data(), mat_b->data(), tolerance, name);
    if (!equal && mat_a->size_ <= 64) {
        print_matrix(mat_a);
        print_matrix(mat_b);
    }
    return equal;
}
