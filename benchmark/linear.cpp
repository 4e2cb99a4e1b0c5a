// Copyright 2020 Marcel Wagenländer

#include "linear.hpp"
#include "cuda_helper.hpp"
#include "gpu_memory_logger.hpp"
#include "tensors.hpp"

#include <benchmark/benchmark.h>

const long num_in_features = 512;
const long num_out_features = 256;


void benchmark_linear(benchmark::State &state, bool forward) {
    long num_samples = state.range(0);
    std::default_random_engine generator(1);

    Matrix<double> features(num_samples, num_in_features);
    features.set_random_values(-1.0, 1.0, &generator);
    Matrix<double> incoming_gradients;
    if (!forward) {
        incoming_gradients.set(num_samples, num_out_features);
        incoming_gradients.set_random_values(-1.0, 1.0, &generator);
    }

    CudaHelper cuda_helper;
    Linear linear(&cuda_helper, num_in_features, num_out_features, true, 1);
    std::vector<double> params_values = linear.default_params();
    MatrixSlice<double> params(params_values.data(), linear.param_shape().num_rows,
                               linear.param_shape().num_columns, linear.param_shape().num_columns);

    std::string direction;
    if (forward) {
        direction = "forward";
    } else {
        direction = "backward";
    }

    GPUMemoryLogger memory_logger(linear.name_ + "_" + std::to_string(num_samples) + "_" + direction);
    memory_logger.start();

    for (auto _ : state) {
        if (forward) {
            benchmark::DoNotOptimize(linear.forward(features, params));
        } else {
            benchmark::DoNotOptimize(linear.back_params(incoming_gradients, features, params));
            benchmark::DoNotOptimize(linear.back_input(incoming_gradients, features, params));
        }
    }

    memory_logger.stop();
}

static void BM_Layer_Linear_Forward(benchmark::State &state) {
    benchmark_linear(state, true);
}
BENCHMARK(BM_Layer_Linear_Forward)->RangeMultiplier(2)->Range(1 << 8, 1 << 14);

static void BM_Layer_Linear_Backward(benchmark::State &state) {
    benchmark_linear(state, false);
}
BENCHMARK(BM_Layer_Linear_Backward)->RangeMultiplier(2)->Range(1 << 8, 1 << 14);
