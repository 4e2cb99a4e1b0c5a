// Copyright 2020 Marcel Wagenländer

#include "network.hpp"
#include "criterion.hpp"
#include "cuda_helper.hpp"
#include "gpu_memory_logger.hpp"
#include "tensors.hpp"

#include <benchmark/benchmark.h>

const std::vector<long> layer_sizes = {256, 128, 64, 10};


void benchmark_network(benchmark::State &state, bool forward) {
    long num_samples = state.range(0);
    std::default_random_engine generator(2);

    Matrix<double> inputs(num_samples, layer_sizes.front());
    inputs.set_random_values(-1.0, 1.0, &generator);
    Matrix<double> targets(num_samples, layer_sizes.back());
    targets.set_random_values(0.0, 1.0, &generator);

    CudaHelper cuda_helper;
    BaseNeuralNet net = BaseNeuralNet::mlp(&cuda_helper, layer_sizes, BCECriterion(), sigmoid);

    std::string name;
    if (forward) {
        name = "network_forward_prop_";
    } else {
        name = "network_compute_grad_";
    }
    GPUMemoryLogger memory_logger(name + std::to_string(num_samples));
    memory_logger.start();

    for (auto _ : state) {
        if (forward) {
            benchmark::DoNotOptimize(net.forward_prop(inputs));
        } else {
            benchmark::DoNotOptimize(net.compute_grad(net.weights(), inputs, targets));
        }
    }

    memory_logger.stop();
}

static void BM_Network_Forward_Prop(benchmark::State &state) {
    benchmark_network(state, true);
}
BENCHMARK(BM_Network_Forward_Prop)->RangeMultiplier(2)->Range(1 << 6, 1 << 12);

static void BM_Network_Compute_Grad(benchmark::State &state) {
    benchmark_network(state, false);
}
BENCHMARK(BM_Network_Compute_Grad)->RangeMultiplier(2)->Range(1 << 6, 1 << 12);
