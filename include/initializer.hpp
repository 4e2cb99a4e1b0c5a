// Copyright 2020 Marcel Wagenländer

#ifndef FLATNET_INITIALIZER_H
#define FLATNET_INITIALIZER_H

#include <random>
#include <vector>


// sqrt(6 / (fan_in + fan_out)), Glorot & Bengio 2010
double xavier_bound(long fan_in, long fan_out);

std::vector<double> xavier_uniform(long fan_in, long fan_out, long count, std::default_random_engine *generator);

// Weights for a stack of biased linear layers with the given sizes, laid out
// the way BaseNeuralNet::mlp lays out its parameters.
std::vector<double> create_weights(const std::vector<long> &layer_sizes, std::default_random_engine *generator);

#endif//FLATNET_INITIALIZER_H
