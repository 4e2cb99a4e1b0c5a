// Copyright 2020 Marcel Wagenländer

#include <benchmark/benchmark.h>

BENCHMARK_MAIN();
