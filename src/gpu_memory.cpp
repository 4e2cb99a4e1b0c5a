// Copyright 2020 Marcel Wagenländer

#include "gpu_memory.hpp"
#include "cuda_helper.hpp"


long get_allocated_memory() {
    size_t free;
    size_t total;
    check_cuda(cudaMemGetInfo(&free, &total));
    return total - free;
}
