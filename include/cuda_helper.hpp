// Copyright 2020 Marcel Wagenländer

#ifndef FLATNET_CUDA_HELPER_H
#define FLATNET_CUDA_HELPER_H

#include <cublas_v2.h>
#include <cuda_runtime.h>
#include <cudnn.h>

class CudaHelper {
public:
    cublasHandle_t cublas_handle;
    cudnnHandle_t cudnn_handle;

    CudaHelper();
    CudaHelper(const CudaHelper &) = delete;
    CudaHelper &operator=(const CudaHelper &) = delete;
    ~CudaHelper();
};


void check_cuda(cudaError_t status);

void check_cudnn(cudnnStatus_t status);

void check_cublas(cublasStatus_t status);

// For destructors: print the failure instead of throwing, false on failure
bool report_cuda(cudaError_t status);

bool report_cudnn(cudnnStatus_t status);

bool report_cublas(cublasStatus_t status);

#endif//FLATNET_CUDA_HELPER_H
