// Copyright 2020 Marcel Wagenländer

#include "cuda_helper.hpp"

#include <iostream>
#include <string>


CudaHelper::CudaHelper() {
    check_cublas(cublasCreate(&cublas_handle));
    try {
        check_cudnn(cudnnCreate(&cudnn_handle));
    } catch (std::string &) {
        report_cublas(cublasDestroy(cublas_handle));
        throw;
    }
}

CudaHelper::~CudaHelper() {
    report_cublas(cublasDestroy(cublas_handle));
    report_cudnn(cudnnDestroy(cudnn_handle));
}

void check_cuda(cudaError_t status) {
    if (status != cudaSuccess) {
        throw(std::string) "CUDA API failed with error: " + (std::string) cudaGetErrorString(status);
    }
}

void check_cudnn(cudnnStatus_t status) {
    if (status != CUDNN_STATUS_SUCCESS) {
        throw(std::string) "CUDNN API failed with error: " + (std::string) cudnnGetErrorString(status);
    }
}

static const char *cublas_status_name(cublasStatus_t status) {
    switch (status) {
        case CUBLAS_STATUS_SUCCESS:
            return "CUBLAS_STATUS_SUCCESS";
        case CUBLAS_STATUS_NOT_INITIALIZED:
            return "CUBLAS_STATUS_NOT_INITIALIZED";
        case CUBLAS_STATUS_ALLOC_FAILED:
            return "CUBLAS_STATUS_ALLOC_FAILED";
        case CUBLAS_STATUS_INVALID_VALUE:
            return "CUBLAS_STATUS_INVALID_VALUE";
        case CUBLAS_STATUS_ARCH_MISMATCH:
            return "CUBLAS_STATUS_ARCH_MISMATCH";
        case CUBLAS_STATUS_MAPPING_ERROR:
            return "CUBLAS_STATUS_MAPPING_ERROR";
        case CUBLAS_STATUS_EXECUTION_FAILED:
            return "CUBLAS_STATUS_EXECUTION_FAILED";
        case CUBLAS_STATUS_INTERNAL_ERROR:
            return "CUBLAS_STATUS_INTERNAL_ERROR";
        case CUBLAS_STATUS_NOT_SUPPORTED:
            return "CUBLAS_STATUS_NOT_SUPPORTED";
        case CUBLAS_STATUS_LICENSE_ERROR:
            return "CUBLAS_STATUS_LICENSE_ERROR";
    }
    return "unknown error";
}

void check_cublas(cublasStatus_t status) {
    if (status != CUBLAS_STATUS_SUCCESS) {
        throw(std::string) "CUBLAS API failed with error: " + (std::string) cublas_status_name(status);
    }
}

bool report_cuda(cudaError_t status) {
    if (status != cudaSuccess) {
        std::cerr << "CUDA API failed with error: " << cudaGetErrorString(status) << std::endl;
        return false;
    }
    return true;
}

bool report_cudnn(cudnnStatus_t status) {
    if (status != CUDNN_STATUS_SUCCESS) {
        std::cerr << "CUDNN API failed with error: " << cudnnGetErrorString(status) << std::endl;
        return false;
    }
    return true;
}

bool report_cublas(cublasStatus_t status) {
    if (status != CUBLAS_STATUS_SUCCESS) {
        std::cerr << "CUBLAS API failed with error: " << cublas_status_name(status) << std::endl;
        return false;
    }
    return true;
}
