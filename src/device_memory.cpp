// Copyright 2020 Marcel Wagenländer

#include "device_memory.hpp"
#include "cuda_helper.hpp"


DeviceMemory::DeviceMemory(long size) {
    if (size > 0) {
        check_cuda(cudaMalloc(&values_, size * sizeof(double)));
        size_ = size;
    }
}

DeviceMemory::DeviceMemory(const double *host_values, long size) : DeviceMemory(size) {
    copy_from_host(host_values);
}

DeviceMemory::~DeviceMemory() {
    if (values_ != NULL) {
        report_cuda(cudaFree(values_));
    }
}

void DeviceMemory::copy_from_host(const double *host_values) {
    if (size_ > 0) {
        check_cuda(cudaMemcpy(values_, host_values, size_ * sizeof(double),
                              cudaMemcpyHostToDevice));
    }
}

void DeviceMemory::copy_to_host(double *host_values) const {
    if (size_ > 0) {
        check_cuda(cudaMemcpy(host_values, values_, size_ * sizeof(double),
                              cudaMemcpyDeviceToHost));
    }
}

TensorDescriptor::TensorDescriptor() {
    check_cudnn(cudnnCreateTensorDescriptor(&desc_));
}

TensorDescriptor::TensorDescriptor(const Matrix<double> &mat) : TensorDescriptor() {
    check_cudnn(cudnnSetTensor4dDescriptor(desc_,
                                           CUDNN_TENSOR_NCHW,
                                           CUDNN_DATA_DOUBLE,
                                           mat.num_rows_, 1, 1, mat.num_columns_));
}

TensorDescriptor::~TensorDescriptor() {
    report_cudnn(cudnnDestroyTensorDescriptor(desc_));
}
