// Copyright 2020 Marcel Wagenländer

#ifndef FLATNET_DEVICE_MEMORY_H
#define FLATNET_DEVICE_MEMORY_H

#include "tensors.hpp"

#include <cudnn.h>


// Device buffer of doubles, freed when it goes out of scope
class DeviceMemory {
public:
    double *values_ = NULL;
    long size_ = 0;

    explicit DeviceMemory(long size);
    DeviceMemory(const double *host_values, long size);
    DeviceMemory(const DeviceMemory &) = delete;
    DeviceMemory &operator=(const DeviceMemory &) = delete;
    ~DeviceMemory();
    void copy_from_host(const double *host_values);
    void copy_to_host(double *host_values) const;
};

// cuDNN NCHW tensor descriptor of shape (rows, 1, 1, columns)
class TensorDescriptor {
public:
    cudnnTensorDescriptor_t desc_;

    TensorDescriptor();
    explicit TensorDescriptor(const Matrix<double> &mat);
    TensorDescriptor(const TensorDescriptor &) = delete;
    TensorDescriptor &operator=(const TensorDescriptor &) = delete;
    ~TensorDescriptor();
};

#endif//FLATNET_DEVICE_MEMORY_H
