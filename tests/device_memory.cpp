// Copyright 2020 Marcel Wagenländer

#include "device_memory.hpp"
#include "cuda_helper.hpp"
#include "tensors.hpp"

#include "catch2/catch.hpp"


TEST_CASE("Device memory", "[devicememory]") {
    std::vector<double> values = {1, 2, 3, 4};
    DeviceMemory d_values(values.data(), values.size());
    CHECK(d_values.size_ == 4);
    CHECK(d_values.values_ != nullptr);

    std::vector<double> copied(4, 0.0);
    d_values.copy_to_host(copied.data());
    CHECK(copied == values);

    DeviceMemory empty(0);
    CHECK(empty.values_ == nullptr);
    REQUIRE_NOTHROW(empty.copy_to_host(copied.data()));
}

TEST_CASE("Device memory, tensor descriptor", "[devicememory][cudnn]") {
    Matrix<double> mat(2, 3);
    REQUIRE_NOTHROW(TensorDescriptor(mat));
}

TEST_CASE("Status reports do not throw", "[cudahelper]") {
    CHECK(report_cuda(cudaSuccess));
    CHECK(report_cublas(CUBLAS_STATUS_SUCCESS));
    CHECK(report_cudnn(CUDNN_STATUS_SUCCESS));

    bool reported = true;
    REQUIRE_NOTHROW(reported = report_cuda(cudaErrorMemoryAllocation));
    CHECK_FALSE(reported);
    REQUIRE_NOTHROW(reported = report_cublas(CUBLAS_STATUS_INVALID_VALUE));
    CHECK_FALSE(reported);
    REQUIRE_NOTHROW(reported = report_cudnn(CUDNN_STATUS_BAD_PARAM));
    CHECK_FALSE(reported);
}
