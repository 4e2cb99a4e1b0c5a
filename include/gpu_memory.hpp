// Copyright 2020 Marcel Wagenländer

#ifndef FLATNET_GPU_MEMORY_H
#define FLATNET_GPU_MEMORY_H


// Device memory in use, in bytes
long get_allocated_memory();

#endif//FLATNET_GPU_MEMORY_H
