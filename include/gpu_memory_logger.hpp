// 2020 Marcel Wagenländer

#ifndef FLATNET_GPU_MEMORY_LOGGER_H
#define FLATNET_GPU_MEMORY_LOGGER_H

#include <fstream>
#include <future>
#include <string>
#include <thread>


// Samples the allocated device memory in a background thread and writes
// time,memory lines to /tmp/benchmark/<name>.log on stop()
class GPUMemoryLogger {
private:
    std::string file_name_;
    std::string dir_path_;
    std::string path_;
    long interval_;
    std::promise<void> signal_exit_;
    std::thread logging_thread_;
    std::string log_string_;
    std::ofstream log_file_;

public:
    GPUMemoryLogger(std::string file_name, long interval);
    explicit GPUMemoryLogger(std::string file_name);
    void start();
    void stop();
};

#endif//FLATNET_GPU_MEMORY_LOGGER_H
