// 2020 Marcel Wagenländer

#include "gpu_memory_logger.hpp"
#include "gpu_memory.hpp"

#include <cerrno>
#include <chrono>
#include <sys/stat.h>

#define MiB (1 << 20)


static void log_memory(std::future<void> future, std::string *log_string, long interval) {
    std::chrono::high_resolution_clock::time_point tp_start = std::chrono::high_resolution_clock::now();
    std::chrono::high_resolution_clock::time_point tp_now;
    while (future.wait_for(std::chrono::milliseconds(1)) == std::future_status::timeout) {
        tp_now = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double, std::milli> time_span = tp_now - tp_start;

        long allocated_memory_mib = get_allocated_memory() / MiB;

        log_string->append(std::to_string(time_span.count()) + "," + std::to_string(allocated_memory_mib) + "\n");

        std::this_thread::sleep_for(std::chrono::milliseconds(interval));
    }
}

GPUMemoryLogger::GPUMemoryLogger(std::string file_name) : GPUMemoryLogger(file_name, 100) {}

GPUMemoryLogger::GPUMemoryLogger(std::string file_name, long interval) {
    file_name_ = file_name;
    dir_path_ = "/tmp/benchmark";
    path_ = dir_path_ + "/" + file_name_ + ".log";
    interval_ = interval;
    log_string_ = "time,memory\n";
}

void GPUMemoryLogger::start() {
    if (mkdir(dir_path_.c_str(), 0755) != 0 && errno != EEXIST) {
        throw(std::string) "Could not create " + dir_path_;
    }

    std::future<void> future = signal_exit_.get_future();
    logging_thread_ = std::thread(log_memory, std::move(future), &log_string_, interval_);
}

void GPUMemoryLogger::stop() {
    signal_exit_.set_value();
    logging_thread_.join();

    log_file_.open(path_, std::ios::trunc);
    if (!log_file_.is_open()) {
        throw(std::string) "Could not open " + path_;
    }
    log_file_ << log_string_;
    log_file_.close();
}
