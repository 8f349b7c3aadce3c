#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

struct HostSample {
    double cpu = 0.0;       // percent busy since the previous sample
    double memory = 0.0;    // percent of MemTotal in use
    double disk = 0.0;      // percent of the root filesystem in use
    double network = 0.0;   // throughput as percent of link capacity
    uint64_t bytes_in = 0;
    uint64_t bytes_out = 0;
    double bytes_in_per_sec = 0.0;
    double bytes_out_per_sec = 0.0;
    int established_connections = 0;
    int64_t uptime_seconds = 0;
};

// Samples the hub's own host from procfs. CPU and network figures are
// deltas against the previous call, so the first sample reports zero for both.
class HostSampler {
public:
    // link_capacity is in bytes per second
    explicit HostSampler(int64_t link_capacity);

    HostSample sample();

private:
    bool read_cpu(double& cpu);
    static bool read_memory(double& memory);
    static bool read_disk(double& disk);
    static bool read_network(uint64_t& rx, uint64_t& tx);
    static int count_established_connections();

    const int64_t link_capacity_;
    const std::chrono::steady_clock::time_point started_;
    std::mutex mutex_;

    bool has_prev_cpu_ = false;
    uint64_t prev_total_ = 0;
    uint64_t prev_idle_ = 0;

    bool has_prev_net_ = false;
    uint64_t prev_rx_ = 0;
    uint64_t prev_tx_ = 0;
    std::chrono::steady_clock::time_point prev_net_time_;
};
