#include "host_sampler.hpp"
#include "util.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/statvfs.h>
#include <spdlog/spdlog.h>

HostSampler::HostSampler(int64_t link_capacity)
    : link_capacity_(link_capacity > 0 ? link_capacity : 1),
      started_(std::chrono::steady_clock::now()) {}

HostSample HostSampler::sample() {
    std::lock_guard<std::mutex> lock(mutex_);
    HostSample s;

    if (!read_cpu(s.cpu)) {
        spdlog::debug("CPU usage unavailable from /proc/stat");
    }
    if (!read_memory(s.memory)) {
        spdlog::debug("Memory usage unavailable from /proc/meminfo");
    }
    if (!read_disk(s.disk)) {
        spdlog::debug("Disk usage unavailable for /");
    }

    uint64_t rx = 0, tx = 0;
    if (read_network(rx, tx)) {
        auto now = std::chrono::steady_clock::now();
        s.bytes_in = rx;
        s.bytes_out = tx;
        if (has_prev_net_) {
            double elapsed = std::chrono::duration<double>(now - prev_net_time_).count();
            if (elapsed > 0.0) {
                s.bytes_in_per_sec = rx >= prev_rx_ ? (rx - prev_rx_) / elapsed : 0.0;
                s.bytes_out_per_sec = tx >= prev_tx_ ? (tx - prev_tx_) / elapsed : 0.0;
            }
        }
        has_prev_net_ = true;
        prev_rx_ = rx;
        prev_tx_ = tx;
        prev_net_time_ = now;
        s.network = util::clamp_percent(
            (s.bytes_in_per_sec + s.bytes_out_per_sec) * 100.0 / static_cast<double>(link_capacity_));
    } else {
        spdlog::debug("Network counters unavailable from /proc/net/dev");
    }

    s.established_connections = count_established_connections();
    s.uptime_seconds = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_).count();
    return s;
}

bool HostSampler::read_cpu(double& cpu) {
    std::ifstream f("/proc/stat");
    std::string label;
    if (!(f >> label) || label != "cpu") {
        return false;
    }

    uint64_t values[8] = {};
    for (auto& value : values) {
        if (!(f >> value)) {
            return false;
        }
    }

    const uint64_t idle = values[3] + values[4];
    const uint64_t non_idle = values[0] + values[1] + values[2] + values[5] + values[6] + values[7];
    const uint64_t total = idle + non_idle;

    if (!has_prev_cpu_) {
        has_prev_cpu_ = true;
        prev_total_ = total;
        prev_idle_ = idle;
        cpu = 0.0;
        return true;
    }

    const uint64_t total_delta = total >= prev_total_ ? total - prev_total_ : 0;
    const uint64_t idle_delta = idle >= prev_idle_ ? idle - prev_idle_ : 0;
    prev_total_ = total;
    prev_idle_ = idle;

    if (total_delta == 0) {
        cpu = 0.0;
        return true;
    }

    const uint64_t busy = total_delta >= idle_delta ? total_delta - idle_delta : 0;
    cpu = util::clamp_percent(100.0 * static_cast<double>(busy) / static_cast<double>(total_delta));
    return true;
}

bool HostSampler::read_memory(double& memory) {
    std::ifstream f("/proc/meminfo");
    if (!f) {
        return false;
    }

    uint64_t total = 0, available = 0;
    bool have_total = false, have_available = false;
    std::string line;
    while (std::getline(f, line) && !(have_total && have_available)) {
        std::istringstream iss(line);
        std::string key;
        uint64_t value = 0;
        if (!(iss >> key >> value)) {
            continue;
        }
        if (key == "MemTotal:") {
            total = value;
            have_total = true;
        } else if (key == "MemAvailable:") {
            available = value;
            have_available = true;
        }
    }

    if (!have_total || total == 0) {
        return false;
    }
    memory = util::clamp_percent(100.0 * (1.0 - static_cast<double>(available) / static_cast<double>(total)));
    return true;
}

bool HostSampler::read_disk(double& disk) {
    struct statvfs sv {};
    if (statvfs("/", &sv) != 0) {
        return false;
    }

    auto total = static_cast<double>(sv.f_blocks) * sv.f_frsize;
    auto avail = static_cast<double>(sv.f_bavail) * sv.f_frsize;
    if (total <= 0.0) {
        return false;
    }
    disk = util::clamp_percent(100.0 * (1.0 - avail / total));
    return true;
}

bool HostSampler::read_network(uint64_t& rx, uint64_t& tx) {
    std::ifstream f("/proc/net/dev");
    if (!f) {
        return false;
    }

    rx = 0;
    tx = 0;
    std::string line;
    while (std::getline(f, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        if (util::trim(line.substr(0, colon)) == "lo") {
            continue;
        }

        unsigned long long r = 0, t = 0, skip = 0;
        if (std::sscanf(line.c_str() + colon + 1,
                        "%llu %llu %llu %llu %llu %llu %llu %llu %llu",
                        &r, &skip, &skip, &skip, &skip, &skip, &skip, &skip, &t) == 9) {
            rx += r;
            tx += t;
        }
    }
    return true;
}

int HostSampler::count_established_connections() {
    int count = 0;
    for (const char* path : {"/proc/net/tcp", "/proc/net/tcp6"}) {
        std::ifstream f(path);
        std::string line;
        // Header line
        std::getline(f, line);
        while (std::getline(f, line)) {
            std::istringstream iss(line);
            std::string slot, local, remote, state;
            if (iss >> slot >> local >> remote >> state && state == "01") {
                ++count;
            }
        }
    }
    return count;
}
