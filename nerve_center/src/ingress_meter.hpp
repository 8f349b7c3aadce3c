#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

struct ChannelStats {
    std::string name;
    size_t messages = 0;
    size_t errors = 0;
    std::string status;   // Active, Warning or Idle
};

struct IngressStats {
    double message_rate = 0.0;     // requests per second over the window
    double latency_ms = 0.0;       // mean handler time over the window
    double error_ratio = 0.0;
    uint64_t total_requests = 0;
    std::vector<ChannelStats> channels;
};

// Sliding-window accounting of requests handled at the HTTP boundary
class IngressMeter {
public:
    explicit IngressMeter(std::chrono::seconds window = std::chrono::seconds(60));

    void record(const std::string& channel, std::chrono::microseconds duration, int status_code);
    IngressStats stats();

    // Maps a request path onto a traffic channel name
    static std::string channel_for(const std::string& method, const std::string& path);

private:
    struct Entry {
        std::chrono::steady_clock::time_point at;
        std::string channel;
        std::chrono::microseconds duration;
        bool error;
    };

    void prune_locked(std::chrono::steady_clock::time_point now);

    const std::chrono::seconds window_;
    const std::chrono::steady_clock::time_point started_;
    std::mutex mutex_;
    std::deque<Entry> entries_;
    uint64_t total_requests_ = 0;
};
