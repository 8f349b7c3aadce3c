#include "ingress_meter.hpp"
#include "util.hpp"
#include <algorithm>
#include <map>

namespace {

const char* const kChannels[] = {
    "Agent Registration",
    "Metrics Ingest",
    "Finding Ingest",
    "Event Feed",
    "Operator Queries",
};

constexpr double kWarningErrorRatio = 0.1;

} // namespace

IngressMeter::IngressMeter(std::chrono::seconds window)
    : window_(window), started_(std::chrono::steady_clock::now()) {}

void IngressMeter::record(const std::string& channel, std::chrono::microseconds duration, int status_code) {
    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(Entry{now, channel, duration, status_code >= 500});
    ++total_requests_;
    prune_locked(now);
}

IngressStats IngressMeter::stats() {
    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    prune_locked(now);

    IngressStats stats;
    stats.total_requests = total_requests_;

    std::map<std::string, ChannelStats> by_channel;
    for (const char* name : kChannels) {
        by_channel[name].name = name;
    }

    double total_us = 0.0;
    size_t errors = 0;
    for (const auto& entry : entries_) {
        total_us += static_cast<double>(entry.duration.count());
        auto& channel = by_channel[entry.channel];
        channel.name = entry.channel;
        ++channel.messages;
        if (entry.error) {
            ++channel.errors;
            ++errors;
        }
    }

    // Rate over the part of the window the process has been up for
    double elapsed = std::chrono::duration<double>(now - started_).count();
    double span = std::max(1.0, std::min(elapsed, static_cast<double>(window_.count())));
    stats.message_rate = static_cast<double>(entries_.size()) / span;

    if (!entries_.empty()) {
        stats.latency_ms = total_us / static_cast<double>(entries_.size()) / 1000.0;
        stats.error_ratio = static_cast<double>(errors) / static_cast<double>(entries_.size());
    }

    for (auto& [name, channel] : by_channel) {
        if (channel.messages == 0) {
            channel.status = "Idle";
        } else if (static_cast<double>(channel.errors) / channel.messages > kWarningErrorRatio) {
            channel.status = "Warning";
        } else {
            channel.status = "Active";
        }
        stats.channels.push_back(channel);
    }
    return stats;
}

std::string IngressMeter::channel_for(const std::string& method, const std::string& path) {
    if (util::starts_with(path, "/agents/register")) {
        return "Agent Registration";
    }
    if (util::starts_with(path, "/agents/") && method == "POST") {
        return "Metrics Ingest";
    }
    if (method == "POST" && (util::starts_with(path, "/threats") || util::starts_with(path, "/evidence"))) {
        return "Finding Ingest";
    }
    if (util::starts_with(path, "/events")) {
        return "Event Feed";
    }
    return "Operator Queries";
}

void IngressMeter::prune_locked(std::chrono::steady_clock::time_point now) {
    auto cutoff = now - window_;
    while (!entries_.empty() && entries_.front().at < cutoff) {
        entries_.pop_front();
    }
}
