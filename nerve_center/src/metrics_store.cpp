#include "metrics_store.hpp"
#include "errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

MetricsStore::MetricsStore(AgentRegistry& registry, size_t capacity)
    : registry_(registry), capacity_(std::max<size_t>(1, capacity)) {}

Agent MetricsStore::append(const MetricSample& sample) {
    // Registry lock is held while push_locked runs
    return registry_.apply_metrics(sample, [this](const MetricSample& s) {
        push_locked(s);
    });
}

std::vector<MetricSample> MetricsStore::recent(const std::string& agent_id, size_t limit) const {
    if (!registry_.contains(agent_id)) {
        throw NotFoundError("Agent not found: " + agent_id);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = history_.find(agent_id);
    if (it == history_.end()) {
        return {};
    }

    const auto& ring = it->second;
    size_t count = std::min(limit, ring.size());
    return std::vector<MetricSample>(ring.end() - static_cast<std::ptrdiff_t>(count), ring.end());
}

std::optional<MetricSample> MetricsStore::latest(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = history_.find(agent_id);
    if (it == history_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.back();
}

void MetricsStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
}

void MetricsStore::push_locked(const MetricSample& sample) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& ring = history_[sample.agent_id];
    ring.push_back(sample);
    while (ring.size() > capacity_) {
        ring.pop_front();
    }
    spdlog::debug("Stored metrics for {} ({} samples)", sample.agent_id, ring.size());
}
