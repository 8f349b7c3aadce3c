#pragma once

#include "agent_registry.hpp"
#include "types.hpp"
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Bounded per-agent metric history
class MetricsStore {
public:
    MetricsStore(AgentRegistry& registry, size_t capacity);

    // Appends to the agent's ring and refreshes the agent summary;
    // unknown agents are auto-provisioned
    Agent append(const MetricSample& sample);

    // Most recent `limit` samples in arrival order. Throws NotFoundError.
    std::vector<MetricSample> recent(const std::string& agent_id, size_t limit) const;
    std::optional<MetricSample> latest(const std::string& agent_id) const;

    size_t capacity() const { return capacity_; }
    void clear();

private:
    void push_locked(const MetricSample& sample);

    AgentRegistry& registry_;
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::deque<MetricSample>> history_;
};
