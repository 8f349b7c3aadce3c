#pragma once

#include "persistence_coordinator.hpp"
#include "types.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Authoritative map of agent id to agent summary.
//
// Single writer of Agent status, rank and threat count. Mutations write
// through to the durable store after the registry lock is released; a failed
// durable write never fails the call.
class AgentRegistry {
public:
    explicit AgentRegistry(PersistenceCoordinator& store);

    // Create (Agent-<id8>, hostname "unknown") or merge the supplied fields
    Agent upsert(const std::string& id, const AgentUpdate& update);

    // Auto-provisioning for agents first seen through metrics or findings
    Agent get_or_create(const std::string& id);

    // Throws NotFoundError
    Agent get(const std::string& id) const;
    bool contains(const std::string& id) const;

    // Registration order
    std::vector<Agent> list() const;
    size_t size() const;

    // Clamped at zero; unknown id is logged and ignored
    void increment_threat_count(const std::string& id, int delta);
    void set_rank(const std::string& id, int rank);

    // Marks agents not seen since cutoff as offline, returns their ids
    std::vector<std::string> mark_stale(TimePoint cutoff);

    // Folds a metric sample into the agent summary. under_lock runs inside
    // the registry critical section so history and summary stay in step.
    Agent apply_metrics(const MetricSample& sample,
                        const std::function<void(const MetricSample&)>& under_lock);

    // Warm start from the durable store; does not write back
    void load(const std::vector<Agent>& agents);
    void clear();

    // Non-copyable
    AgentRegistry(const AgentRegistry&) = delete;
    AgentRegistry& operator=(const AgentRegistry&) = delete;

private:
    Agent& create_locked(const std::string& id, const std::string& hostname);
    void persist(const Agent& agent) const;

    PersistenceCoordinator& store_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Agent> agents_;
    std::vector<std::string> order_;
};
