#pragma once

#include "agent_registry.hpp"
#include "config.hpp"
#include "event_publisher.hpp"
#include "finding_store.hpp"
#include "host_sampler.hpp"
#include "persistence_coordinator.hpp"
#include "types.hpp"
#include <mutex>
#include <optional>
#include <vector>

// System health cycle. Derives per-component status from the hub host and
// the finding counters, upserts one row per component and marks agents that
// stopped reporting as offline.
class HealthMonitor {
public:
    HealthMonitor(const Config& config,
                  AgentRegistry& registry,
                  FindingStore& findings,
                  PersistenceCoordinator& store,
                  EventPublisher& publisher,
                  HostSampler& sampler);

    // Computed on read, nothing persisted
    std::vector<SystemHealthSample> snapshot();

    // One cycle iteration
    void run_cycle();

    std::optional<TimePoint> last_cycle() const;

    static HealthStatus nerve_center_status(size_t active_threats);
    static HealthStatus mesh_network_status(double network_load);
    static HealthStatus database_status(double disk_usage, bool store_healthy);

private:
    std::vector<SystemHealthSample> build(const HostSample& host, const StoreHealth& store_health,
                                          const FindingCounts& counts) const;

    const Config& config_;
    AgentRegistry& registry_;
    FindingStore& findings_;
    PersistenceCoordinator& store_;
    EventPublisher& publisher_;
    HostSampler& sampler_;

    mutable std::mutex mutex_;
    std::optional<TimePoint> last_cycle_;
};
