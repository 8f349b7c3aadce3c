#pragma once

#include "agent_registry.hpp"
#include "config.hpp"
#include "event_aggregator.hpp"
#include "event_publisher.hpp"
#include "finding_pipeline.hpp"
#include "finding_store.hpp"
#include "health_monitor.hpp"
#include "host_sampler.hpp"
#include "http_server.hpp"
#include "hub_api.hpp"
#include "ingress_meter.hpp"
#include "metrics_store.hpp"
#include "periodic_task.hpp"
#include "persistence_coordinator.hpp"
#include "ranking_cycle.hpp"
#include <atomic>
#include <memory>

class NerveCenterService {
public:
    explicit NerveCenterService(const Config& config);
    ~NerveCenterService();

    // Connects the durable store, then wipes it when a clean start is
    // configured or restores agents and findings from it. Returns false when
    // the store is unreachable; the hub then serves from memory only.
    bool initialize();

    // initialize(), then starts the background cycles and the HTTP server
    void run();

    // Stops the cycles first so no iteration runs against a closed server
    void stop();

    HubApi& api() { return *api_; }
    PersistenceCoordinator& store() { return *store_; }

private:
    void restore_state();

    // Configuration
    Config config_;

    // Service components
    std::unique_ptr<PersistenceCoordinator> store_;
    std::unique_ptr<EventPublisher> publisher_;
    std::unique_ptr<AgentRegistry> registry_;
    std::unique_ptr<MetricsStore> metrics_;
    std::unique_ptr<FindingStore> findings_;
    std::unique_ptr<FindingPipeline> pipeline_;
    std::unique_ptr<EventAggregator> aggregator_;
    std::unique_ptr<HostSampler> sampler_;
    std::unique_ptr<IngressMeter> meter_;
    std::unique_ptr<HealthMonitor> health_monitor_;
    std::unique_ptr<RankingCycle> ranking_;
    std::unique_ptr<HubApi> api_;
    std::unique_ptr<HttpServer> http_server_;

    // Background cycles
    std::unique_ptr<PeriodicTask> health_task_;
    std::unique_ptr<PeriodicTask> ranking_task_;

    std::atomic<bool> running_{false};
};
