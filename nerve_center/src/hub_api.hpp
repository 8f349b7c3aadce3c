#pragma once

#include "agent_registry.hpp"
#include "config.hpp"
#include "event_aggregator.hpp"
#include "event_publisher.hpp"
#include "finding_pipeline.hpp"
#include "finding_store.hpp"
#include "health_monitor.hpp"
#include "host_sampler.hpp"
#include "ingress_meter.hpp"
#include "metrics_store.hpp"
#include "persistence_coordinator.hpp"
#include "ranking_cycle.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

struct ApiReply {
    int status = 200;
    nlohmann::json body;
};

// Request handlers for the HTTP boundary, independent of the transport.
// Every handler maps ValidationError to 400, NotFoundError to 404 and any
// other exception to a generic 500.
class HubApi {
public:
    HubApi(const Config& config,
           AgentRegistry& registry,
           MetricsStore& metrics,
           FindingStore& findings,
           FindingPipeline& pipeline,
           EventAggregator& aggregator,
           PersistenceCoordinator& store,
           EventPublisher& publisher,
           HealthMonitor& health_monitor,
           RankingCycle& ranking,
           HostSampler& sampler,
           IngressMeter& meter);

    ApiReply root();
    ApiReply health();

    ApiReply list_agents();
    ApiReply get_agent(const std::string& agent_id);
    ApiReply register_agent(const std::string& body);
    ApiReply post_metrics(const std::string& agent_id, const std::string& body);
    ApiReply get_metrics(const std::string& agent_id, const std::optional<std::string>& limit);

    ApiReply list_threats();
    ApiReply create_threat(const std::string& body);
    ApiReply create_evidence(const std::string& body);

    ApiReply list_events(const std::optional<std::string>& limit, const std::optional<std::string>& source);
    ApiReply get_event(const std::string& event_id);
    ApiReply acknowledge_event(const std::string& event_id);

    ApiReply system_health();
    ApiReply network_metrics();
    ApiReply system_status();

    ApiReply admin_reset();

private:
    template <typename Fn>
    ApiReply guarded(const char* operation, Fn&& fn);

    const Config& config_;
    AgentRegistry& registry_;
    MetricsStore& metrics_;
    FindingStore& findings_;
    FindingPipeline& pipeline_;
    EventAggregator& aggregator_;
    PersistenceCoordinator& store_;
    EventPublisher& publisher_;
    HealthMonitor& health_monitor_;
    RankingCycle& ranking_;
    HostSampler& sampler_;
    IngressMeter& meter_;
};
