#include "agent_registry.hpp"
#include "config.hpp"
#include "event_aggregator.hpp"
#include "event_publisher.hpp"
#include "finding_pipeline.hpp"
#include "finding_store.hpp"
#include "health_monitor.hpp"
#include "host_sampler.hpp"
#include "hub_api.hpp"
#include "ingress_meter.hpp"
#include "metrics_store.hpp"
#include "persistence_coordinator.hpp"
#include "ranking_cycle.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

namespace {

using json = nlohmann::json;

// Full hub wired the way the service wires it, minus the HTTP listener
struct Hub {
    Config config;
    std::unique_ptr<PersistenceCoordinator> store;
    std::unique_ptr<EventPublisher> publisher;
    std::unique_ptr<AgentRegistry> registry;
    std::unique_ptr<MetricsStore> metrics;
    FindingStore findings;
    std::unique_ptr<FindingPipeline> pipeline;
    std::unique_ptr<EventAggregator> aggregator;
    std::unique_ptr<HostSampler> sampler;
    IngressMeter meter;
    std::unique_ptr<HealthMonitor> monitor;
    std::unique_ptr<RankingCycle> ranking;
    std::unique_ptr<HubApi> api;

    explicit Hub(const std::string& database_url) {
        config.database_url = database_url;
        config.db_connect_attempts = 1;
        config.db_connect_backoff_ms = 0;

        store = make_persistence_coordinator(config);
        store->connect();
        publisher = std::make_unique<EventPublisher>(config);
        registry = std::make_unique<AgentRegistry>(*store);
        metrics = std::make_unique<MetricsStore>(*registry, config.metrics_history_limit);
        pipeline = std::make_unique<FindingPipeline>(*registry, *metrics, findings, *store, *publisher);
        aggregator = std::make_unique<EventAggregator>(*registry, findings, *store, *publisher);
        sampler = std::make_unique<HostSampler>(config.network_link_capacity_bps);
        monitor = std::make_unique<HealthMonitor>(config, *registry, findings, *store, *publisher, *sampler);
        ranking = std::make_unique<RankingCycle>(*registry, make_ranking_policy(false));
        api = std::make_unique<HubApi>(config, *registry, *metrics, findings, *pipeline, *aggregator,
                                       *store, *publisher, *monitor, *ranking, *sampler, meter);
    }
};

json FindAgent(HubApi& api, const std::string& id) {
    auto reply = api.list_agents();
    assert(reply.status == 200);
    for (const auto& agent : reply.body) {
        if (agent["id"] == id) {
            return agent;
        }
    }
    return nullptr;
}

const char* kEvidenceBody = R"({
    "agent_id": "a1",
    "type": "malware",
    "severity": "critical",
    "title": "Dropper detected",
    "description": "Known dropper hash in /tmp"
})";

void TestRegisterMetricsThreatAcknowledgeScenario() {
    Hub hub("sqlite://:memory:");
    HubApi& api = *hub.api;

    auto reg = api.register_agent(R"({"id":"a1","hostname":"h1"})");
    assert(reg.status == 200);
    assert(reg.body["success"] == true);
    assert(reg.body["agent_id"] == "a1");

    auto posted = api.post_metrics("a1", R"({"cpu":95,"memory":50,"disk":10,"network":5,"processes":80})");
    assert(posted.status == 200);
    assert(posted.body["success"] == true);

    auto agent = FindAgent(api, "a1");
    assert(agent["cpu"] == 95.0);
    assert(agent["hostname"] == "h1");
    assert(agent["threats"] == 0);

    auto threat = api.create_threat(R"({"agent_id":"a1","type":"cpu_anomaly","severity":"high"})");
    assert(threat.status == 200);
    assert(threat.body["success"] == true);
    assert(threat.body["saved_to_db"] == true);
    std::string event_id = threat.body["event_id"].get<std::string>();
    assert(event_id == "threat-" + threat.body["threat_id"].get<std::string>());
    assert(FindAgent(api, "a1")["threats"] == 1);

    auto ack = api.acknowledge_event(event_id);
    assert(ack.status == 200);
    assert(ack.body["success"] == true);
    assert(ack.body["data"]["status"] == "acknowledged");
    assert(ack.body["data"]["event_id"] == event_id);
    assert(FindAgent(api, "a1")["threats"] == 0);

    auto again = api.acknowledge_event(event_id);
    assert(again.status == 200);
    assert(again.body["success"] == true);
    assert(again.body["data"]["status"] == "acknowledged");
    assert(FindAgent(api, "a1")["threats"] == 0);
}

void TestMetricsAutoProvisionAndHistory() {
    Hub hub("sqlite://:memory:");
    HubApi& api = *hub.api;

    for (int i = 0; i < 150; ++i) {
        auto reply = api.post_metrics("fresh", json{{"cpu", i % 100}, {"memory", 10}}.dump());
        assert(reply.status == 200);
    }

    auto agents = api.list_agents();
    assert(agents.body.size() == 1);
    assert(agents.body[0]["id"] == "fresh");
    assert(agents.body[0]["threats"] == 0);

    auto history = api.get_metrics("fresh", std::string("200"));
    assert(history.status == 200);
    assert(history.body.size() == 100);
    assert(history.body[0]["cpu"] == 50.0);

    auto defaulted = api.get_metrics("fresh", std::nullopt);
    assert(defaulted.body.size() == 50);

    assert(api.get_metrics("ghost", std::nullopt).status == 404);
    assert(api.get_metrics("fresh", std::string("-3")).status == 400);
    assert(api.get_metrics("fresh", std::string("ten")).status == 400);
}

void TestMalformedInputIsRejected() {
    Hub hub("sqlite://:memory:");
    HubApi& api = *hub.api;

    auto bad_json = api.post_metrics("a1", "{not json");
    assert(bad_json.status == 400);
    assert(bad_json.body["success"] == false);

    auto bad_type = api.post_metrics("a1", R"({"cpu":"high"})");
    assert(bad_type.status == 400);

    auto bad_register = api.register_agent(R"([1,2,3])");
    assert(bad_register.status == 400);

    assert(api.list_agents().body.empty());
}

void TestEvidenceMissingTitleCreatesNothing() {
    Hub hub("sqlite://:memory:");
    HubApi& api = *hub.api;

    auto reply = api.create_evidence(R"({"agent_id":"a1","type":"malware","severity":"low","description":"d"})");
    assert(reply.status == 400);
    assert(reply.body["success"] == false);
    assert(reply.body["missing_fields"].size() == 1);
    assert(reply.body["missing_fields"][0] == "title");

    auto events = api.list_events(std::nullopt, std::nullopt);
    assert(events.status == 200);
    assert(events.body.empty());
}

void TestEventsFeedAndDetail() {
    Hub hub("sqlite://:memory:");
    HubApi& api = *hub.api;

    auto evidence = api.create_evidence(kEvidenceBody);
    assert(evidence.status == 200);
    assert(evidence.body["saved_to_db"] == true);
    auto threat = api.create_threat(R"({"name":"Beacon","severity":"critical"})");
    assert(threat.status == 200);

    auto events = api.list_events(std::nullopt, std::nullopt);
    assert(events.body.size() == 2);
    assert(events.body[0]["id"] == threat.body["event_id"]);
    assert(events.body[1]["id"] == evidence.body["event_id"]);
    assert(events.body[0]["timestamp"].get<std::string>() >= events.body[1]["timestamp"].get<std::string>());

    auto limited = api.list_events(std::string("1"), std::nullopt);
    assert(limited.body.size() == 1);

    auto persisted = api.list_events(std::nullopt, std::string("database"));
    assert(persisted.status == 200);
    assert(persisted.body.size() == 2);

    assert(api.list_events(std::nullopt, std::string("cache")).status == 400);

    auto detail = api.get_event(evidence.body["event_id"].get<std::string>());
    assert(detail.status == 200);
    assert(detail.body["title"] == "Dropper detected");
    assert(detail.body["details"]["system_info"]["hostname"] == "agent-a1");
    assert(detail.body.contains("investigation_notes"));

    assert(api.get_event("threat-missing").status == 404);
    assert(api.get_event("bogus").status == 404);
    assert(api.acknowledge_event("evidence-missing").status == 404);

    auto threats = api.list_threats();
    assert(threats.body.size() == 1);
    assert(threats.body[0]["name"] == "Beacon");
}

void TestDegradedModeStaysAvailable() {
    Hub hub("sqlite:///nonexistent-dir/nerve/hub.db");
    HubApi& api = *hub.api;

    auto evidence = api.create_evidence(kEvidenceBody);
    assert(evidence.status == 200);
    assert(evidence.body["success"] == true);
    assert(evidence.body["saved_to_db"] == false);

    auto reg = api.register_agent(R"({"id":"a2"})");
    assert(reg.status == 200);

    auto health = api.health();
    assert(health.status == 200);
    assert(health.body["database"]["status"] != "healthy");
    assert(health.body["status"] == "degraded");
    assert(health.body["agents_connected"] == 2);

    // Falls back to the in-memory feed
    auto events = api.list_events(std::nullopt, std::string("database"));
    assert(events.status == 200);
    assert(events.body.size() == 1);
}

void TestHealthAndSnapshots() {
    Hub hub("sqlite://:memory:");
    HubApi& api = *hub.api;
    api.register_agent(R"({"id":"a1"})");
    api.create_threat(R"({"agent_id":"a1","severity":"critical"})");

    auto health = api.health();
    assert(health.body["status"] == "healthy");
    assert(health.body["database"]["status"] == "healthy");
    assert(health.body["threats_active"] == 1);
    assert(health.body["event_bus"]["status"] == "disabled");

    auto components = api.system_health();
    assert(components.status == 200);
    assert(components.body.size() == 3);
    assert(components.body[2]["component"] == "database");

    hub.meter.record("Metrics Ingest", std::chrono::microseconds(1500), 200);
    auto network = api.network_metrics();
    assert(network.status == 200);
    assert(network.body["protocols"].size() == 5);
    assert(network.body.contains("activeConnections"));
    assert(network.body.contains("bytesIn"));
    assert(network.body["latency"] == 1.5);

    auto status = api.system_status();
    assert(status.status == 200);
    assert(status.body["agents"]["total"] == 1);
    assert(status.body["threats"]["critical_active"] == 1);
    assert(status.body["ranking"]["policy"] == "noop");
    assert(status.body["ranking"]["participating_agents"] == 1);
    assert(status.body["nerve_center"]["last_health_cycle"].is_null());

    auto root = api.root();
    assert(root.body["status"] == "operational");

    assert(api.get_agent("a1").body["id"] == "a1");
    assert(api.get_agent("zz").status == 404);
}

void TestAdminResetClearsState() {
    Hub hub("sqlite://:memory:");
    HubApi& api = *hub.api;
    api.register_agent(R"({"id":"a1"})");
    api.create_evidence(kEvidenceBody);

    auto reset = api.admin_reset();
    assert(reset.status == 200);
    assert(reset.body["database_cleared"] == true);
    assert(api.list_agents().body.empty());
    assert(api.list_events(std::nullopt, std::nullopt).body.empty());
    assert(api.list_events(std::nullopt, std::string("database")).body.empty());
    assert(hub.store->load_agents().empty());
}

void TestProcessCountMustFitAnInt() {
    Hub hub("sqlite://:memory:");
    HubApi& api = *hub.api;

    assert(api.post_metrics("a1", R"({"cpu":10,"processes":1e20})").status == 400);
    assert(api.post_metrics("a1", R"({"cpu":10,"processes":-1})").status == 400);
    assert(api.post_metrics("a1", R"({"cpu":10,"processes":"many"})").status == 400);
    assert(api.list_agents().body.empty());

    auto posted = api.post_metrics("a1", R"({"cpu":10,"processes":80})");
    assert(posted.status == 200);
    auto history = api.get_metrics("a1", std::nullopt);
    assert(history.body.size() == 1);
    assert(history.body[0]["processes"] == 80);
}

void TestOversizedEventLimitReturnsEverything() {
    Hub hub("sqlite://:memory:");
    HubApi& api = *hub.api;
    api.create_evidence(kEvidenceBody);
    api.create_threat(R"({"agent_id":"a1"})");

    auto persisted = api.list_events(std::string("99999999999"), std::string("database"));
    assert(persisted.status == 200);
    assert(persisted.body.size() == 2);

    auto cached = api.list_events(std::string("99999999999"), std::nullopt);
    assert(cached.status == 200);
    assert(cached.body.size() == 2);
}

void TestDuplicateThreatIdIsBadRequest() {
    Hub hub("sqlite://:memory:");
    HubApi& api = *hub.api;

    assert(api.create_threat(R"({"id":"t1","agent_id":"a1"})").status == 200);
    auto again = api.create_threat(R"({"id":"t1","agent_id":"a1"})");
    assert(again.status == 400);
    assert(again.body["success"] == false);
    assert(FindAgent(api, "a1")["threats"] == 1);
    assert(api.list_threats().body.size() == 1);
}

} // namespace

int main() {
    TestRegisterMetricsThreatAcknowledgeScenario();
    TestMetricsAutoProvisionAndHistory();
    TestMalformedInputIsRejected();
    TestEvidenceMissingTitleCreatesNothing();
    TestEventsFeedAndDetail();
    TestDegradedModeStaysAvailable();
    TestHealthAndSnapshots();
    TestAdminResetClearsState();
    TestProcessCountMustFitAnInt();
    TestOversizedEventLimitReturnsEverything();
    TestDuplicateThreatIdIsBadRequest();

    std::cout << "nerve_center_integration_hub_api: pass\n";
    return 0;
}
