#include "config.hpp"
#include "persistence_coordinator.hpp"
#include "sqlite_store.hpp"
#include "util.hpp"

#include <cassert>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

Agent MakeAgent(const std::string& id) {
    Agent agent;
    agent.id = id;
    agent.name = "Agent-" + id;
    agent.hostname = "host-" + id;
    agent.ip_address = "192.168.0.10";
    agent.os_type = "linux";
    agent.rank = 2;
    agent.cpu = 12.5;
    agent.memory = 48.0;
    agent.threat_count = 3;
    agent.last_seen = util::parse_iso8601("2024-06-01T12:00:00.250Z");
    return agent;
}

Threat MakeThreat(const std::string& id, const std::string& agent_id, const std::string& at) {
    Threat threat;
    threat.id = id;
    threat.name = "Brute force";
    threat.type = "auth_failure";
    threat.severity = Severity::High;
    threat.description = "Repeated login failures";
    threat.agent_id = agent_id;
    threat.agent_info = AgentInfo{"host-" + agent_id, "linux", "192.168.0.10"};
    threat.detected_at = util::parse_iso8601(at);
    return threat;
}

Evidence MakeEvidence(const std::string& id, const std::string& agent_id, const std::string& at) {
    Evidence evidence;
    evidence.id = id;
    evidence.agent_id = agent_id;
    evidence.type = "file_integrity";
    evidence.severity = Severity::Critical;
    evidence.title = "Modified binary";
    evidence.description = "/usr/bin/ssh hash changed";
    evidence.raw_data = {{"attack_type", "tampering"}, {"hashes", {{"before", "aa"}, {"after", "bb"}}}};
    evidence.confidence = 0.9;
    evidence.timestamp = util::parse_iso8601(at);
    return evidence;
}

void TestAgentRoundTrip() {
    SqliteStore store(":memory:", 1, 0);
    assert(store.connect());
    assert(store.backend_name() == "sqlite");

    Agent agent = MakeAgent("a1");
    assert(store.save_agent(agent) == std::optional<std::string>("a1"));

    agent.cpu = 99.0;
    agent.status = AgentStatus::Warning;
    assert(store.save_agent(agent));

    auto agents = store.load_agents();
    assert(agents.size() == 1);
    assert(agents[0].hostname == "host-a1");
    assert(agents[0].cpu == 99.0);
    assert(agents[0].status == AgentStatus::Warning);
    assert(agents[0].rank == 2);
    assert(agents[0].threat_count == 3);
    assert(agents[0].last_seen == agent.last_seen);
}

void TestThreatRequiresKnownAgent() {
    SqliteStore store(":memory:", 1, 0);
    assert(store.connect());

    // Foreign key on agent_id
    assert(!store.save_threat(MakeThreat("t1", "ghost", "2024-06-01T12:00:00.000Z")));

    assert(store.save_agent(MakeAgent("a1")));
    assert(store.save_threat(MakeThreat("t1", "a1", "2024-06-01T12:00:00.000Z")));

    Threat orphan = MakeThreat("t2", "a1", "2024-06-01T12:00:01.000Z");
    orphan.agent_id.reset();
    orphan.agent_info.reset();
    assert(store.save_threat(orphan));

    auto threats = store.load_threats();
    assert(threats.size() == 2);
    assert(threats[0].agent_info && threats[0].agent_info->hostname == "host-a1");
    assert(!threats[1].agent_id);

    assert(store.update_threat_status("t1", ThreatStatus::Acknowledged));
    assert(store.load_threats()[0].status == ThreatStatus::Acknowledged);
}

void TestEvidenceKeepsRawDocument() {
    SqliteStore store(":memory:", 1, 0);
    assert(store.connect());
    assert(store.save_agent(MakeAgent("a1")));
    assert(store.save_evidence(MakeEvidence("e1", "a1", "2024-06-01T12:00:00.000Z")));

    auto evidence = store.load_evidence();
    assert(evidence.size() == 1);
    assert(evidence[0].raw_data["hashes"]["after"] == "bb");
    assert(evidence[0].confidence == 0.9);
    assert(evidence[0].severity == Severity::Critical);
    assert(evidence[0].status == EvidenceStatus::Open);

    assert(store.update_evidence_status("e1", EvidenceStatus::Acknowledged));
    assert(store.load_evidence()[0].status == EvidenceStatus::Acknowledged);
}

void TestEventsNewestFirst() {
    SqliteStore store(":memory:", 1, 0);
    assert(store.connect());
    assert(store.save_agent(MakeAgent("a1")));

    auto older = Event::from_threat(MakeThreat("t1", "a1", "2024-06-01T12:00:00.000Z"), 0);
    auto newer = Event::from_evidence(MakeEvidence("e1", "a1", "2024-06-01T12:05:00.000Z"), 1);
    assert(store.save_event(older) == std::optional<std::string>("event-threat-t1"));
    assert(store.save_event(newer) == std::optional<std::string>("event-evidence-e1"));

    auto events = store.get_events(10);
    assert(events && events->size() == 2);
    assert((*events)[0].ref == newer.ref);
    assert((*events)[1].ref == older.ref);
    assert((*events)[0].details["attack_type"] == "tampering");

    assert(store.update_event_status(older.ref, "acknowledged"));
    events = store.get_events(1);
    assert(events && events->size() == 1);
    assert((*events)[0].ref == newer.ref);

    events = store.get_events(10);
    assert((*events)[1].status == "acknowledged");
}

void TestSystemHealthUpsert() {
    SqliteStore store(":memory:", 1, 0);
    assert(store.connect());

    SystemHealthSample sample;
    sample.component = "database";
    sample.status = HealthStatus::Warning;
    sample.disk = 88.0;
    sample.last_check = std::chrono::system_clock::now();
    sample.error_message = "Disk usage high";
    assert(store.save_system_health(sample) == std::optional<std::string>("database"));

    sample.status = HealthStatus::Healthy;
    sample.error_message.reset();
    assert(store.save_system_health(sample));
}

void TestResetClearsEverything() {
    SqliteStore store(":memory:", 1, 0);
    assert(store.connect());
    assert(store.save_agent(MakeAgent("a1")));
    assert(store.save_threat(MakeThreat("t1", "a1", "2024-06-01T12:00:00.000Z")));
    assert(store.save_evidence(MakeEvidence("e1", "a1", "2024-06-01T12:00:00.000Z")));

    assert(store.reset());
    assert(store.load_agents().empty());
    assert(store.load_threats().empty());
    assert(store.load_evidence().empty());
    assert(store.get_events(10)->empty());
}

void TestUnreachableStoreDegrades() {
    SqliteStore store("/nonexistent-dir/nerve/hub.db", 2, 0);
    assert(!store.connect());

    assert(!store.save_agent(MakeAgent("a1")));
    assert(!store.get_events(10));
    assert(store.load_agents().empty());
    assert(!store.reset());

    auto health = store.health_check();
    assert(!health.healthy);
    assert(health.to_json()["status"] == "unhealthy");
}

void TestFileDatabaseSurvivesReopen() {
    std::string path = "nerve_center_store_test_" + util::generate_uuid() + ".db";
    {
        SqliteStore store(path, 1, 0);
        assert(store.connect());
        assert(store.save_agent(MakeAgent("persisted")));
    }
    {
        SqliteStore store(path, 1, 0);
        assert(store.connect());
        auto agents = store.load_agents();
        assert(agents.size() == 1);
        assert(agents[0].id == "persisted");
    }
    std::remove(path.c_str());
}

void TestFactorySelectsBackend() {
    Config config;
    config.database_url = "sqlite://:memory:";
    auto store = make_persistence_coordinator(config);
    assert(store->backend_name() == "sqlite");
    assert(store->connect());

    config.database_url = "postgresql://user:pw@localhost:5432/db";
    assert(make_persistence_coordinator(config)->backend_name() == "postgresql");

    config.database_url = "mysql://localhost/db";
    bool threw = false;
    try {
        make_persistence_coordinator(config);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    config.database_url = "sqlite://";
    threw = false;
    try {
        make_persistence_coordinator(config);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
}

} // namespace

int main() {
    TestAgentRoundTrip();
    TestThreatRequiresKnownAgent();
    TestEvidenceKeepsRawDocument();
    TestEventsNewestFirst();
    TestSystemHealthUpsert();
    TestResetClearsEverything();
    TestUnreachableStoreDegrades();
    TestFileDatabaseSurvivesReopen();
    TestFactorySelectsBackend();

    std::cout << "nerve_center_unit_sqlite_store: pass\n";
    return 0;
}
