#include "config.hpp"
#include "hub_api.hpp"
#include "nerve_center_service.hpp"
#include "persistence_coordinator.hpp"

#include <unistd.h>

#include <cassert>
#include <cstdio>
#include <iostream>
#include <string>

namespace {

using json = nlohmann::json;

std::string DatabasePath() {
    return "/tmp/nerve_center_restore_" + std::to_string(::getpid()) + ".db";
}

Config MakeConfig(bool clean_on_startup) {
    Config config;
    config.database_url = "file:" + DatabasePath();
    config.db_connect_attempts = 1;
    config.db_connect_backoff_ms = 0;
    config.clean_database_on_startup = clean_on_startup;
    return config;
}

json FindById(const json& list, const std::string& id) {
    for (const auto& item : list) {
        if (item["id"] == id) {
            return item;
        }
    }
    return nullptr;
}

void SeedHub() {
    NerveCenterService service(MakeConfig(false));
    assert(service.initialize());
    HubApi& api = service.api();

    assert(api.register_agent(R"({"id":"a1","hostname":"edge-1"})").status == 200);
    assert(api.register_agent(R"({"id":"a2","hostname":"edge-2"})").status == 200);
    assert(api.create_threat(R"({"id":"t1","agent_id":"a1","severity":"high"})").status == 200);
    assert(api.create_threat(R"({"id":"t2","agent_id":"a1","severity":"low"})").status == 200);
    assert(api.create_evidence(R"({
        "id": "e1",
        "agent_id": "a2",
        "type": "malware",
        "severity": "critical",
        "title": "Dropper detected",
        "description": "Known dropper hash in /tmp"
    })").status == 200);

    assert(api.acknowledge_event("threat-t1").status == 200);
    assert(FindById(api.list_agents().body, "a1")["threats"] == 1);
}

void TestWarmStartRestoresState() {
    SeedHub();

    NerveCenterService service(MakeConfig(false));
    assert(service.initialize());
    HubApi& api = service.api();

    auto agents = api.list_agents().body;
    assert(agents.size() == 2);
    assert(agents[0]["id"] == "a1");
    assert(agents[1]["id"] == "a2");
    assert(agents[0]["hostname"] == "edge-1");
    assert(agents[0]["threats"] == 1);
    assert(agents[1]["threats"] == 0);

    auto threats = api.list_threats().body;
    assert(threats.size() == 2);
    assert(FindById(threats, "t1")["status"] == "acknowledged");
    assert(FindById(threats, "t2")["status"] == "active");

    auto events = api.list_events(std::nullopt, std::nullopt);
    assert(events.status == 200);
    assert(events.body.size() == 3);

    auto evidence = api.get_event("evidence-e1");
    assert(evidence.status == 200);
    assert(evidence.body["title"] == "Dropper detected");

    // Acknowledging a restored threat does not move the counter again
    auto again = api.acknowledge_event("threat-t1");
    assert(again.status == 200);
    assert(FindById(api.list_agents().body, "a1")["threats"] == 1);

    assert(api.acknowledge_event("threat-t2").status == 200);
    assert(FindById(api.list_agents().body, "a1")["threats"] == 0);
}

void TestCleanStartEmptiesDurableStore() {
    SeedHub();

    {
        NerveCenterService service(MakeConfig(true));
        assert(service.initialize());
        HubApi& api = service.api();

        assert(api.list_agents().body.empty());
        assert(api.list_threats().body.empty());
        assert(api.list_events(std::nullopt, std::nullopt).body.empty());
        assert(api.list_events(std::nullopt, std::string("database")).body.empty());

        assert(service.store().load_agents().empty());
        assert(service.store().load_threats().empty());
        assert(service.store().load_evidence().empty());
    }

    // Nothing comes back on the next warm start either
    NerveCenterService service(MakeConfig(false));
    assert(service.initialize());
    assert(service.api().list_agents().body.empty());
    assert(service.api().list_threats().body.empty());
}

void TestUnreachableStoreStartsEmpty() {
    Config config;
    config.database_url = "sqlite:///nonexistent-dir/nerve/hub.db";
    config.db_connect_attempts = 1;
    config.db_connect_backoff_ms = 0;

    NerveCenterService service(config);
    assert(!service.initialize());
    assert(service.api().list_agents().body.empty());
    assert(service.api().register_agent(R"({"id":"a1"})").status == 200);
}

} // namespace

int main() {
    std::remove(DatabasePath().c_str());

    TestWarmStartRestoresState();
    std::remove(DatabasePath().c_str());
    TestCleanStartEmptiesDurableStore();
    std::remove(DatabasePath().c_str());
    TestUnreachableStoreStartsEmpty();

    std::cout << "nerve_center_integration_service_restore: pass\n";
    return 0;
}
