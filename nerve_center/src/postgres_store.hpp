#pragma once

#include "persistence_coordinator.hpp"
#include <memory>
#include <string>

// libpqxx backend for postgresql:// and postgres:// URLs
class PostgresStore : public PersistenceCoordinator {
public:
    PostgresStore(std::string dsn, int connect_attempts, int connect_backoff_ms);
    ~PostgresStore() override;

    bool connect() override;
    std::string backend_name() const override;

    std::optional<std::string> save_agent(const Agent& agent) override;
    std::optional<std::string> save_threat(const Threat& threat) override;
    std::optional<std::string> save_evidence(const Evidence& evidence) override;
    std::optional<std::string> save_event(const Event& event) override;
    std::optional<std::string> save_system_health(const SystemHealthSample& sample) override;

    bool update_threat_status(const std::string& threat_id, ThreatStatus status) override;
    bool update_evidence_status(const std::string& evidence_id, EvidenceStatus status) override;
    bool update_event_status(const EventRef& ref, const std::string& status) override;

    std::optional<std::vector<Event>> get_events(int limit) override;
    std::vector<Agent> load_agents() override;
    std::vector<Threat> load_threats() override;
    std::vector<Evidence> load_evidence() override;

    StoreHealth health_check() override;
    bool reset() override;

    // Non-copyable
    PostgresStore(const PostgresStore&) = delete;
    PostgresStore& operator=(const PostgresStore&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};
