#pragma once

#include "config.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Write-through port to the durable store.
//
// Every save returns the stored id on success and std::nullopt when the store
// is unreachable or rejects the write. Callers log the failure and carry on
// with their in-memory result; health_check() is the only place an outage is
// reported. Reconnection happens lazily on the next call.
class PersistenceCoordinator {
public:
    virtual ~PersistenceCoordinator() = default;

    // Bounded connect retry followed by idempotent schema creation
    virtual bool connect() = 0;
    virtual std::string backend_name() const = 0;

    virtual std::optional<std::string> save_agent(const Agent& agent) = 0;
    virtual std::optional<std::string> save_threat(const Threat& threat) = 0;
    virtual std::optional<std::string> save_evidence(const Evidence& evidence) = 0;
    virtual std::optional<std::string> save_event(const Event& event) = 0;
    virtual std::optional<std::string> save_system_health(const SystemHealthSample& sample) = 0;

    virtual bool update_threat_status(const std::string& threat_id, ThreatStatus status) = 0;
    virtual bool update_evidence_status(const std::string& evidence_id, EvidenceStatus status) = 0;
    virtual bool update_event_status(const EventRef& ref, const std::string& status) = 0;

    // Newest first; std::nullopt when the store cannot be read
    virtual std::optional<std::vector<Event>> get_events(int limit) = 0;
    virtual std::vector<Agent> load_agents() = 0;
    virtual std::vector<Threat> load_threats() = 0;
    virtual std::vector<Evidence> load_evidence() = 0;

    virtual StoreHealth health_check() = 0;
    virtual bool reset() = 0;
};

// Picks the backend from the DATABASE_URL scheme
std::unique_ptr<PersistenceCoordinator> make_persistence_coordinator(const Config& config);
