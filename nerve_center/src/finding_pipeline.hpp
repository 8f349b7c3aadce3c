#pragma once

#include "agent_registry.hpp"
#include "event_publisher.hpp"
#include "finding_store.hpp"
#include "metrics_store.hpp"
#include "persistence_coordinator.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

struct ThreatRequest {
    std::optional<std::string> id;
    std::optional<std::string> name;
    std::optional<std::string> type;
    std::optional<std::string> severity;
    std::optional<std::string> description;
    std::optional<std::string> agent_id;

    // Throws ValidationError on wrong field types
    static ThreatRequest from_json(const nlohmann::json& j);
};

struct EvidenceRequest {
    std::optional<std::string> id;
    std::optional<std::string> agent_id;
    std::optional<std::string> type;
    std::optional<std::string> severity;
    std::optional<std::string> title;
    std::optional<std::string> description;
    nlohmann::json raw_data;
    std::optional<double> confidence;

    static EvidenceRequest from_json(const nlohmann::json& j);
};

struct FindingResult {
    std::string id;
    EventRef event;
    bool saved_to_db = false;
};

// Validates, enriches and records threats and evidence. Records land in
// memory first; the durable copy and the derived event row are written
// afterwards on a best-effort basis.
class FindingPipeline {
public:
    FindingPipeline(AgentRegistry& registry,
                    MetricsStore& metrics,
                    FindingStore& findings,
                    PersistenceCoordinator& store,
                    EventPublisher& publisher);

    // Throws ValidationError when the id is already recorded
    FindingResult create_threat(const ThreatRequest& request);

    // Throws ValidationError listing every missing required field, or for a
    // duplicate id
    FindingResult create_evidence(const EvidenceRequest& request);

private:
    nlohmann::json enrich(const Evidence& evidence, const Agent& agent) const;

    AgentRegistry& registry_;
    MetricsStore& metrics_;
    FindingStore& findings_;
    PersistenceCoordinator& store_;
    EventPublisher& publisher_;
};
