#include "finding_pipeline.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {

std::optional<std::string> optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw ValidationError(std::string("Field '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

bool is_blank(const std::optional<std::string>& value) {
    return !value || util::trim(*value).empty();
}

// Accepts an object, a JSON-encoded string or any other value
json normalize_raw_data(const json& raw) {
    if (raw.is_null()) {
        return json::object();
    }
    if (raw.is_object()) {
        return raw;
    }
    if (raw.is_string()) {
        const std::string& text = raw.get_ref<const std::string&>();
        json parsed = json::parse(text, nullptr, false);
        if (!parsed.is_discarded() && parsed.is_object()) {
            return parsed;
        }
        return json{{"raw", text}};
    }
    return json{{"raw", raw}};
}

} // namespace

ThreatRequest ThreatRequest::from_json(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("Request body must be a JSON object");
    }

    ThreatRequest request;
    request.id = optional_string(j, "id");
    request.name = optional_string(j, "name");
    request.type = optional_string(j, "type");
    request.severity = optional_string(j, "severity");
    request.description = optional_string(j, "description");
    request.agent_id = optional_string(j, "agent_id");
    return request;
}

EvidenceRequest EvidenceRequest::from_json(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("Request body must be a JSON object");
    }

    EvidenceRequest request;
    request.id = optional_string(j, "id");
    request.agent_id = optional_string(j, "agent_id");
    request.type = optional_string(j, "type");
    request.severity = optional_string(j, "severity");
    request.title = optional_string(j, "title");
    request.description = optional_string(j, "description");
    request.raw_data = j.value("raw_data", json());

    auto it = j.find("confidence");
    if (it != j.end() && !it->is_null()) {
        if (!it->is_number()) {
            throw ValidationError("Field 'confidence' must be a number");
        }
        request.confidence = it->get<double>();
    }
    return request;
}

FindingPipeline::FindingPipeline(AgentRegistry& registry,
                                 MetricsStore& metrics,
                                 FindingStore& findings,
                                 PersistenceCoordinator& store,
                                 EventPublisher& publisher)
    : registry_(registry),
      metrics_(metrics),
      findings_(findings),
      store_(store),
      publisher_(publisher) {}

FindingResult FindingPipeline::create_threat(const ThreatRequest& request) {
    Threat threat;
    threat.id = is_blank(request.id) ? util::generate_uuid() : *request.id;
    threat.name = is_blank(request.name) ? "Unknown Threat" : *request.name;
    threat.type = is_blank(request.type) ? "unknown" : *request.type;
    threat.description = request.description.value_or("");
    threat.status = ThreatStatus::Active;
    threat.detected_at = std::chrono::system_clock::now();

    if (!is_blank(request.severity)) {
        auto severity = parse_severity(*request.severity);
        if (severity) {
            threat.severity = *severity;
        } else {
            spdlog::warn("Unrecognized threat severity '{}', using medium", *request.severity);
            threat.severity = Severity::Medium;
        }
    }

    if (findings_.threat(threat.id)) {
        throw ValidationError("Threat already exists: " + threat.id);
    }

    if (!is_blank(request.agent_id)) {
        // Provisioning persists the agent before the threat row references it
        Agent agent = registry_.get_or_create(*request.agent_id);
        threat.agent_id = agent.id;
        threat.agent_info = agent.snapshot();
    }

    if (!findings_.add_threat(threat)) {
        throw ValidationError("Threat already exists: " + threat.id);
    }
    if (threat.agent_id) {
        registry_.increment_threat_count(*threat.agent_id, 1);
    }

    FindingResult result;
    result.id = threat.id;
    result.event = EventRef{EventKind::Threat, threat.id};

    bool threat_saved = store_.save_threat(threat).has_value();
    bool event_saved = false;
    if (auto event = findings_.event(result.event)) {
        event_saved = store_.save_event(*event).has_value();
    }
    result.saved_to_db = threat_saved && event_saved;
    if (!result.saved_to_db) {
        spdlog::warn("Threat {} kept in memory only, durable write failed", threat.id);
    }

    spdlog::info("New threat detected: {} ({}, severity {}, agent {})", threat.name, threat.type,
                 to_string(threat.severity), threat.agent_id.value_or("none"));

    publisher_.publish("threat_detected", threat.to_json());
    return result;
}

FindingResult FindingPipeline::create_evidence(const EvidenceRequest& request) {
    std::vector<std::string> missing;
    if (is_blank(request.agent_id)) missing.push_back("agent_id");
    if (is_blank(request.type)) missing.push_back("type");
    if (is_blank(request.severity)) missing.push_back("severity");
    if (is_blank(request.title)) missing.push_back("title");
    if (is_blank(request.description)) missing.push_back("description");

    if (!missing.empty()) {
        std::string joined;
        for (const auto& field : missing) {
            if (!joined.empty()) joined += ", ";
            joined += field;
        }
        throw ValidationError("Missing required fields: " + joined, missing);
    }

    auto severity = parse_severity(*request.severity);
    if (!severity) {
        throw ValidationError("Invalid severity: " + *request.severity);
    }

    Evidence evidence;
    evidence.id = is_blank(request.id) ? util::generate_uuid() : *request.id;
    evidence.agent_id = *request.agent_id;
    evidence.type = *request.type;
    evidence.severity = *severity;
    evidence.title = *request.title;
    evidence.description = *request.description;
    evidence.status = EvidenceStatus::Open;
    evidence.confidence = std::max(0.0, std::min(1.0, request.confidence.value_or(0.8)));
    evidence.timestamp = std::chrono::system_clock::now();

    if (findings_.evidence(evidence.id)) {
        throw ValidationError("Evidence already exists: " + evidence.id);
    }

    Agent agent = registry_.get_or_create(evidence.agent_id);
    evidence.raw_data = enrich(evidence, agent);
    // Client-supplied keys win over enrichment
    for (const auto& item : normalize_raw_data(request.raw_data).items()) {
        evidence.raw_data[item.key()] = item.value();
    }

    if (!findings_.add_evidence(evidence)) {
        throw ValidationError("Evidence already exists: " + evidence.id);
    }

    FindingResult result;
    result.id = evidence.id;
    result.event = EventRef{EventKind::Evidence, evidence.id};

    bool evidence_saved = store_.save_evidence(evidence).has_value();
    bool event_saved = false;
    if (auto event = findings_.event(result.event)) {
        event_saved = store_.save_event(*event).has_value();
    }
    result.saved_to_db = evidence_saved && event_saved;
    if (!result.saved_to_db) {
        spdlog::warn("Evidence {} kept in memory only, durable write failed", evidence.id);
    }

    spdlog::info("New evidence created: {} (agent {}, confidence {:.2f})",
                 evidence.title, evidence.agent_id, evidence.confidence);

    publisher_.publish("evidence_recorded", evidence.to_json());
    return result;
}

json FindingPipeline::enrich(const Evidence& evidence, const Agent& agent) const {
    json enriched = {
        {"attack_type", evidence.type},
        {"system_info", {
            {"hostname", agent.hostname},
            {"os_type", agent.os_type},
            {"ip_address", agent.ip_address},
            {"agent_name", agent.name}
        }},
        {"recommendations", {
            {"immediate_actions", {
                "Isolate agent " + agent.hostname + " from network",
                "Run full system scan on agent " + agent.hostname,
                "Update antivirus signatures on agent " + agent.hostname
            }},
            {"further_investigation", {
                "Analyze process patterns for agent " + agent.hostname,
                "Review network traffic from agent " + agent.hostname,
                "Check for persistence mechanisms on agent " + agent.hostname
            }}
        }}
    };

    if (auto sample = metrics_.latest(agent.id)) {
        enriched["metrics"] = {
            {"cpu", sample->cpu},
            {"memory", sample->memory},
            {"disk", sample->disk},
            {"network", sample->network},
            {"processes", sample->process_count}
        };
    }
    return enriched;
}
