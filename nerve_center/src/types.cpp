#include "types.hpp"
#include "util.hpp"

std::string to_string(AgentStatus status) {
    switch (status) {
        case AgentStatus::Active: return "active";
        case AgentStatus::Warning: return "warning";
        case AgentStatus::Offline: return "offline";
    }
    return "offline";
}

std::string to_string(Severity severity) {
    switch (severity) {
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
        case Severity::Critical: return "critical";
    }
    return "medium";
}

std::string to_string(ThreatStatus status) {
    switch (status) {
        case ThreatStatus::Active: return "active";
        case ThreatStatus::Acknowledged: return "acknowledged";
        case ThreatStatus::Resolved: return "resolved";
    }
    return "active";
}

std::string to_string(EvidenceStatus status) {
    switch (status) {
        case EvidenceStatus::Open: return "open";
        case EvidenceStatus::Acknowledged: return "acknowledged";
        case EvidenceStatus::Resolved: return "resolved";
    }
    return "open";
}

std::string to_string(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy: return "healthy";
        case HealthStatus::Warning: return "warning";
        case HealthStatus::Critical: return "critical";
    }
    return "critical";
}

std::string to_string(EventKind kind) {
    return kind == EventKind::Threat ? "threat" : "evidence";
}

std::optional<AgentStatus> parse_agent_status(const std::string& value) {
    auto v = util::to_lower(value);
    if (v == "active") return AgentStatus::Active;
    if (v == "warning") return AgentStatus::Warning;
    if (v == "offline") return AgentStatus::Offline;
    return std::nullopt;
}

std::optional<Severity> parse_severity(const std::string& value) {
    auto v = util::to_lower(value);
    if (v == "low") return Severity::Low;
    if (v == "medium") return Severity::Medium;
    if (v == "high") return Severity::High;
    if (v == "critical") return Severity::Critical;
    return std::nullopt;
}

std::optional<ThreatStatus> parse_threat_status(const std::string& value) {
    auto v = util::to_lower(value);
    if (v == "active") return ThreatStatus::Active;
    if (v == "acknowledged") return ThreatStatus::Acknowledged;
    if (v == "resolved") return ThreatStatus::Resolved;
    return std::nullopt;
}

std::optional<EvidenceStatus> parse_evidence_status(const std::string& value) {
    auto v = util::to_lower(value);
    if (v == "open") return EvidenceStatus::Open;
    if (v == "acknowledged") return EvidenceStatus::Acknowledged;
    if (v == "resolved") return EvidenceStatus::Resolved;
    return std::nullopt;
}

nlohmann::json AgentInfo::to_json() const {
    return {
        {"hostname", hostname},
        {"os_type", os_type},
        {"ip_address", ip_address}
    };
}

AgentInfo Agent::snapshot() const {
    return AgentInfo{hostname, os_type, ip_address};
}

nlohmann::json Agent::to_json() const {
    return {
        {"id", id},
        {"name", name},
        {"hostname", hostname},
        {"status", to_string(status)},
        {"rank", rank},
        {"cpu", cpu},
        {"memory", memory},
        {"lastSeen", util::format_timestamp(last_seen)},
        {"threats", threat_count},
        {"ipAddress", ip_address},
        {"osType", os_type},
        {"version", version}
    };
}

nlohmann::json MetricSample::to_json() const {
    return {
        {"agent_id", agent_id},
        {"cpu", cpu},
        {"memory", memory},
        {"disk", disk},
        {"network", network},
        {"processes", process_count},
        {"timestamp", util::format_timestamp(timestamp)}
    };
}

nlohmann::json Threat::to_json() const {
    nlohmann::json j = {
        {"id", id},
        {"name", name},
        {"type", type},
        {"severity", to_string(severity)},
        {"description", description},
        {"status", to_string(status)},
        {"detected_at", util::format_timestamp(detected_at)},
        {"agent_id", agent_id ? nlohmann::json(*agent_id) : nlohmann::json(nullptr)},
        {"agent_info", agent_info ? agent_info->to_json() : nlohmann::json(nullptr)}
    };
    return j;
}

nlohmann::json Evidence::to_json() const {
    return {
        {"id", id},
        {"agent_id", agent_id},
        {"type", type},
        {"severity", to_string(severity)},
        {"title", title},
        {"description", description},
        {"raw_data", raw_data},
        {"status", to_string(status)},
        {"confidence", confidence},
        {"timestamp", util::format_timestamp(timestamp)}
    };
}

std::optional<EventRef> EventRef::parse(const std::string& composite_id) {
    static const std::pair<const char*, EventKind> prefixes[] = {
        {"event-threat-", EventKind::Threat},
        {"event-evidence-", EventKind::Evidence},
        {"threat-", EventKind::Threat},
        {"evidence-", EventKind::Evidence},
    };

    for (const auto& [prefix, kind] : prefixes) {
        std::string p(prefix);
        if (util::starts_with(composite_id, p) && composite_id.size() > p.size()) {
            return EventRef{kind, composite_id.substr(p.size())};
        }
    }
    return std::nullopt;
}

std::string EventRef::public_id() const {
    return to_string(kind) + "-" + id;
}

std::string EventRef::storage_id() const {
    return "event-" + public_id();
}

Event Event::from_threat(const Threat& threat, uint64_t sequence) {
    Event event;
    event.ref = EventRef{EventKind::Threat, threat.id};
    event.severity = threat.severity;
    event.title = threat.name;
    event.description = threat.description;
    event.agent_id = threat.agent_id;
    event.timestamp = threat.detected_at;
    event.status = to_string(threat.status);
    event.confidence = 0.8;
    event.details = {
        {"threat_type", threat.type},
        {"agent_info", threat.agent_info ? threat.agent_info->to_json() : nlohmann::json(nullptr)}
    };
    event.sequence = sequence;
    return event;
}

Event Event::from_evidence(const Evidence& evidence, uint64_t sequence) {
    Event event;
    event.ref = EventRef{EventKind::Evidence, evidence.id};
    event.severity = evidence.severity;
    event.title = evidence.title;
    event.description = evidence.description;
    event.agent_id = evidence.agent_id;
    event.timestamp = evidence.timestamp;
    event.status = to_string(evidence.status);
    event.confidence = evidence.confidence;
    event.details = evidence.raw_data;
    event.sequence = sequence;
    return event;
}

nlohmann::json Event::to_json(bool with_detail) const {
    nlohmann::json j = {
        {"id", ref.public_id()},
        {"type", to_string(ref.kind)},
        {"severity", to_string(severity)},
        {"title", title},
        {"description", description},
        {"agent_id", agent_id ? nlohmann::json(*agent_id) : nlohmann::json(nullptr)},
        {"timestamp", util::format_timestamp(timestamp)},
        {"status", status},
        {"confidence", confidence},
        {"details", details}
    };

    if (ref.kind == EventKind::Evidence) {
        j["trigger"] = details.is_object() ? details.value("attack_type", std::string("unknown")) : "unknown";
        j["metrics"] = details.is_object() && details.contains("metrics") ? details["metrics"] : nlohmann::json::object();
        j["processes"] = details.is_object() && details.contains("suspicious_processes")
            ? details["suspicious_processes"] : nlohmann::json::array();
    }

    if (with_detail) {
        j["investigation_notes"] = "";
    }
    return j;
}

nlohmann::json SystemHealthSample::to_json() const {
    return {
        {"component", component},
        {"status", to_string(status)},
        {"cpu", cpu},
        {"memory", memory},
        {"disk", disk},
        {"network", network},
        {"uptime", uptime_seconds},
        {"lastCheck", util::format_timestamp(last_check)},
        {"errorMessage", error_message ? nlohmann::json(*error_message) : nlohmann::json(nullptr)}
    };
}

nlohmann::json StoreHealth::to_json() const {
    return {
        {"status", healthy ? "healthy" : "unhealthy"},
        {"detail", detail}
    };
}
