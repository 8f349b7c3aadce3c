#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

using TimePoint = std::chrono::system_clock::time_point;

enum class AgentStatus { Active, Warning, Offline };
enum class Severity { Low, Medium, High, Critical };
enum class ThreatStatus { Active, Acknowledged, Resolved };
enum class EvidenceStatus { Open, Acknowledged, Resolved };
enum class HealthStatus { Healthy, Warning, Critical };
enum class EventKind { Threat, Evidence };

std::string to_string(AgentStatus status);
std::string to_string(Severity severity);
std::string to_string(ThreatStatus status);
std::string to_string(EvidenceStatus status);
std::string to_string(HealthStatus status);
std::string to_string(EventKind kind);

std::optional<AgentStatus> parse_agent_status(const std::string& value);
std::optional<Severity> parse_severity(const std::string& value);
std::optional<ThreatStatus> parse_threat_status(const std::string& value);
std::optional<EvidenceStatus> parse_evidence_status(const std::string& value);

// Host identity captured from an agent at the time a finding is recorded
struct AgentInfo {
    std::string hostname;
    std::string os_type;
    std::string ip_address;

    nlohmann::json to_json() const;
};

struct Agent {
    std::string id;
    std::string name;
    std::string hostname;
    std::string ip_address;
    std::string os_type;
    std::string version = "1.0.0";
    AgentStatus status = AgentStatus::Active;
    int rank = 1;
    double cpu = 0.0;
    double memory = 0.0;
    int threat_count = 0;
    TimePoint last_seen;

    AgentInfo snapshot() const;
    nlohmann::json to_json() const;
};

// Fields a registration may supply; unset fields keep their current value
struct AgentUpdate {
    std::optional<std::string> name;
    std::optional<std::string> hostname;
    std::optional<std::string> ip_address;
    std::optional<std::string> os_type;
    std::optional<std::string> version;
};

struct MetricSample {
    std::string agent_id;
    double cpu = 0.0;
    double memory = 0.0;
    double disk = 0.0;
    double network = 0.0;
    int process_count = 0;
    TimePoint timestamp;

    nlohmann::json to_json() const;
};

struct Threat {
    std::string id;
    std::string name;
    std::string type;
    Severity severity = Severity::Medium;
    std::string description;
    ThreatStatus status = ThreatStatus::Active;
    TimePoint detected_at;
    std::optional<std::string> agent_id;
    std::optional<AgentInfo> agent_info;

    nlohmann::json to_json() const;
};

struct Evidence {
    std::string id;
    std::string agent_id;
    std::string type;
    Severity severity = Severity::Medium;
    std::string title;
    std::string description;
    nlohmann::json raw_data = nlohmann::json::object();
    EvidenceStatus status = EvidenceStatus::Open;
    double confidence = 0.8;
    TimePoint timestamp;

    nlohmann::json to_json() const;
};

// Typed address of an event. The string forms exist only at the HTTP
// boundary ("threat-<id>", "evidence-<id>") and in the events table
// ("event-threat-<id>", "event-evidence-<id>").
struct EventRef {
    EventKind kind = EventKind::Threat;
    std::string id;

    static std::optional<EventRef> parse(const std::string& composite_id);
    std::string public_id() const;
    std::string storage_id() const;

    bool operator==(const EventRef& other) const {
        return kind == other.kind && id == other.id;
    }
};

struct Event {
    EventRef ref;
    Severity severity = Severity::Medium;
    std::string title;
    std::string description;
    std::optional<std::string> agent_id;
    TimePoint timestamp;
    std::string status;
    double confidence = 0.8;
    nlohmann::json details = nlohmann::json::object();
    uint64_t sequence = 0;

    static Event from_threat(const Threat& threat, uint64_t sequence);
    static Event from_evidence(const Evidence& evidence, uint64_t sequence);

    nlohmann::json to_json(bool with_detail = false) const;
};

struct SystemHealthSample {
    std::string component;
    HealthStatus status = HealthStatus::Healthy;
    double cpu = 0.0;
    double memory = 0.0;
    double disk = 0.0;
    double network = 0.0;
    int64_t uptime_seconds = 0;
    TimePoint last_check;
    std::optional<std::string> error_message;

    nlohmann::json to_json() const;
};

// Result of probing the durable store
struct StoreHealth {
    bool healthy = false;
    std::string detail;

    nlohmann::json to_json() const;
};
