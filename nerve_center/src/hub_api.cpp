#include "hub_api.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {

json parse_body(const std::string& body) {
    if (util::trim(body).empty()) {
        return json::object();
    }
    try {
        return json::parse(body);
    } catch (const json::parse_error&) {
        throw ValidationError("Malformed JSON body");
    }
}

size_t parse_limit(const std::optional<std::string>& value, size_t default_value) {
    if (!value || value->empty()) {
        return default_value;
    }
    size_t pos = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(*value, &pos);
    } catch (const std::exception&) {
        throw ValidationError("limit must be a positive integer");
    }
    if (pos != value->size() || parsed <= 0) {
        throw ValidationError("limit must be a positive integer");
    }
    return static_cast<size_t>(parsed);
}

std::optional<std::string> optional_string(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw ValidationError(std::string(key) + " must be a string");
    }
    return it->get<std::string>();
}

double number_field(const json& body, const char* key) {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return 0.0;
    }
    if (!it->is_number()) {
        throw ValidationError(std::string(key) + " must be a number");
    }
    return it->get<double>();
}

int count_field(const json& body, const char* key) {
    double value = number_field(body, key);
    if (!std::isfinite(value) || value < 0.0 || value > static_cast<double>(std::numeric_limits<int>::max())) {
        throw ValidationError(std::string(key) + " must be a non-negative integer");
    }
    return static_cast<int>(value);
}

json error_body(const std::string& message) {
    return {{"success", false}, {"error", message}};
}

} // namespace

HubApi::HubApi(const Config& config,
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
               IngressMeter& meter)
    : config_(config),
      registry_(registry),
      metrics_(metrics),
      findings_(findings),
      pipeline_(pipeline),
      aggregator_(aggregator),
      store_(store),
      publisher_(publisher),
      health_monitor_(health_monitor),
      ranking_(ranking),
      sampler_(sampler),
      meter_(meter) {}

template <typename Fn>
ApiReply HubApi::guarded(const char* operation, Fn&& fn) {
    try {
        return fn();
    } catch (const ValidationError& e) {
        spdlog::warn("{}: rejected: {}", operation, e.what());
        ApiReply reply{400, error_body(e.what())};
        if (!e.missing_fields().empty()) {
            reply.body["missing_fields"] = e.missing_fields();
        }
        return reply;
    } catch (const NotFoundError& e) {
        return ApiReply{404, error_body(e.what())};
    } catch (const std::exception& e) {
        spdlog::error("{} failed: {}", operation, e.what());
        return ApiReply{500, error_body("Internal server error")};
    }
}

ApiReply HubApi::root() {
    return ApiReply{200, {
        {"message", "Nerve Center coordination hub"},
        {"status", "operational"},
        {"version", config_.service_version},
        {"timestamp", util::current_iso8601()}
    }};
}

ApiReply HubApi::health() {
    return guarded("health", [&] {
        auto agents = registry_.list();
        size_t connected = std::count_if(agents.begin(), agents.end(), [](const Agent& a) {
            return a.status == AgentStatus::Active;
        });
        auto counts = findings_.counts();
        auto database = store_.health_check();

        return ApiReply{200, {
            {"status", database.healthy ? "healthy" : "degraded"},
            {"component", config_.service_name},
            {"agents_connected", connected},
            {"threats_active", counts.threats_active},
            {"database", database.to_json()},
            {"event_bus", {{"status", publisher_.status()}}},
            {"timestamp", util::current_iso8601()}
        }};
    });
}

ApiReply HubApi::list_agents() {
    return guarded("list_agents", [&] {
        json agents = json::array();
        for (const auto& agent : registry_.list()) {
            agents.push_back(agent.to_json());
        }
        return ApiReply{200, agents};
    });
}

ApiReply HubApi::get_agent(const std::string& agent_id) {
    return guarded("get_agent", [&] {
        return ApiReply{200, registry_.get(agent_id).to_json()};
    });
}

ApiReply HubApi::register_agent(const std::string& body) {
    return guarded("register_agent", [&] {
        auto request = parse_body(body);
        if (!request.is_object()) {
            throw ValidationError("Request body must be a JSON object");
        }

        auto id = optional_string(request, "id");
        std::string agent_id = (id && !id->empty()) ? *id : util::generate_uuid();

        AgentUpdate update;
        update.name = optional_string(request, "name");
        update.hostname = optional_string(request, "hostname");
        update.ip_address = optional_string(request, "ip_address");
        update.os_type = optional_string(request, "os_type");
        update.version = optional_string(request, "version");

        auto agent = registry_.upsert(agent_id, update);
        publisher_.publish("agent_update", agent.to_json());

        return ApiReply{200, {
            {"success", true},
            {"agent_id", agent.id},
            {"message", "Agent registered successfully"}
        }};
    });
}

ApiReply HubApi::post_metrics(const std::string& agent_id, const std::string& body) {
    return guarded("post_metrics", [&] {
        auto request = parse_body(body);
        if (!request.is_object()) {
            throw ValidationError("Request body must be a JSON object");
        }

        MetricSample sample;
        sample.agent_id = agent_id;
        sample.cpu = number_field(request, "cpu");
        sample.memory = number_field(request, "memory");
        sample.disk = number_field(request, "disk");
        sample.network = number_field(request, "network");
        sample.process_count = count_field(request, "processes");
        sample.timestamp = std::chrono::system_clock::now();

        metrics_.append(sample);
        spdlog::debug("Metrics from {}: cpu {:.1f} memory {:.1f}", agent_id, sample.cpu, sample.memory);

        return ApiReply{200, {
            {"success", true},
            {"message", "Metrics updated"}
        }};
    });
}

ApiReply HubApi::get_metrics(const std::string& agent_id, const std::optional<std::string>& limit) {
    return guarded("get_metrics", [&] {
        size_t n = parse_limit(limit, 50);
        json samples = json::array();
        for (const auto& sample : metrics_.recent(agent_id, n)) {
            samples.push_back(sample.to_json());
        }
        return ApiReply{200, samples};
    });
}

ApiReply HubApi::list_threats() {
    return guarded("list_threats", [&] {
        json threats = json::array();
        for (const auto& threat : findings_.threats()) {
            threats.push_back(threat.to_json());
        }
        return ApiReply{200, threats};
    });
}

ApiReply HubApi::create_threat(const std::string& body) {
    return guarded("create_threat", [&] {
        auto request = ThreatRequest::from_json(parse_body(body));
        auto result = pipeline_.create_threat(request);

        return ApiReply{200, {
            {"success", true},
            {"threat_id", result.id},
            {"event_id", result.event.public_id()},
            {"saved_to_db", result.saved_to_db},
            {"message", "Threat created successfully"}
        }};
    });
}

ApiReply HubApi::create_evidence(const std::string& body) {
    return guarded("create_evidence", [&] {
        auto request = EvidenceRequest::from_json(parse_body(body));
        auto result = pipeline_.create_evidence(request);

        return ApiReply{200, {
            {"success", true},
            {"evidence_id", result.id},
            {"event_id", result.event.public_id()},
            {"saved_to_db", result.saved_to_db},
            {"message", "Evidence recorded successfully"}
        }};
    });
}

ApiReply HubApi::list_events(const std::optional<std::string>& limit, const std::optional<std::string>& source) {
    return guarded("list_events", [&] {
        size_t n = parse_limit(limit, 100);
        std::string from = source ? util::to_lower(*source) : "memory";
        if (from != "memory" && from != "database") {
            throw ValidationError("source must be memory or database");
        }

        std::vector<Event> events;
        bool loaded = false;
        if (from == "database") {
            auto stored = store_.get_events(
                static_cast<int>(std::min<size_t>(n, static_cast<size_t>(std::numeric_limits<int>::max()))));
            if (stored) {
                events = std::move(*stored);
                loaded = true;
            } else {
                spdlog::warn("Event table unavailable, serving in-memory events");
            }
        }
        if (!loaded) {
            events = aggregator_.list(n);
        }

        json out = json::array();
        for (const auto& event : events) {
            out.push_back(event.to_json());
        }
        return ApiReply{200, out};
    });
}

ApiReply HubApi::get_event(const std::string& event_id) {
    return guarded("get_event", [&] {
        return ApiReply{200, aggregator_.get(event_id).to_json(true)};
    });
}

ApiReply HubApi::acknowledge_event(const std::string& event_id) {
    return guarded("acknowledge_event", [&] {
        auto result = aggregator_.acknowledge(event_id);
        return ApiReply{200, {
            {"success", true},
            {"data", {
                {"event_id", result.ref.public_id()},
                {"status", result.status},
                {"message", result.changed ? std::string("Event acknowledged") : "Event already " + result.status}
            }}
        }};
    });
}

ApiReply HubApi::system_health() {
    return guarded("system_health", [&] {
        json components = json::array();
        for (const auto& sample : health_monitor_.snapshot()) {
            components.push_back(sample.to_json());
        }
        return ApiReply{200, components};
    });
}

ApiReply HubApi::network_metrics() {
    return guarded("network_metrics", [&] {
        auto host = sampler_.sample();
        auto traffic = meter_.stats();

        json protocols = json::array();
        for (const auto& channel : traffic.channels) {
            protocols.push_back({
                {"name", channel.name},
                {"status", channel.status},
                {"messages", channel.messages},
                {"errors", channel.errors}
            });
        }

        auto status = HealthMonitor::mesh_network_status(host.network);
        return ApiReply{200, {
            {"status", status == HealthStatus::Healthy ? "healthy" : "degraded"},
            {"activeConnections", host.established_connections},
            {"messageRate", traffic.message_rate},
            {"latency", traffic.latency_ms},
            {"errorRate", traffic.error_ratio},
            {"totalRequests", traffic.total_requests},
            {"bytesIn", host.bytes_in},
            {"bytesOut", host.bytes_out},
            {"bytesInPerSec", host.bytes_in_per_sec},
            {"bytesOutPerSec", host.bytes_out_per_sec},
            {"networkLoad", host.network},
            {"protocols", protocols}
        }};
    });
}

ApiReply HubApi::system_status() {
    return guarded("system_status", [&] {
        auto agents = registry_.list();
        size_t active = 0;
        size_t warning = 0;
        size_t offline = 0;
        size_t participating = 0;
        for (const auto& agent : agents) {
            switch (agent.status) {
                case AgentStatus::Active:
                    ++active;
                    ++participating;
                    break;
                case AgentStatus::Warning:
                    ++warning;
                    break;
                case AgentStatus::Offline:
                    ++offline;
                    break;
            }
        }

        auto counts = findings_.counts();
        auto last_cycle = health_monitor_.last_cycle();
        auto ranking = ranking_.summary();
        ranking["participating_agents"] = participating;

        return ApiReply{200, {
            {"nerve_center", {
                {"status", "operational"},
                {"version", config_.service_version},
                {"database", store_.backend_name()},
                {"event_bus", publisher_.status()},
                {"last_health_cycle", last_cycle ? json(util::format_timestamp(*last_cycle)) : json(nullptr)},
                {"timestamp", util::current_iso8601()}
            }},
            {"agents", {
                {"total", agents.size()},
                {"active", active},
                {"warning", warning},
                {"offline", offline}
            }},
            {"threats", {
                {"total", counts.threats_total},
                {"active", counts.threats_active},
                {"acknowledged", counts.threats_acknowledged},
                {"critical_active", counts.threats_critical_active}
            }},
            {"evidence", {
                {"total", counts.evidence_total},
                {"open", counts.evidence_open},
                {"acknowledged", counts.evidence_acknowledged}
            }},
            {"ranking", ranking}
        }};
    });
}

ApiReply HubApi::admin_reset() {
    return guarded("admin_reset", [&] {
        spdlog::warn("Admin reset requested, clearing all agents, metrics and findings");
        metrics_.clear();
        findings_.clear();
        registry_.clear();
        bool cleared = store_.reset();
        if (!cleared) {
            spdlog::warn("Durable store reset failed; in-memory state cleared");
        }
        return ApiReply{200, {
            {"success", true},
            {"database_cleared", cleared},
            {"message", "All data cleared"}
        }};
    });
}
