#include "postgres_store.hpp"
#include "util.hpp"
#include <pqxx/pqxx>
#include <spdlog/spdlog.h>
#include <chrono>
#include <mutex>
#include <thread>

using json = nlohmann::json;

namespace {

json parse_document(const pqxx::field& field) {
    if (field.is_null()) {
        return json::object();
    }
    std::string text = field.as<std::string>();
    try {
        return json::parse(text);
    } catch (const json::parse_error&) {
        return json{{"raw", text}};
    }
}

std::optional<std::string> optional_text(const pqxx::field& field) {
    if (field.is_null()) {
        return std::nullopt;
    }
    return field.as<std::string>();
}

} // namespace

class PostgresStore::Impl {
public:
    Impl(std::string dsn, int connect_attempts, int connect_backoff_ms)
        : dsn_(std::move(dsn)),
          connect_attempts_(connect_attempts),
          connect_backoff_ms_(connect_backoff_ms),
          backoff_ms_(1000),
          retry_count_(0) {}

    ~Impl() {
        disconnect();
    }

    bool connect() {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        for (int attempt = 1; attempt <= connect_attempts_; ++attempt) {
            if (open()) {
                return true;
            }
            spdlog::warn("PostgreSQL connection attempt {}/{} failed", attempt, connect_attempts_);
            if (attempt < connect_attempts_) {
                std::this_thread::sleep_for(std::chrono::milliseconds(connect_backoff_ms_));
            }
        }
        last_connection_attempt_ = std::chrono::steady_clock::now();
        spdlog::error("Giving up on PostgreSQL after {} attempts, continuing in degraded mode",
                      connect_attempts_);
        return false;
    }

    std::optional<std::string> save_agent(const Agent& agent) {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        bool ok = run("save agent", [&](pqxx::connection& conn) {
            pqxx::work txn(conn);
            txn.exec_params(
                "INSERT INTO agents (id, name, hostname, ip_address, os_type, version, status, "
                "rank, cpu, memory, threats, last_seen, created_at, updated_at) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, NOW(), NOW()) "
                "ON CONFLICT (id) DO UPDATE SET "
                "name = EXCLUDED.name, "
                "hostname = EXCLUDED.hostname, "
                "ip_address = EXCLUDED.ip_address, "
                "os_type = EXCLUDED.os_type, "
                "version = EXCLUDED.version, "
                "status = EXCLUDED.status, "
                "rank = EXCLUDED.rank, "
                "cpu = EXCLUDED.cpu, "
                "memory = EXCLUDED.memory, "
                "threats = EXCLUDED.threats, "
                "last_seen = EXCLUDED.last_seen, "
                "updated_at = NOW()",
                agent.id, agent.name, agent.hostname, agent.ip_address, agent.os_type,
                agent.version, to_string(agent.status), agent.rank, agent.cpu, agent.memory,
                agent.threat_count, util::format_timestamp(agent.last_seen));
            txn.commit();
        });
        return ok ? std::optional<std::string>(agent.id) : std::nullopt;
    }

    std::optional<std::string> save_threat(const Threat& threat) {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        std::optional<std::string> hostname, os_type, ip_address;
        if (threat.agent_info) {
            hostname = threat.agent_info->hostname;
            os_type = threat.agent_info->os_type;
            ip_address = threat.agent_info->ip_address;
        }

        bool ok = run("save threat", [&](pqxx::connection& conn) {
            pqxx::work txn(conn);
            txn.exec_params(
                "INSERT INTO threats (id, name, type, severity, description, status, detected_at, "
                "agent_id, agent_hostname, agent_os_type, agent_ip_address) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11) "
                "ON CONFLICT (id) DO UPDATE SET "
                "name = EXCLUDED.name, "
                "type = EXCLUDED.type, "
                "severity = EXCLUDED.severity, "
                "description = EXCLUDED.description, "
                "status = EXCLUDED.status",
                threat.id, threat.name, threat.type, to_string(threat.severity),
                threat.description, to_string(threat.status),
                util::format_timestamp(threat.detected_at), threat.agent_id,
                hostname, os_type, ip_address);
            txn.commit();
        });
        return ok ? std::optional<std::string>(threat.id) : std::nullopt;
    }

    std::optional<std::string> save_evidence(const Evidence& evidence) {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        bool ok = run("save evidence", [&](pqxx::connection& conn) {
            pqxx::work txn(conn);
            txn.exec_params(
                "INSERT INTO evidences (id, agent_id, type, severity, title, description, "
                "raw_data, status, confidence, timestamp) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10) "
                "ON CONFLICT (id) DO UPDATE SET "
                "raw_data = EXCLUDED.raw_data, "
                "status = EXCLUDED.status, "
                "confidence = EXCLUDED.confidence",
                evidence.id, evidence.agent_id, evidence.type, to_string(evidence.severity),
                evidence.title, evidence.description, evidence.raw_data.dump(),
                to_string(evidence.status), evidence.confidence,
                util::format_timestamp(evidence.timestamp));
            txn.commit();
        });
        return ok ? std::optional<std::string>(evidence.id) : std::nullopt;
    }

    std::optional<std::string> save_event(const Event& event) {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        std::string storage_id = event.ref.storage_id();
        bool ok = run("save event", [&](pqxx::connection& conn) {
            pqxx::work txn(conn);
            txn.exec_params(
                "INSERT INTO events (id, event_type, severity, title, description, agent_id, "
                "details, status, confidence, timestamp, updated_at) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, NOW()) "
                "ON CONFLICT (id) DO UPDATE SET "
                "details = EXCLUDED.details, "
                "status = EXCLUDED.status, "
                "updated_at = NOW()",
                storage_id, to_string(event.ref.kind), to_string(event.severity), event.title,
                event.description, event.agent_id, event.details.dump(), event.status,
                event.confidence, util::format_timestamp(event.timestamp));
            txn.commit();
        });
        return ok ? std::optional<std::string>(storage_id) : std::nullopt;
    }

    std::optional<std::string> save_system_health(const SystemHealthSample& sample) {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        bool ok = run("save system health", [&](pqxx::connection& conn) {
            pqxx::work txn(conn);
            txn.exec_params(
                "INSERT INTO system_health (component, status, cpu, memory, disk, network, "
                "uptime, last_check, error_message) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9) "
                "ON CONFLICT (component) DO UPDATE SET "
                "status = EXCLUDED.status, "
                "cpu = EXCLUDED.cpu, "
                "memory = EXCLUDED.memory, "
                "disk = EXCLUDED.disk, "
                "network = EXCLUDED.network, "
                "uptime = EXCLUDED.uptime, "
                "last_check = EXCLUDED.last_check, "
                "error_message = EXCLUDED.error_message",
                sample.component, to_string(sample.status), sample.cpu, sample.memory,
                sample.disk, sample.network, sample.uptime_seconds,
                util::format_timestamp(sample.last_check), sample.error_message);
            txn.commit();
        });
        return ok ? std::optional<std::string>(sample.component) : std::nullopt;
    }

    bool update_threat_status(const std::string& threat_id, ThreatStatus status) {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        return run("update threat status", [&](pqxx::connection& conn) {
            pqxx::work txn(conn);
            txn.exec_params(
                "UPDATE threats SET status = $1::text, "
                "resolved_at = CASE WHEN $1::text = 'resolved' THEN NOW() ELSE resolved_at END "
                "WHERE id = $2",
                to_string(status), threat_id);
            txn.commit();
        });
    }

    bool update_evidence_status(const std::string& evidence_id, EvidenceStatus status) {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        return run("update evidence status", [&](pqxx::connection& conn) {
            pqxx::work txn(conn);
            txn.exec_params("UPDATE evidences SET status = $1 WHERE id = $2",
                            to_string(status), evidence_id);
            txn.commit();
        });
    }

    bool update_event_status(const EventRef& ref, const std::string& status) {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        return run("update event status", [&](pqxx::connection& conn) {
            pqxx::work txn(conn);
            txn.exec_params("UPDATE events SET status = $1, updated_at = NOW() WHERE id = $2",
                            status, ref.storage_id());
            txn.commit();
        });
    }

    std::optional<std::vector<Event>> get_events(int limit) {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        std::vector<Event> events;
        bool ok = run("read events", [&](pqxx::connection& conn) {
            pqxx::nontransaction ntx(conn);
            pqxx::result result = ntx.exec_params(
                "SELECT id, severity, title, description, agent_id, details::text AS details, "
                "status, confidence, timestamp FROM events "
                "ORDER BY timestamp DESC, updated_at DESC LIMIT $1",
                limit);

            for (const auto& row : result) {
                std::string stored_id = row["id"].as<std::string>();
                auto ref = EventRef::parse(stored_id);
                if (!ref) {
                    spdlog::warn("Skipping event row with unrecognized id {}", stored_id);
                    continue;
                }

                Event event;
                event.ref = *ref;
                event.severity = parse_severity(row["severity"].as<std::string>()).value_or(Severity::Medium);
                event.title = row["title"].as<std::string>();
                event.description = row["description"].as<std::string>();
                event.agent_id = optional_text(row["agent_id"]);
                event.details = parse_document(row["details"]);
                event.status = row["status"].as<std::string>();
                event.confidence = row["confidence"].as<double>();
                event.timestamp = util::parse_iso8601(row["timestamp"].as<std::string>());
                event.sequence = events.size();
                events.push_back(std::move(event));
            }
        });

        if (!ok) {
            return std::nullopt;
        }
        return events;
    }

    std::vector<Agent> load_agents() {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        std::vector<Agent> agents;
        run("load agents", [&](pqxx::connection& conn) {
            pqxx::nontransaction ntx(conn);
            pqxx::result result = ntx.exec(
                "SELECT id, name, hostname, ip_address, os_type, version, status, rank, "
                "cpu, memory, threats, last_seen FROM agents ORDER BY created_at, id");

            for (const auto& row : result) {
                Agent agent;
                agent.id = row["id"].as<std::string>();
                agent.name = row["name"].as<std::string>();
                agent.hostname = row["hostname"].as<std::string>();
                agent.ip_address = row["ip_address"].as<std::string>();
                agent.os_type = row["os_type"].as<std::string>();
                agent.version = row["version"].as<std::string>();
                agent.status = parse_agent_status(row["status"].as<std::string>()).value_or(AgentStatus::Offline);
                agent.rank = row["rank"].as<int>();
                agent.cpu = row["cpu"].as<double>();
                agent.memory = row["memory"].as<double>();
                agent.threat_count = row["threats"].as<int>();
                agent.last_seen = util::parse_iso8601(row["last_seen"].as<std::string>());
                agents.push_back(std::move(agent));
            }
        });
        return agents;
    }

    std::vector<Threat> load_threats() {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        std::vector<Threat> threats;
        run("load threats", [&](pqxx::connection& conn) {
            pqxx::nontransaction ntx(conn);
            pqxx::result result = ntx.exec(
                "SELECT id, name, type, severity, description, status, detected_at, agent_id, "
                "agent_hostname, agent_os_type, agent_ip_address FROM threats ORDER BY detected_at, id");

            for (const auto& row : result) {
                Threat threat;
                threat.id = row["id"].as<std::string>();
                threat.name = row["name"].as<std::string>();
                threat.type = row["type"].as<std::string>();
                threat.severity = parse_severity(row["severity"].as<std::string>()).value_or(Severity::Medium);
                threat.description = row["description"].as<std::string>();
                threat.status = parse_threat_status(row["status"].as<std::string>()).value_or(ThreatStatus::Active);
                threat.detected_at = util::parse_iso8601(row["detected_at"].as<std::string>());
                threat.agent_id = optional_text(row["agent_id"]);
                if (!row["agent_hostname"].is_null()) {
                    threat.agent_info = AgentInfo{
                        row["agent_hostname"].as<std::string>(),
                        optional_text(row["agent_os_type"]).value_or(""),
                        optional_text(row["agent_ip_address"]).value_or("")
                    };
                }
                threats.push_back(std::move(threat));
            }
        });
        return threats;
    }

    std::vector<Evidence> load_evidence() {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        std::vector<Evidence> evidence;
        run("load evidence", [&](pqxx::connection& conn) {
            pqxx::nontransaction ntx(conn);
            pqxx::result result = ntx.exec(
                "SELECT id, agent_id, type, severity, title, description, raw_data::text AS raw_data, "
                "status, confidence, timestamp FROM evidences ORDER BY timestamp, id");

            for (const auto& row : result) {
                Evidence item;
                item.id = row["id"].as<std::string>();
                item.agent_id = row["agent_id"].as<std::string>();
                item.type = row["type"].as<std::string>();
                item.severity = parse_severity(row["severity"].as<std::string>()).value_or(Severity::Medium);
                item.title = row["title"].as<std::string>();
                item.description = row["description"].as<std::string>();
                item.raw_data = parse_document(row["raw_data"]);
                item.status = parse_evidence_status(row["status"].as<std::string>()).value_or(EvidenceStatus::Open);
                item.confidence = row["confidence"].as<double>();
                item.timestamp = util::parse_iso8601(row["timestamp"].as<std::string>());
                evidence.push_back(std::move(item));
            }
        });
        return evidence;
    }

    StoreHealth health_check() {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        if (!ensure_connection()) {
            return {false, "PostgreSQL unavailable"};
        }

        try {
            pqxx::nontransaction ntx(*conn_);
            ntx.exec("SELECT 1");
            return {true, "PostgreSQL connection healthy"};
        } catch (const pqxx::broken_connection& e) {
            spdlog::error("PostgreSQL connection lost during health check: {}", e.what());
            conn_.reset();
            return {false, e.what()};
        } catch (const std::exception& e) {
            spdlog::error("PostgreSQL health check failed: {}", e.what());
            return {false, e.what()};
        }
    }

    bool reset() {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        bool ok = run("reset database", [](pqxx::connection& conn) {
            pqxx::work txn(conn);
            txn.exec("DELETE FROM events");
            txn.exec("DELETE FROM evidences");
            txn.exec("DELETE FROM threats");
            txn.exec("DELETE FROM agents");
            txn.exec("DELETE FROM system_health");
            txn.commit();
        });
        if (ok) {
            spdlog::info("All tables cleared");
        }
        return ok;
    }

private:
    // Caller holds conn_mutex_ for everything below

    bool open() {
        try {
            conn_ = std::make_unique<pqxx::connection>(dsn_);
            if (!conn_->is_open()) {
                spdlog::error("PostgreSQL connection is not open");
                conn_.reset();
                return false;
            }

            {
                pqxx::nontransaction ntx(*conn_);
                ntx.exec("SET TIME ZONE 'UTC'");
            }

            create_tables();
            spdlog::info("Connected to PostgreSQL database");
            backoff_ms_ = 1000;
            retry_count_ = 0;
            return true;
        } catch (const std::exception& e) {
            spdlog::error("Failed to connect to PostgreSQL: {}", e.what());
            conn_.reset();
            return false;
        }
    }

    void disconnect() {
        if (conn_ && conn_->is_open()) {
            conn_->close();
            spdlog::info("Disconnected from PostgreSQL database");
        }
        conn_.reset();
    }

    bool is_connected() const {
        return conn_ && conn_->is_open();
    }

    bool ensure_connection() {
        if (is_connected()) {
            return true;
        }

        auto now = std::chrono::steady_clock::now();
        if (std::chrono::duration_cast<std::chrono::milliseconds>(
                now - last_connection_attempt_).count() < backoff_ms_) {
            return false;
        }

        last_connection_attempt_ = now;
        if (open()) {
            spdlog::info("PostgreSQL connection restored");
            return true;
        }

        spdlog::warn("PostgreSQL reconnection failed (attempt {})", ++retry_count_);
        // Exponential backoff with cap
        backoff_ms_ = std::min(backoff_ms_ * 2, 30000);
        return false;
    }

    template <typename Fn>
    bool run(const char* what, Fn&& fn) {
        if (!ensure_connection()) {
            return false;
        }

        try {
            fn(*conn_);
            return true;
        } catch (const pqxx::broken_connection& e) {
            spdlog::error("PostgreSQL connection lost during {}: {}", what, e.what());
            conn_.reset();
        } catch (const std::exception& e) {
            spdlog::error("Failed to {}: {}", what, e.what());
        }
        return false;
    }

    void create_tables() {
        pqxx::work txn(*conn_);

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS agents (
                id TEXT PRIMARY KEY,
                name TEXT NOT NULL,
                hostname TEXT NOT NULL,
                ip_address TEXT NOT NULL,
                os_type TEXT NOT NULL,
                version TEXT NOT NULL,
                status TEXT NOT NULL,
                rank INTEGER NOT NULL DEFAULT 1,
                cpu DOUBLE PRECISION NOT NULL DEFAULT 0,
                memory DOUBLE PRECISION NOT NULL DEFAULT 0,
                threats INTEGER NOT NULL DEFAULT 0,
                last_seen TIMESTAMP WITH TIME ZONE NOT NULL,
                created_at TIMESTAMP WITH TIME ZONE DEFAULT NOW(),
                updated_at TIMESTAMP WITH TIME ZONE DEFAULT NOW()
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS threats (
                id TEXT PRIMARY KEY,
                name TEXT NOT NULL,
                type TEXT NOT NULL,
                severity TEXT NOT NULL,
                description TEXT NOT NULL,
                status TEXT NOT NULL,
                detected_at TIMESTAMP WITH TIME ZONE NOT NULL,
                resolved_at TIMESTAMP WITH TIME ZONE,
                agent_id TEXT REFERENCES agents(id),
                agent_hostname TEXT,
                agent_os_type TEXT,
                agent_ip_address TEXT
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS evidences (
                id TEXT PRIMARY KEY,
                agent_id TEXT NOT NULL REFERENCES agents(id),
                type TEXT NOT NULL,
                severity TEXT NOT NULL,
                title TEXT NOT NULL,
                description TEXT NOT NULL,
                raw_data JSONB NOT NULL,
                status TEXT NOT NULL,
                confidence DOUBLE PRECISION NOT NULL,
                timestamp TIMESTAMP WITH TIME ZONE NOT NULL
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS events (
                id TEXT PRIMARY KEY,
                event_type TEXT NOT NULL,
                severity TEXT NOT NULL,
                title TEXT NOT NULL,
                description TEXT NOT NULL,
                agent_id TEXT,
                details JSONB,
                status TEXT NOT NULL,
                confidence DOUBLE PRECISION NOT NULL,
                timestamp TIMESTAMP WITH TIME ZONE NOT NULL,
                updated_at TIMESTAMP WITH TIME ZONE DEFAULT NOW()
            )
        )");

        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS system_health (
                component TEXT PRIMARY KEY,
                status TEXT NOT NULL,
                cpu DOUBLE PRECISION NOT NULL,
                memory DOUBLE PRECISION NOT NULL,
                disk DOUBLE PRECISION NOT NULL,
                network DOUBLE PRECISION NOT NULL,
                uptime BIGINT NOT NULL,
                last_check TIMESTAMP WITH TIME ZONE NOT NULL,
                error_message TEXT
            )
        )");

        txn.exec("CREATE INDEX IF NOT EXISTS idx_events_timestamp ON events(timestamp)");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_evidences_agent_id ON evidences(agent_id)");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_threats_agent_id ON threats(agent_id)");

        txn.commit();
    }

    std::string dsn_;
    int connect_attempts_;
    int connect_backoff_ms_;
    std::unique_ptr<pqxx::connection> conn_;
    std::mutex conn_mutex_;

    // Reconnection throttle
    std::chrono::steady_clock::time_point last_connection_attempt_ = std::chrono::steady_clock::now();
    int backoff_ms_;
    int retry_count_;
};

PostgresStore::PostgresStore(std::string dsn, int connect_attempts, int connect_backoff_ms)
    : impl_(std::make_unique<Impl>(std::move(dsn), connect_attempts, connect_backoff_ms)) {}

PostgresStore::~PostgresStore() = default;

bool PostgresStore::connect() {
    return impl_->connect();
}

std::string PostgresStore::backend_name() const {
    return "postgresql";
}

std::optional<std::string> PostgresStore::save_agent(const Agent& agent) {
    return impl_->save_agent(agent);
}

std::optional<std::string> PostgresStore::save_threat(const Threat& threat) {
    return impl_->save_threat(threat);
}

std::optional<std::string> PostgresStore::save_evidence(const Evidence& evidence) {
    return impl_->save_evidence(evidence);
}

std::optional<std::string> PostgresStore::save_event(const Event& event) {
    return impl_->save_event(event);
}

std::optional<std::string> PostgresStore::save_system_health(const SystemHealthSample& sample) {
    return impl_->save_system_health(sample);
}

bool PostgresStore::update_threat_status(const std::string& threat_id, ThreatStatus status) {
    return impl_->update_threat_status(threat_id, status);
}

bool PostgresStore::update_evidence_status(const std::string& evidence_id, EvidenceStatus status) {
    return impl_->update_evidence_status(evidence_id, status);
}

bool PostgresStore::update_event_status(const EventRef& ref, const std::string& status) {
    return impl_->update_event_status(ref, status);
}

std::optional<std::vector<Event>> PostgresStore::get_events(int limit) {
    return impl_->get_events(limit);
}

std::vector<Agent> PostgresStore::load_agents() {
    return impl_->load_agents();
}

std::vector<Threat> PostgresStore::load_threats() {
    return impl_->load_threats();
}

std::vector<Evidence> PostgresStore::load_evidence() {
    return impl_->load_evidence();
}

StoreHealth PostgresStore::health_check() {
    return impl_->health_check();
}

bool PostgresStore::reset() {
    return impl_->reset();
}
