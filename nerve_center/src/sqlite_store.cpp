#include "sqlite_store.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <sqlite3.h>
#include <chrono>
#include <mutex>
#include <thread>

using json = nlohmann::json;

namespace {

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bind_optional_text(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
    if (value) {
        bind_text(stmt, index, *value);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

std::string column_text(sqlite3_stmt* stmt, int index) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
    return text ? std::string(text) : std::string();
}

std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, int index) {
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return column_text(stmt, index);
}

json parse_document(const std::string& text) {
    if (text.empty()) {
        return json::object();
    }
    try {
        return json::parse(text);
    } catch (const json::parse_error&) {
        return json{{"raw", text}};
    }
}

const char* kSchema = R"(
    CREATE TABLE IF NOT EXISTS agents (
        id TEXT PRIMARY KEY,
        name TEXT NOT NULL,
        hostname TEXT NOT NULL,
        ip_address TEXT NOT NULL,
        os_type TEXT NOT NULL,
        version TEXT NOT NULL,
        status TEXT NOT NULL,
        rank INTEGER NOT NULL DEFAULT 1,
        cpu REAL NOT NULL DEFAULT 0,
        memory REAL NOT NULL DEFAULT 0,
        threats INTEGER NOT NULL DEFAULT 0,
        last_seen TEXT NOT NULL,
        created_at TEXT NOT NULL,
        updated_at TEXT NOT NULL
    );

    CREATE TABLE IF NOT EXISTS threats (
        id TEXT PRIMARY KEY,
        name TEXT NOT NULL,
        type TEXT NOT NULL,
        severity TEXT NOT NULL,
        description TEXT NOT NULL,
        status TEXT NOT NULL,
        detected_at TEXT NOT NULL,
        resolved_at TEXT,
        agent_id TEXT REFERENCES agents(id),
        agent_hostname TEXT,
        agent_os_type TEXT,
        agent_ip_address TEXT
    );

    CREATE TABLE IF NOT EXISTS evidences (
        id TEXT PRIMARY KEY,
        agent_id TEXT NOT NULL REFERENCES agents(id),
        type TEXT NOT NULL,
        severity TEXT NOT NULL,
        title TEXT NOT NULL,
        description TEXT NOT NULL,
        raw_data TEXT NOT NULL,
        status TEXT NOT NULL,
        confidence REAL NOT NULL,
        timestamp TEXT NOT NULL
    );

    CREATE TABLE IF NOT EXISTS events (
        id TEXT PRIMARY KEY,
        event_type TEXT NOT NULL,
        severity TEXT NOT NULL,
        title TEXT NOT NULL,
        description TEXT NOT NULL,
        agent_id TEXT,
        details TEXT,
        status TEXT NOT NULL,
        confidence REAL NOT NULL,
        timestamp TEXT NOT NULL,
        updated_at TEXT NOT NULL
    );

    CREATE TABLE IF NOT EXISTS system_health (
        component TEXT PRIMARY KEY,
        status TEXT NOT NULL,
        cpu REAL NOT NULL,
        memory REAL NOT NULL,
        disk REAL NOT NULL,
        network REAL NOT NULL,
        uptime INTEGER NOT NULL,
        last_check TEXT NOT NULL,
        error_message TEXT
    );

    CREATE INDEX IF NOT EXISTS idx_events_timestamp ON events(timestamp);
    CREATE INDEX IF NOT EXISTS idx_evidences_agent_id ON evidences(agent_id);
    CREATE INDEX IF NOT EXISTS idx_threats_agent_id ON threats(agent_id);
)";

} // namespace

class SqliteStore::Impl {
public:
    Impl(std::string path, int connect_attempts, int connect_backoff_ms)
        : path_(std::move(path)),
          connect_attempts_(connect_attempts),
          connect_backoff_ms_(connect_backoff_ms),
          db_(nullptr) {}

    ~Impl() {
        close();
    }

    bool connect() {
        std::lock_guard<std::mutex> lock(db_mutex_);
        for (int attempt = 1; attempt <= connect_attempts_; ++attempt) {
            if (open()) {
                return true;
            }
            spdlog::warn("SQLite connection attempt {}/{} failed", attempt, connect_attempts_);
            if (attempt < connect_attempts_) {
                std::this_thread::sleep_for(std::chrono::milliseconds(connect_backoff_ms_));
            }
        }
        spdlog::error("Giving up on SQLite database {} after {} attempts", path_, connect_attempts_);
        return false;
    }

    std::optional<std::string> save_agent(const Agent& agent) {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!ensure_open()) {
            return std::nullopt;
        }

        const char* sql = R"(
            INSERT INTO agents (id, name, hostname, ip_address, os_type, version, status,
                                rank, cpu, memory, threats, last_seen, created_at, updated_at)
            VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?13)
            ON CONFLICT(id) DO UPDATE SET
                name = excluded.name,
                hostname = excluded.hostname,
                ip_address = excluded.ip_address,
                os_type = excluded.os_type,
                version = excluded.version,
                status = excluded.status,
                rank = excluded.rank,
                cpu = excluded.cpu,
                memory = excluded.memory,
                threats = excluded.threats,
                last_seen = excluded.last_seen,
                updated_at = excluded.updated_at
        )";

        auto stmt = prepare(sql);
        if (!stmt) {
            return std::nullopt;
        }

        bind_text(stmt.get(), 1, agent.id);
        bind_text(stmt.get(), 2, agent.name);
        bind_text(stmt.get(), 3, agent.hostname);
        bind_text(stmt.get(), 4, agent.ip_address);
        bind_text(stmt.get(), 5, agent.os_type);
        bind_text(stmt.get(), 6, agent.version);
        bind_text(stmt.get(), 7, to_string(agent.status));
        sqlite3_bind_int(stmt.get(), 8, agent.rank);
        sqlite3_bind_double(stmt.get(), 9, agent.cpu);
        sqlite3_bind_double(stmt.get(), 10, agent.memory);
        sqlite3_bind_int(stmt.get(), 11, agent.threat_count);
        bind_text(stmt.get(), 12, util::format_timestamp(agent.last_seen));
        bind_text(stmt.get(), 13, util::current_iso8601());

        if (!step_done(stmt.get(), "save agent")) {
            return std::nullopt;
        }
        return agent.id;
    }

    std::optional<std::string> save_threat(const Threat& threat) {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!ensure_open()) {
            return std::nullopt;
        }

        const char* sql = R"(
            INSERT INTO threats (id, name, type, severity, description, status, detected_at,
                                 agent_id, agent_hostname, agent_os_type, agent_ip_address)
            VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11)
            ON CONFLICT(id) DO UPDATE SET
                name = excluded.name,
                type = excluded.type,
                severity = excluded.severity,
                description = excluded.description,
                status = excluded.status
        )";

        auto stmt = prepare(sql);
        if (!stmt) {
            return std::nullopt;
        }

        bind_text(stmt.get(), 1, threat.id);
        bind_text(stmt.get(), 2, threat.name);
        bind_text(stmt.get(), 3, threat.type);
        bind_text(stmt.get(), 4, to_string(threat.severity));
        bind_text(stmt.get(), 5, threat.description);
        bind_text(stmt.get(), 6, to_string(threat.status));
        bind_text(stmt.get(), 7, util::format_timestamp(threat.detected_at));
        bind_optional_text(stmt.get(), 8, threat.agent_id);
        if (threat.agent_info) {
            bind_text(stmt.get(), 9, threat.agent_info->hostname);
            bind_text(stmt.get(), 10, threat.agent_info->os_type);
            bind_text(stmt.get(), 11, threat.agent_info->ip_address);
        } else {
            sqlite3_bind_null(stmt.get(), 9);
            sqlite3_bind_null(stmt.get(), 10);
            sqlite3_bind_null(stmt.get(), 11);
        }

        if (!step_done(stmt.get(), "save threat")) {
            return std::nullopt;
        }
        return threat.id;
    }

    std::optional<std::string> save_evidence(const Evidence& evidence) {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!ensure_open()) {
            return std::nullopt;
        }

        const char* sql = R"(
            INSERT INTO evidences (id, agent_id, type, severity, title, description,
                                   raw_data, status, confidence, timestamp)
            VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)
            ON CONFLICT(id) DO UPDATE SET
                raw_data = excluded.raw_data,
                status = excluded.status,
                confidence = excluded.confidence
        )";

        auto stmt = prepare(sql);
        if (!stmt) {
            return std::nullopt;
        }

        bind_text(stmt.get(), 1, evidence.id);
        bind_text(stmt.get(), 2, evidence.agent_id);
        bind_text(stmt.get(), 3, evidence.type);
        bind_text(stmt.get(), 4, to_string(evidence.severity));
        bind_text(stmt.get(), 5, evidence.title);
        bind_text(stmt.get(), 6, evidence.description);
        bind_text(stmt.get(), 7, evidence.raw_data.dump());
        bind_text(stmt.get(), 8, to_string(evidence.status));
        sqlite3_bind_double(stmt.get(), 9, evidence.confidence);
        bind_text(stmt.get(), 10, util::format_timestamp(evidence.timestamp));

        if (!step_done(stmt.get(), "save evidence")) {
            return std::nullopt;
        }
        return evidence.id;
    }

    std::optional<std::string> save_event(const Event& event) {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!ensure_open()) {
            return std::nullopt;
        }

        const char* sql = R"(
            INSERT INTO events (id, event_type, severity, title, description, agent_id,
                                details, status, confidence, timestamp, updated_at)
            VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11)
            ON CONFLICT(id) DO UPDATE SET
                details = excluded.details,
                status = excluded.status,
                updated_at = excluded.updated_at
        )";

        auto stmt = prepare(sql);
        if (!stmt) {
            return std::nullopt;
        }

        std::string storage_id = event.ref.storage_id();
        bind_text(stmt.get(), 1, storage_id);
        bind_text(stmt.get(), 2, to_string(event.ref.kind));
        bind_text(stmt.get(), 3, to_string(event.severity));
        bind_text(stmt.get(), 4, event.title);
        bind_text(stmt.get(), 5, event.description);
        bind_optional_text(stmt.get(), 6, event.agent_id);
        bind_text(stmt.get(), 7, event.details.dump());
        bind_text(stmt.get(), 8, event.status);
        sqlite3_bind_double(stmt.get(), 9, event.confidence);
        bind_text(stmt.get(), 10, util::format_timestamp(event.timestamp));
        bind_text(stmt.get(), 11, util::current_iso8601());

        if (!step_done(stmt.get(), "save event")) {
            return std::nullopt;
        }
        return storage_id;
    }

    std::optional<std::string> save_system_health(const SystemHealthSample& sample) {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!ensure_open()) {
            return std::nullopt;
        }

        const char* sql = R"(
            INSERT INTO system_health (component, status, cpu, memory, disk, network,
                                       uptime, last_check, error_message)
            VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)
            ON CONFLICT(component) DO UPDATE SET
                status = excluded.status,
                cpu = excluded.cpu,
                memory = excluded.memory,
                disk = excluded.disk,
                network = excluded.network,
                uptime = excluded.uptime,
                last_check = excluded.last_check,
                error_message = excluded.error_message
        )";

        auto stmt = prepare(sql);
        if (!stmt) {
            return std::nullopt;
        }

        bind_text(stmt.get(), 1, sample.component);
        bind_text(stmt.get(), 2, to_string(sample.status));
        sqlite3_bind_double(stmt.get(), 3, sample.cpu);
        sqlite3_bind_double(stmt.get(), 4, sample.memory);
        sqlite3_bind_double(stmt.get(), 5, sample.disk);
        sqlite3_bind_double(stmt.get(), 6, sample.network);
        sqlite3_bind_int64(stmt.get(), 7, sample.uptime_seconds);
        bind_text(stmt.get(), 8, util::format_timestamp(sample.last_check));
        bind_optional_text(stmt.get(), 9, sample.error_message);

        if (!step_done(stmt.get(), "save system health")) {
            return std::nullopt;
        }
        return sample.component;
    }

    bool update_threat_status(const std::string& threat_id, ThreatStatus status) {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!ensure_open()) {
            return false;
        }

        auto stmt = prepare(
            "UPDATE threats SET status = ?1, "
            "resolved_at = CASE WHEN ?1 = 'resolved' THEN ?2 ELSE resolved_at END "
            "WHERE id = ?3");
        if (!stmt) {
            return false;
        }

        bind_text(stmt.get(), 1, to_string(status));
        bind_text(stmt.get(), 2, util::current_iso8601());
        bind_text(stmt.get(), 3, threat_id);
        return step_done(stmt.get(), "update threat status");
    }

    bool update_evidence_status(const std::string& evidence_id, EvidenceStatus status) {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!ensure_open()) {
            return false;
        }

        auto stmt = prepare("UPDATE evidences SET status = ?1 WHERE id = ?2");
        if (!stmt) {
            return false;
        }

        bind_text(stmt.get(), 1, to_string(status));
        bind_text(stmt.get(), 2, evidence_id);
        return step_done(stmt.get(), "update evidence status");
    }

    bool update_event_status(const EventRef& ref, const std::string& status) {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!ensure_open()) {
            return false;
        }

        auto stmt = prepare("UPDATE events SET status = ?1, updated_at = ?2 WHERE id = ?3");
        if (!stmt) {
            return false;
        }

        bind_text(stmt.get(), 1, status);
        bind_text(stmt.get(), 2, util::current_iso8601());
        bind_text(stmt.get(), 3, ref.storage_id());
        return step_done(stmt.get(), "update event status");
    }

    std::optional<std::vector<Event>> get_events(int limit) {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!ensure_open()) {
            return std::nullopt;
        }

        auto stmt = prepare(
            "SELECT id, severity, title, description, agent_id, details, status, confidence, timestamp "
            "FROM events ORDER BY timestamp DESC, rowid DESC LIMIT ?1");
        if (!stmt) {
            return std::nullopt;
        }
        sqlite3_bind_int(stmt.get(), 1, limit);

        std::vector<Event> events;
        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            std::string stored_id = column_text(stmt.get(), 0);
            auto ref = EventRef::parse(stored_id);
            if (!ref) {
                spdlog::warn("Skipping event row with unrecognized id {}", stored_id);
                continue;
            }

            Event event;
            event.ref = *ref;
            event.severity = parse_severity(column_text(stmt.get(), 1)).value_or(Severity::Medium);
            event.title = column_text(stmt.get(), 2);
            event.description = column_text(stmt.get(), 3);
            event.agent_id = column_optional_text(stmt.get(), 4);
            event.details = parse_document(column_text(stmt.get(), 5));
            event.status = column_text(stmt.get(), 6);
            event.confidence = sqlite3_column_double(stmt.get(), 7);
            event.timestamp = util::parse_iso8601(column_text(stmt.get(), 8));
            event.sequence = events.size();
            events.push_back(std::move(event));
        }

        if (rc != SQLITE_DONE) {
            spdlog::error("Failed to read events: {}", sqlite3_errmsg(db_));
            return std::nullopt;
        }
        return events;
    }

    std::vector<Agent> load_agents() {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::vector<Agent> agents;
        if (!ensure_open()) {
            return agents;
        }

        auto stmt = prepare(
            "SELECT id, name, hostname, ip_address, os_type, version, status, rank, "
            "cpu, memory, threats, last_seen FROM agents ORDER BY rowid");
        if (!stmt) {
            return agents;
        }

        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            Agent agent;
            agent.id = column_text(stmt.get(), 0);
            agent.name = column_text(stmt.get(), 1);
            agent.hostname = column_text(stmt.get(), 2);
            agent.ip_address = column_text(stmt.get(), 3);
            agent.os_type = column_text(stmt.get(), 4);
            agent.version = column_text(stmt.get(), 5);
            agent.status = parse_agent_status(column_text(stmt.get(), 6)).value_or(AgentStatus::Offline);
            agent.rank = sqlite3_column_int(stmt.get(), 7);
            agent.cpu = sqlite3_column_double(stmt.get(), 8);
            agent.memory = sqlite3_column_double(stmt.get(), 9);
            agent.threat_count = sqlite3_column_int(stmt.get(), 10);
            agent.last_seen = util::parse_iso8601(column_text(stmt.get(), 11));
            agents.push_back(std::move(agent));
        }
        return agents;
    }

    std::vector<Threat> load_threats() {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::vector<Threat> threats;
        if (!ensure_open()) {
            return threats;
        }

        auto stmt = prepare(
            "SELECT id, name, type, severity, description, status, detected_at, agent_id, "
            "agent_hostname, agent_os_type, agent_ip_address FROM threats ORDER BY detected_at, rowid");
        if (!stmt) {
            return threats;
        }

        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            Threat threat;
            threat.id = column_text(stmt.get(), 0);
            threat.name = column_text(stmt.get(), 1);
            threat.type = column_text(stmt.get(), 2);
            threat.severity = parse_severity(column_text(stmt.get(), 3)).value_or(Severity::Medium);
            threat.description = column_text(stmt.get(), 4);
            threat.status = parse_threat_status(column_text(stmt.get(), 5)).value_or(ThreatStatus::Active);
            threat.detected_at = util::parse_iso8601(column_text(stmt.get(), 6));
            threat.agent_id = column_optional_text(stmt.get(), 7);
            auto hostname = column_optional_text(stmt.get(), 8);
            if (hostname) {
                threat.agent_info = AgentInfo{*hostname, column_text(stmt.get(), 9), column_text(stmt.get(), 10)};
            }
            threats.push_back(std::move(threat));
        }
        return threats;
    }

    std::vector<Evidence> load_evidence() {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::vector<Evidence> evidence;
        if (!ensure_open()) {
            return evidence;
        }

        auto stmt = prepare(
            "SELECT id, agent_id, type, severity, title, description, raw_data, status, "
            "confidence, timestamp FROM evidences ORDER BY timestamp, rowid");
        if (!stmt) {
            return evidence;
        }

        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            Evidence item;
            item.id = column_text(stmt.get(), 0);
            item.agent_id = column_text(stmt.get(), 1);
            item.type = column_text(stmt.get(), 2);
            item.severity = parse_severity(column_text(stmt.get(), 3)).value_or(Severity::Medium);
            item.title = column_text(stmt.get(), 4);
            item.description = column_text(stmt.get(), 5);
            item.raw_data = parse_document(column_text(stmt.get(), 6));
            item.status = parse_evidence_status(column_text(stmt.get(), 7)).value_or(EvidenceStatus::Open);
            item.confidence = sqlite3_column_double(stmt.get(), 8);
            item.timestamp = util::parse_iso8601(column_text(stmt.get(), 9));
            evidence.push_back(std::move(item));
        }
        return evidence;
    }

    StoreHealth health_check() {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!ensure_open()) {
            return {false, "Cannot open SQLite database " + path_};
        }

        auto stmt = prepare("SELECT 1");
        if (!stmt) {
            return {false, sqlite3_errmsg(db_)};
        }

        int rc = sqlite3_step(stmt.get());
        if (rc != SQLITE_ROW) {
            return {false, sqlite3_errmsg(db_)};
        }
        return {true, "SQLite database " + path_ + " reachable"};
    }

    bool reset() {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!ensure_open()) {
            return false;
        }

        const char* sql = R"(
            BEGIN;
            DELETE FROM events;
            DELETE FROM evidences;
            DELETE FROM threats;
            DELETE FROM agents;
            DELETE FROM system_health;
            COMMIT;
        )";

        char* err_msg = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            spdlog::error("Failed to reset database: {}", err_msg ? err_msg : "unknown error");
            sqlite3_free(err_msg);
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
            return false;
        }

        spdlog::info("All tables cleared");
        return true;
    }

private:
    // Caller holds db_mutex_
    bool open() {
        close();

        int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_URI | SQLITE_OPEN_FULLMUTEX;
        int rc = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);
        if (rc != SQLITE_OK) {
            spdlog::error("Cannot open database {}: {}", path_, db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
            close();
            return false;
        }

        if (!create_tables()) {
            close();
            return false;
        }

        spdlog::info("Database initialized at: {}", path_);
        return true;
    }

    void close() {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    bool ensure_open() {
        return db_ != nullptr || open();
    }

    bool create_tables() {
        char* err_msg = nullptr;
        if (sqlite3_exec(db_, "PRAGMA foreign_keys = ON", nullptr, nullptr, &err_msg) != SQLITE_OK) {
            spdlog::error("Failed to enable foreign keys: {}", err_msg ? err_msg : "unknown error");
            sqlite3_free(err_msg);
            return false;
        }

        if (sqlite3_exec(db_, kSchema, nullptr, nullptr, &err_msg) != SQLITE_OK) {
            spdlog::error("Failed to create tables: {}", err_msg ? err_msg : "unknown error");
            sqlite3_free(err_msg);
            return false;
        }
        return true;
    }

    StatementPtr prepare(const char* sql) {
        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
            spdlog::error("Failed to prepare statement: {}", sqlite3_errmsg(db_));
            return StatementPtr(nullptr, &sqlite3_finalize);
        }
        return StatementPtr(raw, &sqlite3_finalize);
    }

    bool step_done(sqlite3_stmt* stmt, const char* what) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            spdlog::error("Failed to {}: {}", what, sqlite3_errmsg(db_));
            return false;
        }
        return true;
    }

    std::string path_;
    int connect_attempts_;
    int connect_backoff_ms_;
    sqlite3* db_;
    mutable std::mutex db_mutex_;
};

SqliteStore::SqliteStore(std::string path, int connect_attempts, int connect_backoff_ms)
    : pImpl_(std::make_unique<Impl>(std::move(path), connect_attempts, connect_backoff_ms)) {}

SqliteStore::~SqliteStore() = default;

bool SqliteStore::connect() {
    return pImpl_->connect();
}

std::string SqliteStore::backend_name() const {
    return "sqlite";
}

std::optional<std::string> SqliteStore::save_agent(const Agent& agent) {
    return pImpl_->save_agent(agent);
}

std::optional<std::string> SqliteStore::save_threat(const Threat& threat) {
    return pImpl_->save_threat(threat);
}

std::optional<std::string> SqliteStore::save_evidence(const Evidence& evidence) {
    return pImpl_->save_evidence(evidence);
}

std::optional<std::string> SqliteStore::save_event(const Event& event) {
    return pImpl_->save_event(event);
}

std::optional<std::string> SqliteStore::save_system_health(const SystemHealthSample& sample) {
    return pImpl_->save_system_health(sample);
}

bool SqliteStore::update_threat_status(const std::string& threat_id, ThreatStatus status) {
    return pImpl_->update_threat_status(threat_id, status);
}

bool SqliteStore::update_evidence_status(const std::string& evidence_id, EvidenceStatus status) {
    return pImpl_->update_evidence_status(evidence_id, status);
}

bool SqliteStore::update_event_status(const EventRef& ref, const std::string& status) {
    return pImpl_->update_event_status(ref, status);
}

std::optional<std::vector<Event>> SqliteStore::get_events(int limit) {
    return pImpl_->get_events(limit);
}

std::vector<Agent> SqliteStore::load_agents() {
    return pImpl_->load_agents();
}

std::vector<Threat> SqliteStore::load_threats() {
    return pImpl_->load_threats();
}

std::vector<Evidence> SqliteStore::load_evidence() {
    return pImpl_->load_evidence();
}

StoreHealth SqliteStore::health_check() {
    return pImpl_->health_check();
}

bool SqliteStore::reset() {
    return pImpl_->reset();
}
