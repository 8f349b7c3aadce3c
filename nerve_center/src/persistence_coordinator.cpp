#include "persistence_coordinator.hpp"
#include "postgres_store.hpp"
#include "sqlite_store.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::unique_ptr<PersistenceCoordinator> make_persistence_coordinator(const Config& config) {
    const std::string& url = config.database_url;

    if (util::starts_with(url, "postgresql://") || util::starts_with(url, "postgres://")) {
        spdlog::info("Using PostgreSQL durable store");
        return std::make_unique<PostgresStore>(url, config.db_connect_attempts, config.db_connect_backoff_ms);
    }

    std::string path;
    if (util::starts_with(url, "sqlite://")) {
        path = url.substr(std::string("sqlite://").size());
    } else if (util::starts_with(url, "file:") || url == ":memory:") {
        path = url;
    } else {
        throw std::runtime_error("Unsupported DATABASE_URL scheme: " + url);
    }

    if (path.empty()) {
        throw std::runtime_error("DATABASE_URL is missing a SQLite path: " + url);
    }

    spdlog::info("Using SQLite durable store at {}", path);
    return std::make_unique<SqliteStore>(path, config.db_connect_attempts, config.db_connect_backoff_ms);
}
