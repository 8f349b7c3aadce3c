#include "config.hpp"
#include "util.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

Config Config::from_env() {
    Config config;

    // Service
    config.service_name = util::get_env_var("SERVICE_NAME", config.service_name);
    config.log_level = util::get_env_var("LOG_LEVEL", config.log_level);

    // HTTP
    config.listen_addr = util::get_env_var("LISTEN_ADDR", config.listen_addr);
    config.listen_port = util::get_env_int("LISTEN_PORT", config.listen_port);
    config.http_threads = util::get_env_int("HTTP_THREADS", config.http_threads);

    // Database
    config.database_url = util::get_env_var("DATABASE_URL", config.database_url);
    config.clean_database_on_startup = util::get_env_bool("CLEAN_DATABASE_ON_STARTUP", config.clean_database_on_startup);
    config.db_connect_attempts = util::get_env_int("DB_CONNECT_ATTEMPTS", config.db_connect_attempts);
    config.db_connect_backoff_ms = util::get_env_int("DB_CONNECT_BACKOFF_MS", config.db_connect_backoff_ms);

    // Redis
    config.redis_url = util::get_env_var("REDIS_URL", config.redis_url);
    config.redis_events_channel = util::get_env_var("REDIS_EVENTS_CHANNEL", config.redis_events_channel);

    // Registry / metrics
    config.metrics_history_limit = util::get_env_int("METRICS_HISTORY_LIMIT", config.metrics_history_limit);
    config.agent_stale_after_sec = util::get_env_int("AGENT_STALE_AFTER_SEC", config.agent_stale_after_sec);

    // Cycles
    config.health_cycle_interval_sec = util::get_env_int("HEALTH_CYCLE_INTERVAL_SEC", config.health_cycle_interval_sec);
    config.ranking_cycle_interval_sec = util::get_env_int("RANKING_CYCLE_INTERVAL_SEC", config.ranking_cycle_interval_sec);
    config.ranking_promotion_enabled = util::get_env_bool("RANKING_PROMOTION_ENABLED", config.ranking_promotion_enabled);

    std::string capacity = util::get_env_var("NETWORK_LINK_CAPACITY_BPS");
    if (!capacity.empty()) {
        try {
            config.network_link_capacity_bps = std::stoll(capacity);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid integer value for env var NETWORK_LINK_CAPACITY_BPS: " + capacity);
        }
    }

    return config;
}

void Config::validate() const {
    if (database_url.empty()) {
        throw std::runtime_error("DATABASE_URL cannot be empty");
    }

    if (listen_port <= 0 || listen_port > 65535) {
        throw std::runtime_error("LISTEN_PORT must be between 1 and 65535");
    }

    if (http_threads <= 0) {
        throw std::runtime_error("HTTP_THREADS must be positive");
    }

    if (db_connect_attempts <= 0) {
        throw std::runtime_error("DB_CONNECT_ATTEMPTS must be positive");
    }

    if (db_connect_backoff_ms < 0) {
        throw std::runtime_error("DB_CONNECT_BACKOFF_MS cannot be negative");
    }

    if (metrics_history_limit <= 0) {
        throw std::runtime_error("METRICS_HISTORY_LIMIT must be positive");
    }

    if (health_cycle_interval_sec <= 0 || ranking_cycle_interval_sec <= 0) {
        throw std::runtime_error("Cycle intervals must be positive");
    }

    if (network_link_capacity_bps <= 0) {
        throw std::runtime_error("NETWORK_LINK_CAPACITY_BPS must be positive");
    }

    spdlog::info("Configuration validated successfully");
}
