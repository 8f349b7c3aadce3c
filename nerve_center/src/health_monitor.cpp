#include "health_monitor.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

HealthMonitor::HealthMonitor(const Config& config,
                             AgentRegistry& registry,
                             FindingStore& findings,
                             PersistenceCoordinator& store,
                             EventPublisher& publisher,
                             HostSampler& sampler)
    : config_(config),
      registry_(registry),
      findings_(findings),
      store_(store),
      publisher_(publisher),
      sampler_(sampler) {}

HealthStatus HealthMonitor::nerve_center_status(size_t active_threats) {
    if (active_threats > 50) return HealthStatus::Critical;
    if (active_threats > 20) return HealthStatus::Warning;
    return HealthStatus::Healthy;
}

HealthStatus HealthMonitor::mesh_network_status(double network_load) {
    if (network_load > 90.0) return HealthStatus::Critical;
    if (network_load > 75.0) return HealthStatus::Warning;
    return HealthStatus::Healthy;
}

HealthStatus HealthMonitor::database_status(double disk_usage, bool store_healthy) {
    if (!store_healthy || disk_usage > 95.0) return HealthStatus::Critical;
    if (disk_usage > 85.0) return HealthStatus::Warning;
    return HealthStatus::Healthy;
}

std::vector<SystemHealthSample> HealthMonitor::snapshot() {
    return build(sampler_.sample(), store_.health_check(), findings_.counts());
}

void HealthMonitor::run_cycle() {
    auto samples = snapshot();

    for (const auto& sample : samples) {
        if (!store_.save_system_health(sample)) {
            spdlog::warn("Health sample for {} not persisted", sample.component);
        }

        if (sample.status == HealthStatus::Critical) {
            spdlog::warn("Component {} is critical: {}", sample.component,
                         sample.error_message.value_or("threshold exceeded"));
            publisher_.publish("system_alert", sample.to_json());
        }
    }

    auto cutoff = std::chrono::system_clock::now() - std::chrono::seconds(config_.agent_stale_after_sec);
    auto stale = registry_.mark_stale(cutoff);
    for (const auto& id : stale) {
        publisher_.publish("agent_update", {{"agent_id", id}, {"status", "offline"}});
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_cycle_ = std::chrono::system_clock::now();
    }
    spdlog::debug("Health cycle complete, {} agents marked offline", stale.size());
}

std::optional<TimePoint> HealthMonitor::last_cycle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_cycle_;
}

std::vector<SystemHealthSample> HealthMonitor::build(const HostSample& host, const StoreHealth& store_health,
                                                     const FindingCounts& counts) const {
    auto now = std::chrono::system_clock::now();
    std::vector<SystemHealthSample> samples;

    SystemHealthSample hub;
    hub.component = "nerve_center";
    hub.status = nerve_center_status(counts.threats_active);
    hub.cpu = host.cpu;
    hub.memory = host.memory;
    hub.disk = host.disk;
    hub.network = host.network;
    hub.uptime_seconds = host.uptime_seconds;
    hub.last_check = now;
    if (hub.status != HealthStatus::Healthy) {
        hub.error_message = std::to_string(counts.threats_active) + " active threats";
    }
    samples.push_back(hub);

    SystemHealthSample mesh = hub;
    mesh.component = "mesh_network";
    mesh.status = mesh_network_status(host.network);
    mesh.error_message.reset();
    if (mesh.status != HealthStatus::Healthy) {
        mesh.error_message = fmt::format("Network load at {:.1f}% of link capacity", host.network);
    }
    samples.push_back(mesh);

    SystemHealthSample database = hub;
    database.component = "database";
    database.status = database_status(host.disk, store_health.healthy);
    database.error_message.reset();
    if (!store_health.healthy) {
        database.error_message = store_health.detail;
    } else if (database.status != HealthStatus::Healthy) {
        database.error_message = fmt::format("Disk usage at {:.1f}%", host.disk);
    }
    samples.push_back(database);

    return samples;
}
