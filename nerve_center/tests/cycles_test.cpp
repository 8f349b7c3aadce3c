#include "agent_registry.hpp"
#include "config.hpp"
#include "event_publisher.hpp"
#include "finding_store.hpp"
#include "health_monitor.hpp"
#include "host_sampler.hpp"
#include "ingress_meter.hpp"
#include "metrics_store.hpp"
#include "periodic_task.hpp"
#include "ranking_cycle.hpp"
#include "sqlite_store.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace {

void TestHealthThresholds() {
    assert(HealthMonitor::nerve_center_status(0) == HealthStatus::Healthy);
    assert(HealthMonitor::nerve_center_status(20) == HealthStatus::Healthy);
    assert(HealthMonitor::nerve_center_status(21) == HealthStatus::Warning);
    assert(HealthMonitor::nerve_center_status(51) == HealthStatus::Critical);

    assert(HealthMonitor::mesh_network_status(75.0) == HealthStatus::Healthy);
    assert(HealthMonitor::mesh_network_status(80.0) == HealthStatus::Warning);
    assert(HealthMonitor::mesh_network_status(95.0) == HealthStatus::Critical);

    assert(HealthMonitor::database_status(40.0, true) == HealthStatus::Healthy);
    assert(HealthMonitor::database_status(90.0, true) == HealthStatus::Warning);
    assert(HealthMonitor::database_status(96.0, true) == HealthStatus::Critical);
    assert(HealthMonitor::database_status(10.0, false) == HealthStatus::Critical);
}

void TestHealthCycleMarksStaleAgents() {
    Config config;
    config.agent_stale_after_sec = 120;
    SqliteStore store(":memory:", 1, 0);
    assert(store.connect());
    EventPublisher publisher(config);
    AgentRegistry registry(store);
    MetricsStore metrics(registry, 10);
    FindingStore findings;
    HostSampler sampler(config.network_link_capacity_bps);
    HealthMonitor monitor(config, registry, findings, store, publisher, sampler);

    MetricSample old_sample;
    old_sample.agent_id = "quiet";
    old_sample.timestamp = std::chrono::system_clock::now() - std::chrono::minutes(10);
    metrics.append(old_sample);
    registry.get_or_create("fresh");

    assert(!monitor.last_cycle());
    monitor.run_cycle();
    assert(monitor.last_cycle());

    assert(registry.get("quiet").status == AgentStatus::Offline);
    assert(registry.get("fresh").status == AgentStatus::Active);
}

void TestHealthSnapshotComponents() {
    Config config;
    SqliteStore store("/nonexistent-dir/health.db", 1, 0);
    EventPublisher publisher(config);
    AgentRegistry registry(store);
    FindingStore findings;
    HostSampler sampler(config.network_link_capacity_bps);
    HealthMonitor monitor(config, registry, findings, store, publisher, sampler);

    auto samples = monitor.snapshot();
    assert(samples.size() == 3);
    assert(samples[0].component == "nerve_center");
    assert(samples[0].status == HealthStatus::Healthy);
    assert(samples[1].component == "mesh_network");
    assert(samples[2].component == "database");
    assert(samples[2].status == HealthStatus::Critical);
    assert(samples[2].error_message);
}

void TestHostSamplerRanges() {
    HostSampler sampler(125000000);
    auto first = sampler.sample();
    assert(first.cpu == 0.0);
    assert(first.network == 0.0);
    assert(first.memory >= 0.0 && first.memory <= 100.0);
    assert(first.disk >= 0.0 && first.disk <= 100.0);
    assert(first.established_connections >= 0);

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    auto second = sampler.sample();
    assert(second.cpu >= 0.0 && second.cpu <= 100.0);
    assert(second.network >= 0.0 && second.network <= 100.0);
    assert(second.bytes_in >= first.bytes_in);
}

Agent MakeAgent(double cpu, int threats, int rank, AgentStatus status = AgentStatus::Active) {
    Agent agent;
    agent.id = "a";
    agent.cpu = cpu;
    agent.threat_count = threats;
    agent.rank = rank;
    agent.status = status;
    return agent;
}

void TestRankingPolicies() {
    NoopRankingPolicy noop;
    assert(noop.next_rank(MakeAgent(5.0, 4, 2), 95.0) == 2);

    PromotionRankingPolicy promotion;
    assert(promotion.next_rank(MakeAgent(5.0, 1, 2), 95.0) == 3);
    assert(promotion.next_rank(MakeAgent(5.0, 1, 4), 95.0) == 4);
    assert(promotion.next_rank(MakeAgent(5.0, 0, 2), 95.0) == 2);
    assert(promotion.next_rank(MakeAgent(30.0, 3, 2), 70.0) == 2);

    assert(make_ranking_policy(false)->name() == "noop");
    assert(make_ranking_policy(true)->name() == "promotion");
}

void TestRankingCycleOnlyTouchesActiveAgents() {
    SqliteStore store(":memory:", 1, 0);
    assert(store.connect());
    AgentRegistry registry(store);
    registry.get_or_create("busy");
    registry.get_or_create("idle");
    registry.increment_threat_count("busy", 2);
    registry.increment_threat_count("idle", 1);
    registry.mark_stale(std::chrono::system_clock::now() + std::chrono::seconds(1));
    registry.upsert("busy", AgentUpdate{});

    RankingCycle promoting(registry, make_ranking_policy(true));
    assert(promoting.run_cycle() == 1);
    assert(registry.get("busy").rank == 2);
    assert(registry.get("idle").rank == 1);

    auto summary = promoting.summary();
    assert(summary["policy"] == "promotion");
    assert(summary["last_changes"] == 1);
    assert(summary["total_changes"] == 1);
    assert(summary["last_run"].is_string());

    RankingCycle disabled(registry, make_ranking_policy(false));
    assert(disabled.run_cycle() == 0);
    assert(registry.get("busy").rank == 2);
}

void TestPeriodicTaskRunsAndStops() {
    std::atomic<int> runs{0};
    PeriodicTask task("counter", std::chrono::milliseconds(5), [&runs] {
        if (++runs == 2) {
            throw std::runtime_error("iteration failure is logged");
        }
    });

    task.start();
    assert(task.running());
    for (int i = 0; i < 200 && runs < 4; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    task.stop();
    assert(!task.running());
    assert(runs >= 4);

    int after_stop = runs;
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    assert(runs == after_stop);
}

void TestPeriodicTaskFirstRunIsImmediate() {
    std::atomic<int> runs{0};
    PeriodicTask task("hourly", std::chrono::hours(1), [&runs] { ++runs; });

    task.start();
    for (int i = 0; i < 200 && runs == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    assert(runs == 1);

    // stop() wakes the interval wait instead of sleeping it out
    auto before = std::chrono::steady_clock::now();
    task.stop();
    assert(std::chrono::steady_clock::now() - before < std::chrono::seconds(5));
    assert(runs == 1);
}

void TestIngressMeterChannels() {
    assert(IngressMeter::channel_for("POST", "/agents/register") == "Agent Registration");
    assert(IngressMeter::channel_for("POST", "/agents/a1/metrics") == "Metrics Ingest");
    assert(IngressMeter::channel_for("GET", "/agents/a1/metrics") == "Operator Queries");
    assert(IngressMeter::channel_for("POST", "/evidence") == "Finding Ingest");
    assert(IngressMeter::channel_for("POST", "/events/threat-1/acknowledge") == "Event Feed");
    assert(IngressMeter::channel_for("GET", "/health") == "Operator Queries");

    IngressMeter meter;
    meter.record("Metrics Ingest", std::chrono::microseconds(2000), 200);
    meter.record("Metrics Ingest", std::chrono::microseconds(4000), 500);
    meter.record("Event Feed", std::chrono::microseconds(3000), 404);

    auto stats = meter.stats();
    assert(stats.total_requests == 3);
    assert(stats.latency_ms == 3.0);
    assert(stats.error_ratio > 0.33 && stats.error_ratio < 0.34);
    assert(stats.message_rate > 0.0);
    assert(stats.channels.size() == 5);

    for (const auto& channel : stats.channels) {
        if (channel.name == "Metrics Ingest") {
            assert(channel.messages == 2);
            assert(channel.errors == 1);
            assert(channel.status == "Warning");
        } else if (channel.name == "Event Feed") {
            assert(channel.errors == 0);
            assert(channel.status == "Active");
        } else {
            assert(channel.status == "Idle");
        }
    }
}

void TestIngressMeterWindowExpires() {
    IngressMeter meter(std::chrono::seconds(1));
    meter.record("Event Feed", std::chrono::microseconds(100), 200);
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));

    auto stats = meter.stats();
    assert(stats.total_requests == 1);
    assert(stats.message_rate == 0.0);
    assert(stats.latency_ms == 0.0);
}

} // namespace

int main() {
    TestHealthThresholds();
    TestHealthCycleMarksStaleAgents();
    TestHealthSnapshotComponents();
    TestHostSamplerRanges();
    TestRankingPolicies();
    TestRankingCycleOnlyTouchesActiveAgents();
    TestPeriodicTaskRunsAndStops();
    TestPeriodicTaskFirstRunIsImmediate();
    TestIngressMeterChannels();
    TestIngressMeterWindowExpires();

    std::cout << "nerve_center_unit_cycles: pass\n";
    return 0;
}
