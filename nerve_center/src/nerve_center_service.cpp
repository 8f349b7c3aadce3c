#include "nerve_center_service.hpp"
#include <chrono>
#include <spdlog/spdlog.h>

NerveCenterService::NerveCenterService(const Config& config)
    : config_(config) {

    // Initialize components
    store_ = make_persistence_coordinator(config_);
    publisher_ = std::make_unique<EventPublisher>(config_);
    registry_ = std::make_unique<AgentRegistry>(*store_);
    metrics_ = std::make_unique<MetricsStore>(*registry_, static_cast<size_t>(config_.metrics_history_limit));
    findings_ = std::make_unique<FindingStore>();
    pipeline_ = std::make_unique<FindingPipeline>(*registry_, *metrics_, *findings_, *store_, *publisher_);
    aggregator_ = std::make_unique<EventAggregator>(*registry_, *findings_, *store_, *publisher_);
    sampler_ = std::make_unique<HostSampler>(config_.network_link_capacity_bps);
    meter_ = std::make_unique<IngressMeter>();
    health_monitor_ = std::make_unique<HealthMonitor>(config_, *registry_, *findings_, *store_, *publisher_, *sampler_);
    ranking_ = std::make_unique<RankingCycle>(*registry_, make_ranking_policy(config_.ranking_promotion_enabled));

    api_ = std::make_unique<HubApi>(
        config_,
        *registry_,
        *metrics_,
        *findings_,
        *pipeline_,
        *aggregator_,
        *store_,
        *publisher_,
        *health_monitor_,
        *ranking_,
        *sampler_,
        *meter_
    );
    http_server_ = std::make_unique<HttpServer>(config_, *api_, *meter_);

    health_task_ = std::make_unique<PeriodicTask>(
        "Health cycle",
        std::chrono::seconds(config_.health_cycle_interval_sec),
        [this] { health_monitor_->run_cycle(); });
    ranking_task_ = std::make_unique<PeriodicTask>(
        "Ranking cycle",
        std::chrono::seconds(config_.ranking_cycle_interval_sec),
        [this] { ranking_->run_cycle(); });
}

NerveCenterService::~NerveCenterService() {
    stop();
}

void NerveCenterService::run() {
    if (running_) {
        spdlog::warn("Nerve center is already running");
        return;
    }

    running_ = true;
    initialize();

    health_task_->start();
    ranking_task_->start();
    http_server_->start();

    spdlog::info("Nerve center started");
}

bool NerveCenterService::initialize() {
    if (!store_->connect()) {
        spdlog::error("Durable store unavailable ({}); serving from memory only", store_->backend_name());
        return false;
    }

    spdlog::info("Durable store ready ({})", store_->backend_name());
    restore_state();
    return true;
}

void NerveCenterService::stop() {
    if (!running_) {
        return;
    }

    running_ = false;
    spdlog::info("Stopping nerve center...");

    health_task_->stop();
    ranking_task_->stop();
    http_server_->stop();

    spdlog::info("Nerve center stopped");
}

void NerveCenterService::restore_state() {
    if (config_.clean_database_on_startup) {
        spdlog::warn("CLEAN_DATABASE_ON_STARTUP set, clearing durable store");
        if (!store_->reset()) {
            spdlog::error("Failed to clear durable store on startup");
        }
        return;
    }

    try {
        auto agents = store_->load_agents();
        auto threats = store_->load_threats();
        auto evidence = store_->load_evidence();
        registry_->load(agents);
        findings_->load(threats, evidence);
        spdlog::info("Restored {} agents, {} threats, {} evidence records",
                     agents.size(), threats.size(), evidence.size());
    } catch (const std::exception& e) {
        spdlog::error("Failed to restore state from durable store: {}", e.what());
    }
}
