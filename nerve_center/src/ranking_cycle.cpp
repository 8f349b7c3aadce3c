#include "ranking_cycle.hpp"
#include "util.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

int NoopRankingPolicy::next_rank(const Agent& agent, double /*performance*/) const {
    return agent.rank;
}

int PromotionRankingPolicy::next_rank(const Agent& agent, double performance) const {
    if (performance > kPerformanceThreshold && agent.threat_count > 0) {
        return std::min(agent.rank + 1, kMaxRank);
    }
    return agent.rank;
}

std::unique_ptr<RankingPolicy> make_ranking_policy(bool promotion_enabled) {
    if (promotion_enabled) {
        return std::make_unique<PromotionRankingPolicy>();
    }
    return std::make_unique<NoopRankingPolicy>();
}

RankingCycle::RankingCycle(AgentRegistry& registry, std::unique_ptr<RankingPolicy> policy)
    : registry_(registry), policy_(std::move(policy)) {
    spdlog::info("Ranking policy: {}", policy_->name());
}

int RankingCycle::run_cycle() {
    int changes = 0;
    for (const auto& agent : registry_.list()) {
        if (agent.status != AgentStatus::Active) {
            continue;
        }

        double performance = 100.0 - agent.cpu;
        int rank = policy_->next_rank(agent, performance);
        if (rank != agent.rank) {
            spdlog::info("Agent {} rank R{} -> R{} (performance {:.1f})",
                         agent.id, agent.rank, rank, performance);
            registry_.set_rank(agent.id, rank);
            ++changes;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    last_run_ = std::chrono::system_clock::now();
    last_changes_ = changes;
    total_changes_ += changes;
    return changes;
}

nlohmann::json RankingCycle::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {
        {"policy", policy_->name()},
        {"last_run", last_run_ ? nlohmann::json(util::format_timestamp(*last_run_)) : nlohmann::json(nullptr)},
        {"last_changes", last_changes_},
        {"total_changes", total_changes_}
    };
}
