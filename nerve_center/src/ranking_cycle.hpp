#pragma once

#include "agent_registry.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// Decides an agent's next rank from its current state.
// performance is 100 - cpu.
class RankingPolicy {
public:
    virtual ~RankingPolicy() = default;
    virtual std::string name() const = 0;
    virtual int next_rank(const Agent& agent, double performance) const = 0;
};

// Leaves every rank unchanged
class NoopRankingPolicy : public RankingPolicy {
public:
    std::string name() const override { return "noop"; }
    int next_rank(const Agent& agent, double performance) const override;
};

// Promotes agents that are lightly loaded and have caught threats, up to R4
class PromotionRankingPolicy : public RankingPolicy {
public:
    static constexpr double kPerformanceThreshold = 80.0;
    static constexpr int kMaxRank = 4;

    std::string name() const override { return "promotion"; }
    int next_rank(const Agent& agent, double performance) const override;
};

std::unique_ptr<RankingPolicy> make_ranking_policy(bool promotion_enabled);

class RankingCycle {
public:
    RankingCycle(AgentRegistry& registry, std::unique_ptr<RankingPolicy> policy);

    // Returns the number of agents whose rank changed
    int run_cycle();

    nlohmann::json summary() const;

private:
    AgentRegistry& registry_;
    std::unique_ptr<RankingPolicy> policy_;

    mutable std::mutex mutex_;
    std::optional<TimePoint> last_run_;
    int last_changes_ = 0;
    int total_changes_ = 0;
};
