#include "agent_registry.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace {

constexpr double kWarningThreshold = 90.0;
constexpr int kMinRank = 0;
constexpr int kMaxRank = 4;

AgentStatus status_for_load(double cpu, double memory) {
    return (cpu > kWarningThreshold || memory > kWarningThreshold) ? AgentStatus::Warning
                                                                   : AgentStatus::Active;
}

} // namespace

AgentRegistry::AgentRegistry(PersistenceCoordinator& store)
    : store_(store) {}

Agent AgentRegistry::upsert(const std::string& id, const AgentUpdate& update) {
    Agent snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = agents_.find(id);
        Agent& agent = it != agents_.end() ? it->second : create_locked(id, "unknown");

        if (update.name && !update.name->empty()) agent.name = *update.name;
        if (update.hostname && !update.hostname->empty()) agent.hostname = *update.hostname;
        if (update.ip_address && !update.ip_address->empty()) agent.ip_address = *update.ip_address;
        if (update.os_type && !update.os_type->empty()) agent.os_type = *update.os_type;
        if (update.version && !update.version->empty()) agent.version = *update.version;

        if (agent.status == AgentStatus::Offline) {
            agent.status = AgentStatus::Active;
        }
        agent.last_seen = std::chrono::system_clock::now();
        snapshot = agent;
    }

    spdlog::info("Agent {} registered ({})", snapshot.id, snapshot.hostname);
    persist(snapshot);
    return snapshot;
}

Agent AgentRegistry::get_or_create(const std::string& id) {
    Agent snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = agents_.find(id);
        if (it != agents_.end()) {
            return it->second;
        }
        snapshot = create_locked(id, "agent-" + util::prefix_of(id, 8));
    }

    spdlog::info("Auto-provisioned agent {}", id);
    persist(snapshot);
    return snapshot;
}

Agent AgentRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) {
        throw NotFoundError("Agent not found: " + id);
    }
    return it->second;
}

bool AgentRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return agents_.count(id) > 0;
}

std::vector<Agent> AgentRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Agent> result;
    result.reserve(order_.size());
    for (const auto& id : order_) {
        result.push_back(agents_.at(id));
    }
    return result;
}

size_t AgentRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return agents_.size();
}

void AgentRegistry::increment_threat_count(const std::string& id, int delta) {
    Agent snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = agents_.find(id);
        if (it == agents_.end()) {
            spdlog::warn("Threat count update for unknown agent {}", id);
            return;
        }
        it->second.threat_count = std::max(0, it->second.threat_count + delta);
        snapshot = it->second;
    }

    spdlog::debug("Agent {} threat count now {}", id, snapshot.threat_count);
    persist(snapshot);
}

void AgentRegistry::set_rank(const std::string& id, int rank) {
    Agent snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = agents_.find(id);
        if (it == agents_.end()) {
            spdlog::warn("Rank update for unknown agent {}", id);
            return;
        }
        int clamped = std::max(kMinRank, std::min(kMaxRank, rank));
        if (it->second.rank == clamped) {
            return;
        }
        it->second.rank = clamped;
        snapshot = it->second;
    }

    spdlog::info("Agent {} rank set to R{}", id, snapshot.rank);
    persist(snapshot);
}

std::vector<std::string> AgentRegistry::mark_stale(TimePoint cutoff) {
    std::vector<Agent> changed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& id : order_) {
            Agent& agent = agents_.at(id);
            if (agent.status != AgentStatus::Offline && agent.last_seen < cutoff) {
                agent.status = AgentStatus::Offline;
                changed.push_back(agent);
            }
        }
    }

    std::vector<std::string> ids;
    for (const auto& agent : changed) {
        spdlog::warn("Agent {} marked offline, last seen {}", agent.id,
                     util::format_timestamp(agent.last_seen));
        persist(agent);
        ids.push_back(agent.id);
    }
    return ids;
}

Agent AgentRegistry::apply_metrics(const MetricSample& sample,
                                   const std::function<void(const MetricSample&)>& under_lock) {
    Agent snapshot;
    bool created = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = agents_.find(sample.agent_id);
        created = it == agents_.end();
        Agent& agent = created ? create_locked(sample.agent_id, "agent-" + util::prefix_of(sample.agent_id, 8))
                               : it->second;

        agent.cpu = util::clamp_percent(sample.cpu);
        agent.memory = util::clamp_percent(sample.memory);
        agent.last_seen = sample.timestamp;
        agent.status = status_for_load(agent.cpu, agent.memory);

        under_lock(sample);
        snapshot = agent;
    }

    if (created) {
        spdlog::info("Auto-provisioned agent {} from metrics", sample.agent_id);
    }
    persist(snapshot);
    return snapshot;
}

void AgentRegistry::load(const std::vector<Agent>& agents) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& agent : agents) {
        if (agents_.count(agent.id) == 0) {
            order_.push_back(agent.id);
        }
        Agent& stored = agents_[agent.id];
        stored = agent;
        stored.rank = std::max(kMinRank, std::min(kMaxRank, stored.rank));
        stored.cpu = util::clamp_percent(stored.cpu);
        stored.memory = util::clamp_percent(stored.memory);
        stored.threat_count = std::max(0, stored.threat_count);
    }
    spdlog::info("Loaded {} agents from durable store", agents.size());
}

void AgentRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    agents_.clear();
    order_.clear();
}

Agent& AgentRegistry::create_locked(const std::string& id, const std::string& hostname) {
    Agent agent;
    agent.id = id;
    agent.name = "Agent-" + util::prefix_of(id, 8);
    agent.hostname = hostname;
    agent.ip_address = "0.0.0.0";
    agent.os_type = "unknown";
    agent.last_seen = std::chrono::system_clock::now();

    order_.push_back(id);
    auto result = agents_.emplace(id, std::move(agent));
    return result.first->second;
}

void AgentRegistry::persist(const Agent& agent) const {
    if (!store_.save_agent(agent)) {
        spdlog::warn("Agent {} kept in memory only, durable write failed", agent.id);
    }
}
