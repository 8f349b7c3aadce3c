#include "finding_store.hpp"
#include <spdlog/spdlog.h>

bool FindingStore::add_threat(const Threat& threat) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (threats_.count(threat.id) > 0) {
        return false;
    }
    threats_.emplace(threat.id, Entry<Threat>{threat, next_sequence_++});
    threat_order_.push_back(threat.id);
    return true;
}

bool FindingStore::add_evidence(const Evidence& evidence) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (evidence_.count(evidence.id) > 0) {
        return false;
    }
    evidence_.emplace(evidence.id, Entry<Evidence>{evidence, next_sequence_++});
    return true;
}

std::optional<Threat> FindingStore::threat(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = threats_.find(id);
    if (it == threats_.end()) {
        return std::nullopt;
    }
    return it->second.record;
}

std::optional<Evidence> FindingStore::evidence(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = evidence_.find(id);
    if (it == evidence_.end()) {
        return std::nullopt;
    }
    return it->second.record;
}

std::vector<Threat> FindingStore::threats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Threat> result;
    result.reserve(threat_order_.size());
    for (const auto& id : threat_order_) {
        result.push_back(threats_.at(id).record);
    }
    return result;
}

std::optional<ThreatStatus> FindingStore::acknowledge_threat(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = threats_.find(id);
    if (it == threats_.end()) {
        return std::nullopt;
    }
    ThreatStatus previous = it->second.record.status;
    if (previous == ThreatStatus::Active) {
        it->second.record.status = ThreatStatus::Acknowledged;
    }
    return previous;
}

std::optional<EvidenceStatus> FindingStore::acknowledge_evidence(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = evidence_.find(id);
    if (it == evidence_.end()) {
        return std::nullopt;
    }
    EvidenceStatus previous = it->second.record.status;
    if (previous == EvidenceStatus::Open) {
        it->second.record.status = EvidenceStatus::Acknowledged;
    }
    return previous;
}

std::vector<Event> FindingStore::events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Event> result;
    result.reserve(threats_.size() + evidence_.size());
    for (const auto& [id, entry] : threats_) {
        result.push_back(Event::from_threat(entry.record, entry.sequence));
    }
    for (const auto& [id, entry] : evidence_) {
        result.push_back(Event::from_evidence(entry.record, entry.sequence));
    }
    return result;
}

std::optional<Event> FindingStore::event(const EventRef& ref) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ref.kind == EventKind::Threat) {
        auto it = threats_.find(ref.id);
        if (it != threats_.end()) {
            return Event::from_threat(it->second.record, it->second.sequence);
        }
    } else {
        auto it = evidence_.find(ref.id);
        if (it != evidence_.end()) {
            return Event::from_evidence(it->second.record, it->second.sequence);
        }
    }
    return std::nullopt;
}

FindingCounts FindingStore::counts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    FindingCounts counts;
    counts.threats_total = threats_.size();
    for (const auto& [id, entry] : threats_) {
        const Threat& t = entry.record;
        if (t.status == ThreatStatus::Active) {
            ++counts.threats_active;
            if (t.severity == Severity::Critical) {
                ++counts.threats_critical_active;
            }
        } else if (t.status == ThreatStatus::Acknowledged) {
            ++counts.threats_acknowledged;
        }
    }

    counts.evidence_total = evidence_.size();
    for (const auto& [id, entry] : evidence_) {
        if (entry.record.status == EvidenceStatus::Open) {
            ++counts.evidence_open;
        } else if (entry.record.status == EvidenceStatus::Acknowledged) {
            ++counts.evidence_acknowledged;
        }
    }
    return counts;
}

void FindingStore::load(const std::vector<Threat>& threats, const std::vector<Evidence>& evidence) {
    for (const auto& threat : threats) {
        if (!add_threat(threat)) {
            spdlog::warn("Skipping duplicate threat {} from durable store", threat.id);
        }
    }
    for (const auto& item : evidence) {
        if (!add_evidence(item)) {
            spdlog::warn("Skipping duplicate evidence {} from durable store", item.id);
        }
    }
    spdlog::info("Loaded {} threats and {} evidence records from durable store",
                 threats.size(), evidence.size());
}

void FindingStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    threats_.clear();
    evidence_.clear();
    threat_order_.clear();
    next_sequence_ = 0;
}
