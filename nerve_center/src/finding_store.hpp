#pragma once

#include "types.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct FindingCounts {
    size_t threats_total = 0;
    size_t threats_active = 0;
    size_t threats_acknowledged = 0;
    size_t threats_critical_active = 0;
    size_t evidence_total = 0;
    size_t evidence_open = 0;
    size_t evidence_acknowledged = 0;
};

// In-memory threat and evidence collections. Each record gets a sequence
// number on insert so the event projection can break timestamp ties by
// insertion order.
class FindingStore {
public:
    // Insert-only; false when the id is already recorded
    bool add_threat(const Threat& threat);
    bool add_evidence(const Evidence& evidence);

    std::optional<Threat> threat(const std::string& id) const;
    std::optional<Evidence> evidence(const std::string& id) const;
    std::vector<Threat> threats() const;

    // Moves active/open records to acknowledged; acknowledged and resolved
    // records are left as they are. Returns the status held before the call,
    // std::nullopt for unknown ids.
    std::optional<ThreatStatus> acknowledge_threat(const std::string& id);
    std::optional<EvidenceStatus> acknowledge_evidence(const std::string& id);

    std::vector<Event> events() const;
    std::optional<Event> event(const EventRef& ref) const;

    FindingCounts counts() const;

    void load(const std::vector<Threat>& threats, const std::vector<Evidence>& evidence);
    void clear();

private:
    template <typename T>
    struct Entry {
        T record;
        uint64_t sequence = 0;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry<Threat>> threats_;
    std::unordered_map<std::string, Entry<Evidence>> evidence_;
    std::vector<std::string> threat_order_;
    uint64_t next_sequence_ = 0;
};
