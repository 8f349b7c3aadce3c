#pragma once

#include "agent_registry.hpp"
#include "event_publisher.hpp"
#include "finding_store.hpp"
#include "persistence_coordinator.hpp"
#include "types.hpp"
#include <string>
#include <vector>

struct AcknowledgeResult {
    EventRef ref;
    std::string status;
    // False when the event was already acknowledged or resolved
    bool changed = false;
};

// Unified, newest-first view over threats and evidence
class EventAggregator {
public:
    EventAggregator(AgentRegistry& registry,
                    FindingStore& findings,
                    PersistenceCoordinator& store,
                    EventPublisher& publisher);

    // Sorted by timestamp descending, ties newest insert first
    std::vector<Event> list(size_t limit) const;

    // Accepts "threat-<id>", "evidence-<id>" and the "event-" prefixed forms.
    // Throws NotFoundError.
    Event get(const std::string& event_id) const;

    // Idempotent. Throws NotFoundError.
    AcknowledgeResult acknowledge(const std::string& event_id);

private:
    EventRef resolve(const std::string& event_id) const;

    AgentRegistry& registry_;
    FindingStore& findings_;
    PersistenceCoordinator& store_;
    EventPublisher& publisher_;
};
