#include "event_aggregator.hpp"
#include "errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

EventAggregator::EventAggregator(AgentRegistry& registry,
                                 FindingStore& findings,
                                 PersistenceCoordinator& store,
                                 EventPublisher& publisher)
    : registry_(registry), findings_(findings), store_(store), publisher_(publisher) {}

std::vector<Event> EventAggregator::list(size_t limit) const {
    std::vector<Event> events = findings_.events();
    std::sort(events.begin(), events.end(), [](const Event& a, const Event& b) {
        if (a.timestamp != b.timestamp) {
            return a.timestamp > b.timestamp;
        }
        return a.sequence > b.sequence;
    });

    if (events.size() > limit) {
        events.resize(limit);
    }
    return events;
}

Event EventAggregator::get(const std::string& event_id) const {
    auto event = findings_.event(resolve(event_id));
    if (!event) {
        throw NotFoundError("Event not found: " + event_id);
    }
    return *event;
}

AcknowledgeResult EventAggregator::acknowledge(const std::string& event_id) {
    EventRef ref = resolve(event_id);
    AcknowledgeResult result;
    result.ref = ref;

    if (ref.kind == EventKind::Threat) {
        auto previous = findings_.acknowledge_threat(ref.id);
        if (!previous) {
            throw NotFoundError("Event not found: " + event_id);
        }
        result.changed = *previous == ThreatStatus::Active;
        result.status = to_string(result.changed ? ThreatStatus::Acknowledged : *previous);

        if (result.changed) {
            auto threat = findings_.threat(ref.id);
            if (threat && threat->agent_id) {
                registry_.increment_threat_count(*threat->agent_id, -1);
            }
            if (!store_.update_threat_status(ref.id, ThreatStatus::Acknowledged)) {
                spdlog::warn("Threat {} acknowledged in memory only", ref.id);
            }
        }
    } else {
        auto previous = findings_.acknowledge_evidence(ref.id);
        if (!previous) {
            throw NotFoundError("Event not found: " + event_id);
        }
        result.changed = *previous == EvidenceStatus::Open;
        result.status = to_string(result.changed ? EvidenceStatus::Acknowledged : *previous);

        if (result.changed && !store_.update_evidence_status(ref.id, EvidenceStatus::Acknowledged)) {
            spdlog::warn("Evidence {} acknowledged in memory only", ref.id);
        }
    }

    if (!result.changed) {
        spdlog::debug("Event {} already {}", ref.public_id(), result.status);
        return result;
    }

    if (!store_.update_event_status(ref, result.status)) {
        spdlog::warn("Event {} status not persisted", ref.storage_id());
    }

    spdlog::info("Event {} acknowledged", ref.public_id());
    publisher_.publish("event_acknowledged", {
        {"event_id", ref.public_id()},
        {"type", to_string(ref.kind)},
        {"status", result.status}
    });
    return result;
}

EventRef EventAggregator::resolve(const std::string& event_id) const {
    auto ref = EventRef::parse(event_id);
    if (!ref) {
        throw NotFoundError("Event not found: " + event_id);
    }
    return *ref;
}
