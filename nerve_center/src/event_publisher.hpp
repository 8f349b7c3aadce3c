#pragma once

#include "config.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

// Best-effort fan-out of hub notifications to a Redis pub/sub channel.
// Message shape: {"type": ..., "data": {...}, "timestamp": ISO8601}.
// Disabled when REDIS_URL is empty; publishing then is a no-op.
class EventPublisher {
public:
    explicit EventPublisher(const Config& config);
    ~EventPublisher();

    bool enabled() const;

    // "disabled", "connected" or "disconnected"
    std::string status();

    bool publish(const std::string& type, const nlohmann::json& data);

    // Non-copyable
    EventPublisher(const EventPublisher&) = delete;
    EventPublisher& operator=(const EventPublisher&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};
