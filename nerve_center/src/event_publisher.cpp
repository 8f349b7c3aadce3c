#include "event_publisher.hpp"
#include "util.hpp"
#include <sw/redis++/redis++.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <mutex>

using json = nlohmann::json;

class EventPublisher::Impl {
public:
    explicit Impl(const Config& config)
        : redis_url_(config.redis_url),
          channel_(config.redis_events_channel),
          backoff_ms_(1000),
          retry_count_(0) {
        if (enabled()) {
            std::lock_guard<std::mutex> lock(mutex_);
            connect();
        } else {
            spdlog::info("REDIS_URL not set, event publishing disabled");
        }
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(mutex_);
        disconnect();
    }

    bool enabled() const {
        return !redis_url_.empty();
    }

    std::string status() {
        if (!enabled()) {
            return "disabled";
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return ping() ? "connected" : "disconnected";
    }

    bool publish(const std::string& type, const json& data) {
        if (!enabled()) {
            return false;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (!ensure_connection_locked()) {
            spdlog::debug("Dropping {} notification, Redis unavailable", type);
            return false;
        }

        try {
            json message = {
                {"type", type},
                {"data", data},
                {"timestamp", util::current_iso8601()}
            };
            long long receivers = redis_->publish(channel_, message.dump());
            spdlog::debug("Published {} to {} ({} receivers)", type, channel_, receivers);
            return true;
        } catch (const sw::redis::Error& e) {
            spdlog::error("Failed to publish {}: {}", type, e.what());
            redis_.reset();
            return false;
        }
    }

private:
    // Caller holds mutex_ for everything below

    bool connect() {
        try {
            redis_ = std::make_unique<sw::redis::Redis>(redis_url_);
            redis_->ping();
            spdlog::info("Connected to Redis at {}", redis_url_);
            backoff_ms_ = 1000;
            retry_count_ = 0;
            return true;
        } catch (const sw::redis::Error& e) {
            spdlog::error("Failed to connect to Redis: {}", e.what());
            redis_.reset();
            return false;
        }
    }

    void disconnect() {
        if (redis_) {
            redis_.reset();
            spdlog::info("Disconnected from Redis");
        }
    }

    bool ping() const {
        if (!redis_) return false;

        try {
            redis_->ping();
            return true;
        } catch (const sw::redis::Error&) {
            return false;
        }
    }

    bool ensure_connection_locked() {
        if (redis_) {
            return true;
        }

        auto now = std::chrono::steady_clock::now();
        if (std::chrono::duration_cast<std::chrono::milliseconds>(
                now - last_connection_attempt_).count() < backoff_ms_) {
            return false;
        }

        last_connection_attempt_ = now;
        if (connect()) {
            spdlog::info("Redis connection restored");
            return true;
        }

        spdlog::warn("Redis reconnection failed (attempt {})", ++retry_count_);
        // Exponential backoff with cap
        backoff_ms_ = std::min(backoff_ms_ * 2, 30000);
        return false;
    }

    std::string redis_url_;
    std::string channel_;
    std::unique_ptr<sw::redis::Redis> redis_;
    mutable std::mutex mutex_;

    // Reconnection throttle
    std::chrono::steady_clock::time_point last_connection_attempt_ = std::chrono::steady_clock::now();
    int backoff_ms_;
    int retry_count_;
};

EventPublisher::EventPublisher(const Config& config) : impl_(std::make_unique<Impl>(config)) {}

EventPublisher::~EventPublisher() = default;

bool EventPublisher::enabled() const {
    return impl_->enabled();
}

std::string EventPublisher::status() {
    return impl_->status();
}

bool EventPublisher::publish(const std::string& type, const nlohmann::json& data) {
    return impl_->publish(type, data);
}
