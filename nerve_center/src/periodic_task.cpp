#include "periodic_task.hpp"
#include <spdlog/spdlog.h>

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> body)
    : name_(std::move(name)), interval_(interval), body_(std::move(body)) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    if (running_) {
        spdlog::warn("{} already running", name_);
        return;
    }

    running_ = true;
    thread_ = std::thread(&PeriodicTask::thread_func, this);
    spdlog::info("{} started (every {} ms)", name_, interval_.count());
}

void PeriodicTask::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    spdlog::info("{} stopped", name_);
}

void PeriodicTask::run_once() {
    try {
        body_();
    } catch (const std::exception& e) {
        spdlog::error("{} iteration failed: {}", name_, e.what());
    }
}

void PeriodicTask::thread_func() {
    while (running_) {
        run_once();

        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, interval_, [this] { return !running_; });
    }
}
