#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

// Runs a body on its own thread at a fixed interval. The first iteration
// runs as soon as start() is called, later ones one interval apart. stop()
// prevents new iterations and waits for the one in flight to finish.
class PeriodicTask {
public:
    PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> body);
    ~PeriodicTask();

    void start();
    void stop();
    bool running() const { return running_; }

    // One iteration on the caller's thread; exceptions are logged
    void run_once();

    // Non-copyable
    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

private:
    void thread_func();

    std::string name_;
    std::chrono::milliseconds interval_;
    std::function<void()> body_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
};
