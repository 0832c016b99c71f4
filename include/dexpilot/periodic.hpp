// DexPilot - Periodic Task
// Cancellable fixed-interval worker thread

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace dexpilot {

// Runs `fn` immediately and then every `interval` until stopped.
// An exception from `fn` is logged and counted; the loop keeps going.
// stop() lets an in-flight tick finish, then joins. Do not call stop()
// from inside `fn`.
class PeriodicTask {
public:
    PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> fn);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] std::chrono::milliseconds interval() const noexcept { return interval_; }
    [[nodiscard]] uint64_t ticks() const noexcept { return ticks_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t failures() const noexcept { return failures_.load(std::memory_order_relaxed); }

private:
    void run();

    std::string name_;
    std::chrono::milliseconds interval_;
    std::function<void()> fn_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;

    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> failures_{0};
};

}  // namespace dexpilot
