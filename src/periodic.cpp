// DexPilot - Periodic Task Implementation

#include <dexpilot/periodic.hpp>
#include <spdlog/spdlog.h>

namespace dexpilot {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval,
                           std::function<void()> fn)
    : name_(std::move(name)), interval_(interval), fn_(std::move(fn)) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;  // Already running
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    thread_ = std::thread(&PeriodicTask::run, this);
    spdlog::debug("Task {} started ({} ms)", name_, interval_.count());
}

void PeriodicTask::stop() {
    bool expected = true;
    if (running_.compare_exchange_strong(expected, false)) {
        // Take the lock so a waiting run() cannot miss the wakeup
        std::lock_guard lock(mutex_);
    }
    cv_.notify_all();

    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
        spdlog::debug("Task {} stopped", name_);
    }
}

void PeriodicTask::run() {
    while (running_.load()) {
        try {
            fn_();
        } catch (const std::exception& e) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            spdlog::error("Task {} tick failed: {}", name_, e.what());
        }
        ticks_.fetch_add(1, std::memory_order_relaxed);

        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, interval_, [this] { return !running_.load(); });
    }
}

}  // namespace dexpilot
