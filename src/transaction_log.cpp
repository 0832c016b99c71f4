// DexPilot - Transaction Log Implementation

#include <dexpilot/transaction_log.hpp>
#include <mutex>

namespace dexpilot {

TransactionLog::TransactionLog(int64_t retention_ms, size_t max_events)
    : retention_ms_(retention_ms), max_events_(max_events) {}

bool TransactionLog::append(CanonicalTradeEvent event) {
    std::unique_lock lock(mutex_);
    if (!signatures_.insert(event.signature).second) {
        return false;
    }
    events_.push_back(std::move(event));
    while (max_events_ > 0 && events_.size() > max_events_) {
        pop_front_locked();
    }
    return true;
}

std::vector<CanonicalTradeEvent> TransactionLog::query(const TransactionFilter& filter) const {
    std::vector<CanonicalTradeEvent> out;
    std::shared_lock lock(mutex_);

    if (filter.limit > 0) {
        for (auto it = events_.rbegin(); it != events_.rend() && out.size() < filter.limit; ++it) {
            if (filter.matches(*it)) out.push_back(*it);
        }
        return out;
    }

    for (const auto& ev : events_) {
        if (filter.matches(ev)) out.push_back(ev);
    }
    return out;
}

void TransactionLog::visit(const TransactionFilter& filter,
                           const std::function<void(const CanonicalTradeEvent&)>& fn) const {
    std::shared_lock lock(mutex_);
    for (const auto& ev : events_) {
        if (filter.matches(ev)) fn(ev);
    }
}

size_t TransactionLog::sweep(int64_t now) {
    std::unique_lock lock(mutex_);
    size_t before = events_.size();

    // Arrival order is not strictly time order, so scan everything
    int64_t cutoff = now - retention_ms_;
    std::deque<CanonicalTradeEvent> kept;
    for (auto& ev : events_) {
        if (ev.timestamp < cutoff) {
            signatures_.erase(ev.signature);
        } else {
            kept.push_back(std::move(ev));
        }
    }
    events_.swap(kept);

    while (max_events_ > 0 && events_.size() > max_events_) {
        pop_front_locked();
    }
    return before - events_.size();
}

size_t TransactionLog::size() const {
    std::shared_lock lock(mutex_);
    return events_.size();
}

bool TransactionLog::contains(const std::string& signature) const {
    std::shared_lock lock(mutex_);
    return signatures_.count(signature) > 0;
}

void TransactionLog::pop_front_locked() {
    signatures_.erase(events_.front().signature);
    events_.pop_front();
}

}  // namespace dexpilot
