// DexPilot - Transaction Log
// Bounded, time-bounded store of recent trade events

#pragma once

#include <dexpilot/types.hpp>
#include <deque>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace dexpilot {

struct TransactionFilter {
    std::optional<DexType> protocol;
    std::optional<std::string> token;
    std::optional<TradeDirection> direction;
    size_t limit = 0;  // 0 = unlimited, newest first when set

    [[nodiscard]] bool matches(const CanonicalTradeEvent& ev) const noexcept {
        if (protocol && ev.protocol != *protocol) return false;
        if (token && ev.token != *token) return false;
        if (direction && ev.direction != *direction) return false;
        return true;
    }
};

class TransactionLog {
public:
    TransactionLog(int64_t retention_ms, size_t max_events);

    // Appends in arrival order. Returns false for an already-retained
    // signature. Evicts the oldest event beyond the count bound.
    bool append(CanonicalTradeEvent event);

    // Snapshot in arrival order (or newest-first limited, see filter.limit)
    [[nodiscard]] std::vector<CanonicalTradeEvent> query(const TransactionFilter& filter = {}) const;

    // Streams matches oldest-first under a shared lock
    void visit(const TransactionFilter& filter,
               const std::function<void(const CanonicalTradeEvent&)>& fn) const;

    // Drops events older than the retention window, then trims to max_events
    size_t sweep(int64_t now);
    size_t sweep() { return sweep(now_ms()); }

    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool contains(const std::string& signature) const;
    [[nodiscard]] int64_t retention_ms() const noexcept { return retention_ms_; }
    [[nodiscard]] size_t max_events() const noexcept { return max_events_; }

private:
    void pop_front_locked();

    int64_t retention_ms_;
    size_t max_events_;

    mutable std::shared_mutex mutex_;
    std::deque<CanonicalTradeEvent> events_;
    std::unordered_set<std::string> signatures_;
};

}  // namespace dexpilot
