// DexPilot - Wallet Monitor
// Watches external wallets and turns their buys into copy signals

#pragma once

#include <dexpilot/adapter.hpp>
#include <dexpilot/config.hpp>
#include <dexpilot/source.hpp>
#include <dexpilot/types.hpp>
#include <atomic>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dexpilot {

// Recently seen transaction signatures with age eviction
class SeenSignatureSet {
public:
    explicit SeenSignatureSet(int64_t retention_ms) : retention_ms_(retention_ms) {}

    // True if the signature was not already present
    bool insert(const std::string& signature, int64_t now);
    [[nodiscard]] bool contains(const std::string& signature) const;
    size_t sweep(int64_t now);
    [[nodiscard]] size_t size() const;

private:
    int64_t retention_ms_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, int64_t> seen_;
};

// Bounded FIFO of copy signals. When full the oldest signal is dropped.
class SignalQueue {
public:
    explicit SignalQueue(size_t capacity) : capacity_(capacity) {}

    // Returns false if an older signal had to be dropped
    bool push(CopySignal signal);
    [[nodiscard]] std::optional<CopySignal> try_pop();
    [[nodiscard]] std::vector<CopySignal> drain();

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] uint64_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<CopySignal> queue_;
    std::atomic<uint64_t> dropped_{0};
};

enum class WalletState : uint8_t {
    Idle,
    Polling
};

[[nodiscard]] std::string_view to_string(WalletState state) noexcept;

struct WalletStatus {
    std::string address;
    WalletState state = WalletState::Idle;
    std::optional<std::string> cursor;
    uint64_t polls = 0;
    uint64_t signals = 0;
    uint64_t errors = 0;
    int64_t last_poll = 0;
    std::string last_error;
};

class WalletMonitor {
public:
    WalletMonitor(const WalletMonitoringConfig& config,
                  std::shared_ptr<TransactionSource> source,
                  std::shared_ptr<SignalQueue> signals);

    void add_wallet(const std::string& address);
    bool remove_wallet(const std::string& address);
    [[nodiscard]] std::vector<std::string> wallets() const;

    // One polling pass over every wallet. A failing wallet is logged and
    // counted; the others are still polled. Returns signals emitted.
    size_t tick(int64_t now);
    size_t tick() { return tick(now_ms()); }

    // Evicts aged-out seen signatures
    size_t sweep(int64_t now) { return seen_.sweep(now); }

    [[nodiscard]] std::vector<WalletStatus> status() const;
    [[nodiscard]] size_t seen_count() const { return seen_.size(); }
    [[nodiscard]] uint64_t total_signals() const noexcept { return total_signals_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t total_errors() const noexcept { return total_errors_.load(std::memory_order_relaxed); }

private:
    size_t poll_wallet(const std::string& address, const std::optional<std::string>& cursor,
                       bool first_poll, int64_t now);
    std::optional<CanonicalTradeEvent> decode_any(const RawTransaction& tx) const;

    WalletMonitoringConfig config_;
    uint64_t min_buy_lamports_;
    std::shared_ptr<TransactionSource> source_;
    std::shared_ptr<SignalQueue> signals_;
    std::vector<std::unique_ptr<ProtocolAdapter>> adapters_;
    SeenSignatureSet seen_;

    mutable std::mutex wallets_mutex_;
    std::map<std::string, WalletStatus> wallets_;

    std::atomic<uint64_t> total_signals_{0};
    std::atomic<uint64_t> total_errors_{0};
};

}  // namespace dexpilot
