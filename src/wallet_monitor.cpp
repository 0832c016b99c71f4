// DexPilot - Wallet Monitor Implementation

#include <dexpilot/wallet_monitor.hpp>
#include <spdlog/spdlog.h>
#include <iterator>

namespace dexpilot {

bool SeenSignatureSet::insert(const std::string& signature, int64_t now) {
    std::lock_guard lock(mutex_);
    return seen_.emplace(signature, now).second;
}

bool SeenSignatureSet::contains(const std::string& signature) const {
    std::lock_guard lock(mutex_);
    return seen_.count(signature) > 0;
}

size_t SeenSignatureSet::sweep(int64_t now) {
    std::lock_guard lock(mutex_);
    size_t removed = 0;
    for (auto it = seen_.begin(); it != seen_.end();) {
        if (now - it->second > retention_ms_) {
            it = seen_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t SeenSignatureSet::size() const {
    std::lock_guard lock(mutex_);
    return seen_.size();
}

bool SignalQueue::push(CopySignal signal) {
    std::lock_guard lock(mutex_);
    bool dropped = false;
    while (capacity_ > 0 && queue_.size() >= capacity_) {
        queue_.pop_front();
        dropped_.fetch_add(1, std::memory_order_relaxed);
        dropped = true;
    }
    queue_.push_back(std::move(signal));
    return !dropped;
}

std::optional<CopySignal> SignalQueue::try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) return std::nullopt;
    CopySignal signal = std::move(queue_.front());
    queue_.pop_front();
    return signal;
}

std::vector<CopySignal> SignalQueue::drain() {
    std::lock_guard lock(mutex_);
    std::vector<CopySignal> out(std::make_move_iterator(queue_.begin()),
                                std::make_move_iterator(queue_.end()));
    queue_.clear();
    return out;
}

size_t SignalQueue::size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

std::string_view to_string(WalletState state) noexcept {
    return state == WalletState::Idle ? "idle" : "polling";
}

WalletMonitor::WalletMonitor(const WalletMonitoringConfig& config,
                             std::shared_ptr<TransactionSource> source,
                             std::shared_ptr<SignalQueue> signals)
    : config_(config),
      min_buy_lamports_(sol_to_lamports(config.min_buy_amount_sol)),
      source_(std::move(source)),
      signals_(std::move(signals)),
      adapters_(AdapterFactory::create_all(all_dex_types())),
      seen_(static_cast<int64_t>(config.seen_retention_seconds) * 1000) {
    for (const auto& address : config_.wallets) {
        add_wallet(address);
    }
}

void WalletMonitor::add_wallet(const std::string& address) {
    std::lock_guard lock(wallets_mutex_);
    if (wallets_.count(address) > 0) return;
    WalletStatus status;
    status.address = address;
    wallets_.emplace(address, std::move(status));
    spdlog::info("Watching wallet {}", address);
}

bool WalletMonitor::remove_wallet(const std::string& address) {
    std::lock_guard lock(wallets_mutex_);
    if (wallets_.erase(address) == 0) return false;
    spdlog::info("Stopped watching wallet {}", address);
    return true;
}

std::vector<std::string> WalletMonitor::wallets() const {
    std::lock_guard lock(wallets_mutex_);
    std::vector<std::string> out;
    out.reserve(wallets_.size());
    for (const auto& [address, status] : wallets_) {
        out.push_back(address);
    }
    return out;
}

std::vector<WalletStatus> WalletMonitor::status() const {
    std::lock_guard lock(wallets_mutex_);
    std::vector<WalletStatus> out;
    out.reserve(wallets_.size());
    for (const auto& [address, status] : wallets_) {
        out.push_back(status);
    }
    return out;
}

size_t WalletMonitor::tick(int64_t now) {
    struct Job {
        std::string address;
        std::optional<std::string> cursor;
        bool first_poll;
    };

    std::vector<Job> jobs;
    {
        std::lock_guard lock(wallets_mutex_);
        for (auto& [address, status] : wallets_) {
            status.state = WalletState::Polling;
            jobs.push_back({address, status.cursor, status.polls == 0});
        }
    }

    size_t emitted = 0;
    for (const auto& job : jobs) {
        try {
            size_t n = poll_wallet(job.address, job.cursor, job.first_poll, now);
            emitted += n;

            std::lock_guard lock(wallets_mutex_);
            auto it = wallets_.find(job.address);
            if (it != wallets_.end()) {
                it->second.polls++;
                it->second.signals += n;
                it->second.last_poll = now;
                it->second.state = WalletState::Idle;
            }
        } catch (const std::exception& e) {
            total_errors_.fetch_add(1, std::memory_order_relaxed);
            spdlog::warn("Wallet {} poll failed: {}", job.address, e.what());

            std::lock_guard lock(wallets_mutex_);
            auto it = wallets_.find(job.address);
            if (it != wallets_.end()) {
                it->second.errors++;
                it->second.last_error = e.what();
                it->second.state = WalletState::Idle;
            }
        }
    }
    return emitted;
}

size_t WalletMonitor::poll_wallet(const std::string& address,
                                  const std::optional<std::string>& cursor,
                                  bool first_poll, int64_t now) {
    auto transactions = source_->fetch_recent(address, cursor);
    bool record_only = first_poll && config_.skip_history;
    size_t emitted = 0;

    for (const auto& tx : transactions) {
        if (!seen_.insert(tx.signature, now) || record_only) continue;

        auto event = decode_any(tx);
        if (!event || !event->is_buy() || event->trader != address) continue;

        if (event->quote_amount < min_buy_lamports_) {
            spdlog::debug("Wallet {} buy of {} below minimum ({:.4f} SOL)",
                          address, event->token, event->quote_sol());
            continue;
        }

        CopySignal signal;
        signal.wallet = address;
        signal.token = event->token;
        signal.amount_lamports = event->quote_amount;
        signal.timestamp = event->timestamp;
        signal.signature = event->signature;
        signal.protocol = event->protocol;

        spdlog::info("Copy signal: wallet {} bought {} for {:.4f} SOL on {}",
                     address, signal.token, signal.amount_sol(), to_string(signal.protocol));
        if (!signals_->push(std::move(signal))) {
            spdlog::warn("Signal queue full, dropped oldest signal");
        }
        total_signals_.fetch_add(1, std::memory_order_relaxed);
        ++emitted;
    }

    if (!transactions.empty()) {
        std::lock_guard lock(wallets_mutex_);
        auto it = wallets_.find(address);
        if (it != wallets_.end()) {
            it->second.cursor = transactions.back().signature;
        }
    }
    return emitted;
}

std::optional<CanonicalTradeEvent> WalletMonitor::decode_any(const RawTransaction& tx) const {
    // A transaction may route through several programs; any adapter's trade counts
    for (const auto& adapter : adapters_) {
        auto result = adapter->decode(tx);
        if (result.ok()) return std::move(result.event);
        if (result.error != DecodeError::ProgramMismatch) {
            spdlog::debug("{}: {} {} ({})", adapter->name(), tx.signature,
                          to_string(result.error), result.detail);
        }
    }
    return std::nullopt;
}

}  // namespace dexpilot
