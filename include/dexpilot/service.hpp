// DexPilot - Service Orchestrator
// Owns shared state and schedules every monitoring loop

#pragma once

#include <dexpilot/config.hpp>
#include <dexpilot/dex_monitor.hpp>
#include <dexpilot/execution.hpp>
#include <dexpilot/periodic.hpp>
#include <dexpilot/position.hpp>
#include <dexpilot/price.hpp>
#include <dexpilot/source.hpp>
#include <dexpilot/strategy.hpp>
#include <dexpilot/transaction_log.hpp>
#include <dexpilot/wallet_monitor.hpp>
#include <nlohmann/json_fwd.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dexpilot {

struct ProtocolStatus {
    DexType type = DexType::PumpFun;
    bool running = false;
    DexMonitorStats stats;
    uint64_t task_failures = 0;
};

struct ServiceStatus {
    bool running = false;
    bool dex_monitoring = false;
    bool wallet_monitoring = false;
    size_t watched_wallets = 0;
    size_t open_positions = 0;
    size_t transactions = 0;
    size_t cached_prices = 0;
    size_t pending_signals = 0;
    size_t seen_signatures = 0;
    std::vector<ProtocolStatus> protocols;
    StrategyStats strategy;
    ExecutionStats execution;
    PositionSummary positions;
    uint64_t wallet_signals = 0;
    uint64_t wallet_errors = 0;

    [[nodiscard]] nlohmann::json to_json() const;
};

struct PortfolioSnapshot {
    double total_cost_sol = 0.0;
    double current_value_sol = 0.0;
    double unrealized_pnl_sol = 0.0;
    double unrealized_pnl_pct = 0.0;
    size_t unpriced_positions = 0;
};

class Service {
public:
    // Validates the config; throws ConfigError before anything starts.
    // Without an executor, orders are paper-filled at cached prices.
    Service(Config config,
            std::shared_ptr<TransactionSource> source,
            std::shared_ptr<OrderExecutor> executor = nullptr);
    ~Service();

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    // Lifecycle
    void start();
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    void start_dex_monitoring();
    void stop_dex_monitoring();
    [[nodiscard]] bool dex_monitoring_running() const;

    void start_wallet_monitoring();
    void stop_wallet_monitoring();
    [[nodiscard]] bool wallet_monitoring_running() const;

    // Loop bodies, callable directly
    void run_strategy_once(int64_t now = now_ms());
    void run_cleanup_once(int64_t now = now_ms());
    void log_status() const;

    // Queries
    [[nodiscard]] std::vector<CanonicalTradeEvent> recent_transactions(const TransactionFilter& filter = {}) const;
    [[nodiscard]] std::optional<TokenPrice> price(const std::string& token) const;
    [[nodiscard]] std::vector<TokenPrice> all_prices() const;
    [[nodiscard]] std::vector<Position> open_positions() const;
    [[nodiscard]] PortfolioSnapshot portfolio() const;
    [[nodiscard]] ServiceStatus status() const;

    // Wallet management
    void add_wallet(const std::string& address);
    bool remove_wallet(const std::string& address);

    // Feeds an observed buy straight into the signal path
    void simulate_wallet_buy(const std::string& wallet, const std::string& token, double amount_sol);
    // Feeds a price observation straight into the cache
    void simulate_price_update(const std::string& token, double price_sol, const std::string& source = "manual");

    // Shared state handles
    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] std::shared_ptr<PriceCache> price_cache() const noexcept { return prices_; }
    [[nodiscard]] std::shared_ptr<TransactionLog> transaction_log() const noexcept { return log_; }
    [[nodiscard]] std::shared_ptr<PositionTracker> positions() const noexcept { return positions_; }
    [[nodiscard]] std::shared_ptr<SignalQueue> signal_queue() const noexcept { return signals_; }
    [[nodiscard]] std::shared_ptr<StrategyEngine> strategy() const noexcept { return strategy_; }
    [[nodiscard]] std::shared_ptr<IntentDispatcher> dispatcher() const noexcept { return dispatcher_; }
    [[nodiscard]] WalletMonitor& wallet_monitor() noexcept { return *wallet_monitor_; }
    [[nodiscard]] const std::vector<std::unique_ptr<DexMonitor>>& dex_monitors() const noexcept { return dex_monitors_; }

private:
    Config config_;
    std::shared_ptr<TransactionSource> source_;

    std::shared_ptr<PriceCache> prices_;
    std::shared_ptr<TransactionLog> log_;
    std::shared_ptr<PositionTracker> positions_;
    std::shared_ptr<SignalQueue> signals_;
    std::shared_ptr<OrderExecutor> executor_;
    std::shared_ptr<StrategyEngine> strategy_;
    std::shared_ptr<IntentDispatcher> dispatcher_;

    std::vector<std::unique_ptr<DexMonitor>> dex_monitors_;
    std::unique_ptr<WalletMonitor> wallet_monitor_;

    // Tasks reference the monitors above and are destroyed first
    mutable std::mutex tasks_mutex_;
    std::vector<std::unique_ptr<PeriodicTask>> dex_tasks_;
    std::unique_ptr<PeriodicTask> wallet_task_;
    std::unique_ptr<PeriodicTask> strategy_task_;
    std::unique_ptr<PeriodicTask> cleanup_task_;
    std::unique_ptr<PeriodicTask> status_task_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> simulated_{0};
};

}  // namespace dexpilot
