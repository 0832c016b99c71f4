// DexPilot - Strategy Engine
// Copy-trading and take-profit/stop-loss decisions

#pragma once

#include <dexpilot/config.hpp>
#include <dexpilot/position.hpp>
#include <dexpilot/price.hpp>
#include <dexpilot/types.hpp>
#include <dexpilot/wallet_monitor.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace dexpilot {

struct StrategyStats {
    uint64_t signals_consumed = 0;
    uint64_t signals_skipped = 0;
    uint64_t buy_intents = 0;
    uint64_t sell_intents = 0;
    uint64_t take_profits = 0;
    uint64_t stop_losses = 0;
    uint64_t skipped_no_price = 0;
};

struct StrategyDecisions {
    std::vector<BuyIntent> buys;
    std::vector<SellIntent> sells;
};

// Produces order intents only; never touches positions. Outstanding
// intents are tracked per token until the executor confirms them.
class StrategyEngine {
public:
    StrategyEngine(const CopyTradingConfig& copy,
                   const TakeProfitStopLossConfig& exits,
                   std::shared_ptr<const PriceCache> prices,
                   std::shared_ptr<const PositionTracker> positions,
                   std::shared_ptr<SignalQueue> signals,
                   int64_t signal_retention_ms = 86400000);

    // ratio * observed amount, clamped to [min, max]; lamports
    [[nodiscard]] static uint64_t copy_amount(uint64_t observed_lamports, double ratio,
                                              double min_sol, double max_sol) noexcept;

    // Copy-trade policy for one signal. Each signature is consumed once.
    [[nodiscard]] std::optional<BuyIntent> evaluate_signal(const CopySignal& signal, int64_t now);

    // Drains the signal queue through evaluate_signal
    [[nodiscard]] std::vector<BuyIntent> process_signals(int64_t now);

    // Take-profit/stop-loss pass over open positions
    [[nodiscard]] std::vector<SellIntent> evaluate_exits(int64_t now);

    [[nodiscard]] StrategyDecisions tick(int64_t now);

    // Executor feedback; clears the in-flight marker for the token
    void confirm_buy(const std::string& token, bool success);
    void confirm_sell(const std::string& token, bool success);

    [[nodiscard]] bool buy_pending(const std::string& token) const;
    [[nodiscard]] bool sell_pending(const std::string& token) const;

    // Forgets consumed signal signatures older than the retention window
    size_t sweep(int64_t now);

    [[nodiscard]] StrategyStats stats() const;

private:
    CopyTradingConfig copy_;
    TakeProfitStopLossConfig exits_;
    std::shared_ptr<const PriceCache> prices_;
    std::shared_ptr<const PositionTracker> positions_;
    std::shared_ptr<SignalQueue> signals_;
    int64_t signal_retention_ms_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, int64_t> consumed_;
    std::unordered_set<std::string> pending_buys_;
    std::unordered_set<std::string> pending_sells_;
    StrategyStats stats_;
};

}  // namespace dexpilot
