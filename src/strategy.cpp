// DexPilot - Strategy Engine Implementation

#include <dexpilot/strategy.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace dexpilot {

StrategyEngine::StrategyEngine(const CopyTradingConfig& copy,
                               const TakeProfitStopLossConfig& exits,
                               std::shared_ptr<const PriceCache> prices,
                               std::shared_ptr<const PositionTracker> positions,
                               std::shared_ptr<SignalQueue> signals,
                               int64_t signal_retention_ms)
    : copy_(copy),
      exits_(exits),
      prices_(std::move(prices)),
      positions_(std::move(positions)),
      signals_(std::move(signals)),
      signal_retention_ms_(signal_retention_ms) {}

uint64_t StrategyEngine::copy_amount(uint64_t observed_lamports, double ratio,
                                     double min_sol, double max_sol) noexcept {
    double sol = lamports_to_sol(observed_lamports) * ratio;
    sol = std::clamp(sol, min_sol, max_sol);
    return sol_to_lamports(sol);
}

std::optional<BuyIntent> StrategyEngine::evaluate_signal(const CopySignal& signal, int64_t now) {
    std::lock_guard lock(mutex_);

    if (!consumed_.emplace(signal.signature, now).second) {
        spdlog::debug("Signal {} already consumed", signal.signature);
        return std::nullopt;
    }
    stats_.signals_consumed++;

    if (!copy_.enabled) {
        stats_.signals_skipped++;
        return std::nullopt;
    }

    bool ignore_held = copy_.open_position_policy == OpenPositionPolicy::Ignore;
    if (ignore_held && (pending_buys_.count(signal.token) > 0 || positions_->has_open(signal.token))) {
        spdlog::info("Skipping copy of {}: position already held or pending", signal.token);
        stats_.signals_skipped++;
        return std::nullopt;
    }

    uint64_t amount = copy_amount(signal.amount_lamports, copy_.buy_ratio,
                                  copy_.min_buy_amount_sol, copy_.max_buy_amount_sol);
    if (amount == 0) {
        stats_.signals_skipped++;
        return std::nullopt;
    }

    BuyIntent intent;
    intent.token = signal.token;
    intent.quote_amount = amount;
    intent.slippage_bps = copy_.slippage_bps;
    intent.source_signature = signal.signature;
    intent.source_wallet = signal.wallet;
    intent.created_at = now;

    pending_buys_.insert(signal.token);
    stats_.buy_intents++;
    spdlog::info("Copy buy {}: {:.4f} SOL (wallet {} spent {:.4f} SOL)",
                 intent.token, lamports_to_sol(amount), signal.wallet, signal.amount_sol());
    return intent;
}

std::vector<BuyIntent> StrategyEngine::process_signals(int64_t now) {
    std::vector<BuyIntent> out;
    for (const auto& signal : signals_->drain()) {
        if (auto intent = evaluate_signal(signal, now)) {
            out.push_back(std::move(*intent));
        }
    }
    return out;
}

std::vector<SellIntent> StrategyEngine::evaluate_exits(int64_t now) {
    std::vector<SellIntent> out;
    if (!exits_.enabled) return out;

    double take_profit = exits_.take_profit();
    double stop_loss = exits_.stop_loss();

    for (const auto& pos : positions_->list_open()) {
        std::lock_guard lock(mutex_);
        if (pending_sells_.count(pos.token) > 0) continue;

        auto price = prices_->get(pos.token, now);
        if (!price) {
            stats_.skipped_no_price++;
            continue;
        }

        double pnl_pct = price->price_sol / pos.cost_basis - 1.0;
        SellReason reason;
        if (pnl_pct >= take_profit) {
            reason = SellReason::TakeProfit;
            stats_.take_profits++;
        } else if (pnl_pct <= -stop_loss) {
            reason = SellReason::StopLoss;
            stats_.stop_losses++;
        } else {
            continue;
        }

        SellIntent intent;
        intent.token = pos.token;
        intent.base_amount = pos.quantity;
        intent.slippage_bps = exits_.slippage_bps;
        intent.reason = reason;
        intent.trigger_price = price->price_sol;
        intent.pnl_pct = pnl_pct;
        intent.created_at = now;

        pending_sells_.insert(pos.token);
        stats_.sell_intents++;
        spdlog::info("{} triggered for {}: pnl {:.2f}%", to_string(reason), pos.token, pnl_pct * 100.0);
        out.push_back(std::move(intent));
    }
    return out;
}

StrategyDecisions StrategyEngine::tick(int64_t now) {
    StrategyDecisions d;
    d.buys = process_signals(now);
    d.sells = evaluate_exits(now);
    return d;
}

void StrategyEngine::confirm_buy(const std::string& token, bool success) {
    std::lock_guard lock(mutex_);
    pending_buys_.erase(token);
    if (!success) spdlog::warn("Copy buy of {} failed", token);
}

void StrategyEngine::confirm_sell(const std::string& token, bool success) {
    std::lock_guard lock(mutex_);
    pending_sells_.erase(token);
    if (!success) spdlog::warn("Exit sell of {} failed, will re-evaluate", token);
}

bool StrategyEngine::buy_pending(const std::string& token) const {
    std::lock_guard lock(mutex_);
    return pending_buys_.count(token) > 0;
}

bool StrategyEngine::sell_pending(const std::string& token) const {
    std::lock_guard lock(mutex_);
    return pending_sells_.count(token) > 0;
}

size_t StrategyEngine::sweep(int64_t now) {
    std::lock_guard lock(mutex_);
    size_t removed = 0;
    for (auto it = consumed_.begin(); it != consumed_.end();) {
        if (now - it->second > signal_retention_ms_) {
            it = consumed_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

StrategyStats StrategyEngine::stats() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

}  // namespace dexpilot
