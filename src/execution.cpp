// DexPilot - Order Execution Implementation

#include <dexpilot/execution.hpp>
#include <spdlog/spdlog.h>
#include <cmath>

namespace dexpilot {

std::string_view to_string(ExecutionStatus status) noexcept {
    switch (status) {
        case ExecutionStatus::Executing: return "executing";
        case ExecutionStatus::Completed: return "completed";
        case ExecutionStatus::Failed: return "failed";
    }
    return "unknown";
}

PaperOrderExecutor::PaperOrderExecutor(std::shared_ptr<const PriceCache> prices)
    : prices_(std::move(prices)) {}

double PaperOrderExecutor::current_price(const std::string& token) const {
    auto price = prices_->get(token);
    if (!price || price->price_sol <= 0.0) {
        throw ExecutionError("No live price for " + token);
    }
    return price->price_sol;
}

std::string PaperOrderExecutor::next_signature() {
    return "paper-" + std::to_string(sequence_.fetch_add(1, std::memory_order_relaxed) + 1);
}

std::future<ExecutionReceipt> PaperOrderExecutor::submit_buy(
    const std::string& token, uint64_t quote_lamports, uint16_t slippage_bps) {
    return std::async(std::launch::async, [this, token, quote_lamports, slippage_bps]() {
        if (quote_lamports == 0) throw ExecutionError("Zero buy amount for " + token);

        double fill = current_price(token) * (1.0 + slippage_bps / 10000.0);
        auto base = static_cast<uint64_t>(std::floor(lamports_to_sol(quote_lamports) / fill));
        if (base == 0) throw ExecutionError("Buy of " + token + " rounds to zero tokens");

        ExecutionReceipt r;
        r.token = token;
        r.side = TradeDirection::Buy;
        r.base_amount = base;
        r.quote_amount = quote_lamports;
        r.price = lamports_to_sol(quote_lamports) / static_cast<double>(base);
        r.signature = next_signature();
        r.timestamp = now_ms();
        return r;
    });
}

std::future<ExecutionReceipt> PaperOrderExecutor::submit_sell(
    const std::string& token, uint64_t base_amount, uint16_t slippage_bps) {
    return std::async(std::launch::async, [this, token, base_amount, slippage_bps]() {
        if (base_amount == 0) throw ExecutionError("Zero sell amount for " + token);

        double fill = current_price(token) * (1.0 - slippage_bps / 10000.0);

        ExecutionReceipt r;
        r.token = token;
        r.side = TradeDirection::Sell;
        r.base_amount = base_amount;
        r.quote_amount = sol_to_lamports(fill * static_cast<double>(base_amount));
        r.price = fill;
        r.signature = next_signature();
        r.timestamp = now_ms();
        return r;
    });
}

IntentDispatcher::IntentDispatcher(std::shared_ptr<OrderExecutor> executor,
                                   std::shared_ptr<PositionTracker> positions,
                                   std::shared_ptr<StrategyEngine> strategy,
                                   size_t max_history)
    : executor_(std::move(executor)),
      positions_(std::move(positions)),
      strategy_(std::move(strategy)),
      max_history_(max_history) {}

uint64_t IntentDispatcher::dispatch(const BuyIntent& intent, int64_t now) {
    ExecutionRecord record;
    record.token = intent.token;
    record.side = TradeDirection::Buy;
    record.created_at = now;

    std::future<ExecutionReceipt> future;
    try {
        future = executor_->submit_buy(intent.token, intent.quote_amount, intent.slippage_bps);
    } catch (const std::exception& e) {
        spdlog::error("Buy submission for {} rejected: {}", intent.token, e.what());
        strategy_->confirm_buy(intent.token, false);
        std::lock_guard lock(mutex_);
        record.id = next_id_++;
        record.status = ExecutionStatus::Failed;
        record.completed_at = now;
        record.error = e.what();
        stats_.submitted++;
        stats_.failed++;
        finish(record);
        return record.id;
    }

    std::lock_guard lock(mutex_);
    record.id = next_id_++;
    stats_.submitted++;
    pending_.push_back({record, std::move(future)});
    return record.id;
}

uint64_t IntentDispatcher::dispatch(const SellIntent& intent, int64_t now) {
    ExecutionRecord record;
    record.token = intent.token;
    record.side = TradeDirection::Sell;
    record.created_at = now;
    record.reason = intent.reason;

    std::future<ExecutionReceipt> future;
    try {
        future = executor_->submit_sell(intent.token, intent.base_amount, intent.slippage_bps);
    } catch (const std::exception& e) {
        spdlog::error("Sell submission for {} rejected: {}", intent.token, e.what());
        strategy_->confirm_sell(intent.token, false);
        std::lock_guard lock(mutex_);
        record.id = next_id_++;
        record.status = ExecutionStatus::Failed;
        record.completed_at = now;
        record.error = e.what();
        stats_.submitted++;
        stats_.failed++;
        finish(record);
        return record.id;
    }

    std::lock_guard lock(mutex_);
    record.id = next_id_++;
    stats_.submitted++;
    pending_.push_back({record, std::move(future)});
    return record.id;
}

void IntentDispatcher::dispatch(const StrategyDecisions& decisions, int64_t now) {
    for (const auto& buy : decisions.buys) dispatch(buy, now);
    for (const auto& sell : decisions.sells) dispatch(sell, now);
}

size_t IntentDispatcher::poll(int64_t now) {
    std::vector<Pending> ready;
    {
        std::lock_guard lock(mutex_);
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->future.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                ready.push_back(std::move(*it));
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }
    }

    // Position updates and confirmations happen outside the dispatcher lock
    for (auto& p : ready) {
        settle(p, now);
    }
    return ready.size();
}

size_t IntentDispatcher::drain(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    {
        std::lock_guard lock(mutex_);
        for (auto& p : pending_) {
            p.future.wait_until(deadline);
        }
    }
    return poll(now_ms());
}

void IntentDispatcher::settle(Pending& p, int64_t now) {
    auto& record = p.record;
    record.completed_at = now;
    bool buy = record.side == TradeDirection::Buy;

    try {
        auto receipt = p.future.get();
        if (buy) {
            auto pos = positions_->open_or_increase(receipt.token, receipt.base_amount, receipt.price, now);
            spdlog::info("Bought {} {} @ {:.12f} SOL (basis {:.12f}, {})",
                         receipt.base_amount, receipt.token, receipt.price, pos.cost_basis, receipt.signature);
        } else {
            record.realized_pnl = positions_->decrease_or_close(
                receipt.token, receipt.base_amount, receipt.price, now);
            spdlog::info("Sold {} {} @ {:.12f} SOL, realized {:.6f} SOL ({})",
                         receipt.base_amount, receipt.token, receipt.price, record.realized_pnl, receipt.signature);
        }
        record.status = ExecutionStatus::Completed;
        record.receipt = std::move(receipt);
    } catch (const PositionError& e) {
        record.status = ExecutionStatus::Failed;
        record.error = e.what();
        spdlog::error("Position update for {} rejected ({}): {}",
                      record.token, to_string(e.kind()), e.what());
    } catch (const std::exception& e) {
        record.status = ExecutionStatus::Failed;
        record.error = e.what();
        spdlog::error("{} of {} failed: {}", to_string(record.side), record.token, e.what());
    }

    bool ok = record.status == ExecutionStatus::Completed;
    if (buy) {
        strategy_->confirm_buy(record.token, ok);
    } else {
        strategy_->confirm_sell(record.token, ok);
    }

    std::lock_guard lock(mutex_);
    if (ok) stats_.completed++;
    else stats_.failed++;
    finish(std::move(record));
}

void IntentDispatcher::finish(ExecutionRecord record) {
    history_.push_back(std::move(record));
    while (history_.size() > max_history_) {
        history_.pop_front();
    }
}

std::vector<ExecutionRecord> IntentDispatcher::history() const {
    std::lock_guard lock(mutex_);
    return {history_.begin(), history_.end()};
}

ExecutionStats IntentDispatcher::stats() const {
    std::lock_guard lock(mutex_);
    ExecutionStats s = stats_;
    s.pending = pending_.size();
    return s;
}

size_t IntentDispatcher::pending() const {
    std::lock_guard lock(mutex_);
    return pending_.size();
}

}  // namespace dexpilot
