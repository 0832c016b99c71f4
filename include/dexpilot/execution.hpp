// DexPilot - Order Execution
// Executor interface, paper executor and intent dispatch

#pragma once

#include <dexpilot/position.hpp>
#include <dexpilot/price.hpp>
#include <dexpilot/strategy.hpp>
#include <dexpilot/types.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace dexpilot {

class ExecutionError : public std::runtime_error {
public:
    explicit ExecutionError(const std::string& msg) : std::runtime_error(msg) {}
};

// Order executor (signs and submits swaps). Futures throw ExecutionError.
class OrderExecutor {
public:
    virtual ~OrderExecutor() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;

    virtual std::future<ExecutionReceipt> submit_buy(
        const std::string& token, uint64_t quote_lamports, uint16_t slippage_bps) = 0;

    virtual std::future<ExecutionReceipt> submit_sell(
        const std::string& token, uint64_t base_amount, uint16_t slippage_bps) = 0;
};

// Dry-run executor: fills at the cached price, worst case of the slippage
class PaperOrderExecutor : public OrderExecutor {
public:
    explicit PaperOrderExecutor(std::shared_ptr<const PriceCache> prices);

    [[nodiscard]] std::string_view name() const override { return "paper"; }

    std::future<ExecutionReceipt> submit_buy(
        const std::string& token, uint64_t quote_lamports, uint16_t slippage_bps) override;

    std::future<ExecutionReceipt> submit_sell(
        const std::string& token, uint64_t base_amount, uint16_t slippage_bps) override;

private:
    [[nodiscard]] double current_price(const std::string& token) const;
    [[nodiscard]] std::string next_signature();

    std::shared_ptr<const PriceCache> prices_;
    std::atomic<uint64_t> sequence_{0};
};

enum class ExecutionStatus : uint8_t {
    Executing,
    Completed,
    Failed
};

[[nodiscard]] std::string_view to_string(ExecutionStatus status) noexcept;

struct ExecutionRecord {
    uint64_t id = 0;
    std::string token;
    TradeDirection side = TradeDirection::Buy;
    ExecutionStatus status = ExecutionStatus::Executing;
    int64_t created_at = 0;
    int64_t completed_at = 0;
    std::optional<ExecutionReceipt> receipt;
    std::optional<SellReason> reason;
    double realized_pnl = 0.0;
    std::string error;
};

struct ExecutionStats {
    uint64_t submitted = 0;
    uint64_t completed = 0;
    uint64_t failed = 0;
    size_t pending = 0;

    [[nodiscard]] double success_rate() const noexcept {
        uint64_t done = completed + failed;
        return done == 0 ? 0.0 : static_cast<double>(completed) / static_cast<double>(done);
    }
};

// Submits intents, applies fills to the position tracker and reports
// completion back to the strategy engine
class IntentDispatcher {
public:
    IntentDispatcher(std::shared_ptr<OrderExecutor> executor,
                     std::shared_ptr<PositionTracker> positions,
                     std::shared_ptr<StrategyEngine> strategy,
                     size_t max_history = 1000);

    uint64_t dispatch(const BuyIntent& intent, int64_t now = now_ms());
    uint64_t dispatch(const SellIntent& intent, int64_t now = now_ms());
    void dispatch(const StrategyDecisions& decisions, int64_t now = now_ms());

    // Settles every submission whose future is ready; returns how many
    size_t poll(int64_t now = now_ms());

    // Waits up to `timeout` for outstanding submissions, then settles them
    size_t drain(std::chrono::milliseconds timeout);

    [[nodiscard]] std::vector<ExecutionRecord> history() const;
    [[nodiscard]] ExecutionStats stats() const;
    [[nodiscard]] size_t pending() const;

private:
    struct Pending {
        ExecutionRecord record;
        std::future<ExecutionReceipt> future;
    };

    void settle(Pending& p, int64_t now);
    void finish(ExecutionRecord record);

    std::shared_ptr<OrderExecutor> executor_;
    std::shared_ptr<PositionTracker> positions_;
    std::shared_ptr<StrategyEngine> strategy_;
    size_t max_history_;

    mutable std::mutex mutex_;
    std::vector<Pending> pending_;
    std::deque<ExecutionRecord> history_;
    uint64_t next_id_ = 1;
    ExecutionStats stats_;
};

}  // namespace dexpilot
