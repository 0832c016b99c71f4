// DexPilot - Test Fixtures
// Transaction builders and scripted collaborators

#pragma once

#include <dexpilot/adapters/bonk.hpp>
#include <dexpilot/adapters/pumpfun.hpp>
#include <dexpilot/adapters/pumpswap.hpp>
#include <dexpilot/adapters/raydium_cpmm.hpp>
#include <dexpilot/execution.hpp>
#include <dexpilot/source.hpp>
#include <deque>
#include <future>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace dexpilot::test {

inline constexpr int64_t BLOCK_TIME = 1700000000;
inline constexpr uint64_t FEE = 5000;

inline std::vector<uint8_t> ix_data(const Discriminator& disc, uint64_t a, uint64_t b) {
    std::vector<uint8_t> data(disc.begin(), disc.end());
    for (uint64_t v : {a, b}) {
        for (int i = 0; i < 8; ++i) {
            data.push_back(static_cast<uint8_t>(v >> (8 * i)));
        }
    }
    return data;
}

// Builds a RawTransaction with the trader as fee payer (account 0)
class TxBuilder {
public:
    TxBuilder(const std::string& signature, const std::string& trader) {
        tx_.signature = signature;
        tx_.slot = 250000000;
        tx_.block_time = BLOCK_TIME;
        tx_.account_keys.push_back(trader);
        TransactionMeta meta;
        meta.fee = FEE;
        tx_.meta = meta;
    }

    uint32_t key(const std::string& account) {
        for (uint32_t i = 0; i < tx_.account_keys.size(); ++i) {
            if (tx_.account_keys[i] == account) return i;
        }
        tx_.account_keys.push_back(account);
        return static_cast<uint32_t>(tx_.account_keys.size() - 1);
    }

    CompiledInstruction make_instruction(const std::string& program,
                                         const std::vector<std::string>& accounts,
                                         std::vector<uint8_t> data) {
        CompiledInstruction ix;
        ix.program_id_index = key(program);
        for (const auto& a : accounts) ix.accounts.push_back(key(a));
        ix.data = std::move(data);
        return ix;
    }

    TxBuilder& instruction(const std::string& program,
                           const std::vector<std::string>& accounts,
                           std::vector<uint8_t> data) {
        tx_.instructions.push_back(make_instruction(program, accounts, std::move(data)));
        return *this;
    }

    TxBuilder& inner_instruction(const std::string& program,
                                 const std::vector<std::string>& accounts,
                                 std::vector<uint8_t> data) {
        InnerInstructionSet set;
        set.index = 0;
        set.instructions.push_back(make_instruction(program, accounts, std::move(data)));
        tx_.meta->inner_instructions.push_back(std::move(set));
        return *this;
    }

    TxBuilder& token_change(const std::string& owner, const std::string& mint,
                            uint64_t pre, uint64_t post, uint8_t decimals = 6) {
        uint32_t idx = key("ata:" + owner + ":" + mint);
        tx_.meta->pre_token_balances.push_back({idx, mint, owner, pre, decimals});
        tx_.meta->post_token_balances.push_back({idx, mint, owner, post, decimals});
        return *this;
    }

    TxBuilder& lamports(uint64_t pre, uint64_t post) {
        tx_.meta->pre_balances = {pre};
        tx_.meta->post_balances = {post};
        return *this;
    }

    TxBuilder& failed() {
        tx_.meta->failed = true;
        return *this;
    }

    TxBuilder& without_meta() {
        tx_.meta.reset();
        return *this;
    }

    [[nodiscard]] RawTransaction build() const { return tx_; }

private:
    RawTransaction tx_;
};

inline const std::string WSOL{WSOL_MINT};

// PumpFun trade paid in native SOL: `lamports` leave (buy) or enter (sell)
inline RawTransaction pumpfun_trade(const std::string& signature, const std::string& trader,
                                    const std::string& mint, bool buy,
                                    uint64_t tokens, uint64_t lamports) {
    constexpr uint64_t start = 100 * LAMPORTS_PER_SOL;
    TxBuilder b(signature, trader);
    b.instruction(std::string(PumpFunAdapter::PROGRAM_ID),
                  {"global", "fee_recipient", mint, "curve:" + mint, "abc:" + mint, "ata", trader},
                  ix_data(buy ? PumpFunAdapter::BUY : PumpFunAdapter::SELL, tokens, lamports));
    if (buy) {
        b.token_change(trader, mint, 0, tokens);
        b.lamports(start, start - lamports - FEE);
    } else {
        b.token_change(trader, mint, tokens, 0);
        b.lamports(start, start + lamports - FEE);
    }
    return b.build();
}

// Returns scripted batches per address, one batch per fetch
class ScriptedSource : public TransactionSource {
public:
    void push_batch(const std::string& address, std::vector<RawTransaction> batch) {
        std::lock_guard lock(mutex_);
        batches_[address].push_back(std::move(batch));
    }

    void fail(const std::string& address) {
        std::lock_guard lock(mutex_);
        failing_.insert(address);
    }

    std::vector<RawTransaction> fetch_recent(
        const std::string& address,
        const std::optional<std::string>& since_cursor) override {
        std::lock_guard lock(mutex_);
        calls_[address]++;
        cursors_[address].push_back(since_cursor);
        if (failing_.count(address) > 0) {
            throw RpcError("request to " + address + " timed out");
        }
        auto& queue = batches_[address];
        if (queue.empty()) return {};
        auto batch = std::move(queue.front());
        queue.pop_front();
        return batch;
    }

    [[nodiscard]] int calls(const std::string& address) const {
        std::lock_guard lock(mutex_);
        auto it = calls_.find(address);
        return it == calls_.end() ? 0 : it->second;
    }

    [[nodiscard]] std::vector<std::optional<std::string>> cursors(const std::string& address) const {
        std::lock_guard lock(mutex_);
        auto it = cursors_.find(address);
        return it == cursors_.end() ? std::vector<std::optional<std::string>>{} : it->second;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::deque<std::vector<RawTransaction>>> batches_;
    std::set<std::string> failing_;
    std::map<std::string, int> calls_;
    std::map<std::string, std::vector<std::optional<std::string>>> cursors_;
};

// Executor whose fills are completed by the test
class ManualExecutor : public OrderExecutor {
public:
    struct Order {
        TradeDirection side;
        std::string token;
        uint64_t amount;
        std::promise<ExecutionReceipt> promise;
    };

    [[nodiscard]] std::string_view name() const override { return "manual"; }

    std::future<ExecutionReceipt> submit_buy(
        const std::string& token, uint64_t quote_lamports, uint16_t) override {
        return add(TradeDirection::Buy, token, quote_lamports);
    }

    std::future<ExecutionReceipt> submit_sell(
        const std::string& token, uint64_t base_amount, uint16_t) override {
        return add(TradeDirection::Sell, token, base_amount);
    }

    void fill(size_t index, uint64_t base_amount, double price) {
        auto& o = orders.at(index);
        ExecutionReceipt r;
        r.token = o.token;
        r.side = o.side;
        r.base_amount = base_amount;
        r.quote_amount = sol_to_lamports(price * static_cast<double>(base_amount));
        r.price = price;
        r.signature = "fill-" + std::to_string(index);
        o.promise.set_value(r);
    }

    void reject(size_t index, const std::string& reason) {
        orders.at(index).promise.set_exception(std::make_exception_ptr(ExecutionError(reason)));
    }

    std::vector<Order> orders;

private:
    std::future<ExecutionReceipt> add(TradeDirection side, const std::string& token, uint64_t amount) {
        Order o{side, token, amount, {}};
        auto future = o.promise.get_future();
        orders.push_back(std::move(o));
        return future;
    }
};

}  // namespace dexpilot::test
