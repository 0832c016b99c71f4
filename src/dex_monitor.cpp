// DexPilot - DEX Monitor Implementation

#include <dexpilot/dex_monitor.hpp>
#include <spdlog/spdlog.h>

namespace dexpilot {

DexMonitor::DexMonitor(std::unique_ptr<ProtocolAdapter> adapter,
                       std::shared_ptr<TransactionSource> source,
                       std::shared_ptr<TransactionLog> log,
                       std::shared_ptr<PriceCache> prices)
    : adapter_(std::move(adapter)),
      source_(std::move(source)),
      log_(std::move(log)),
      prices_(std::move(prices)) {}

size_t DexMonitor::tick() {
    ticks_.fetch_add(1, std::memory_order_relaxed);

    std::optional<std::string> cursor;
    {
        std::lock_guard lock(cursor_mutex_);
        cursor = cursor_;
    }

    std::vector<RawTransaction> transactions;
    try {
        transactions = source_->fetch_recent(std::string(adapter_->program_id()), cursor);
    } catch (const RpcError&) {
        fetch_errors_.fetch_add(1, std::memory_order_relaxed);
        throw;
    }

    if (!transactions.empty()) {
        std::lock_guard lock(cursor_mutex_);
        cursor_ = transactions.back().signature;
    }
    return process(transactions);
}

size_t DexMonitor::process(const std::vector<RawTransaction>& transactions) {
    fetched_.fetch_add(transactions.size(), std::memory_order_relaxed);
    size_t appended = 0;

    for (const auto& tx : transactions) {
        auto result = adapter_->decode(tx);
        if (!result.ok()) {
            if (result.error != DecodeError::ProgramMismatch) {
                decode_errors_.fetch_add(1, std::memory_order_relaxed);
                spdlog::debug("{}: skipped {} ({}: {})", name(), tx.signature,
                              to_string(result.error), result.detail);
            }
            continue;
        }

        const auto& event = *result.event;
        std::optional<TokenPrice> price;
        try {
            price = derive_price(event);
        } catch (const DerivationError& e) {
            degenerate_.fetch_add(1, std::memory_order_relaxed);
            spdlog::debug("{}: no price from {}: {}", name(), event.signature, e.what());
        }

        if (!log_->append(event)) {
            duplicates_.fetch_add(1, std::memory_order_relaxed);
            continue;
        }
        events_.fetch_add(1, std::memory_order_relaxed);
        ++appended;

        if (price && prices_->update(*price)) {
            prices_updated_.fetch_add(1, std::memory_order_relaxed);
        }
    }
    return appended;
}

DexMonitorStats DexMonitor::stats() const noexcept {
    DexMonitorStats s;
    s.ticks = ticks_.load(std::memory_order_relaxed);
    s.fetched = fetched_.load(std::memory_order_relaxed);
    s.events = events_.load(std::memory_order_relaxed);
    s.duplicates = duplicates_.load(std::memory_order_relaxed);
    s.decode_errors = decode_errors_.load(std::memory_order_relaxed);
    s.prices = prices_updated_.load(std::memory_order_relaxed);
    s.degenerate = degenerate_.load(std::memory_order_relaxed);
    s.fetch_errors = fetch_errors_.load(std::memory_order_relaxed);
    return s;
}

}  // namespace dexpilot
