// DexPilot - DEX Monitor
// Per-protocol polling: fetch, decode, log, price

#pragma once

#include <dexpilot/adapter.hpp>
#include <dexpilot/price.hpp>
#include <dexpilot/source.hpp>
#include <dexpilot/transaction_log.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace dexpilot {

struct DexMonitorStats {
    uint64_t ticks = 0;
    uint64_t fetched = 0;
    uint64_t events = 0;
    uint64_t duplicates = 0;
    uint64_t decode_errors = 0;
    uint64_t prices = 0;
    uint64_t degenerate = 0;
    uint64_t fetch_errors = 0;
};

class DexMonitor {
public:
    DexMonitor(std::unique_ptr<ProtocolAdapter> adapter,
               std::shared_ptr<TransactionSource> source,
               std::shared_ptr<TransactionLog> log,
               std::shared_ptr<PriceCache> prices);

    [[nodiscard]] DexType dex_type() const noexcept { return adapter_->dex_type(); }
    [[nodiscard]] std::string_view name() const noexcept { return adapter_->name(); }

    // Runs one fetch over the protocol's program address. RpcError from the
    // source propagates after being counted. Returns events appended.
    size_t tick();

    // Decodes and records a batch; used by tick() and for injected data
    size_t process(const std::vector<RawTransaction>& transactions);

    [[nodiscard]] DexMonitorStats stats() const noexcept;

private:
    std::unique_ptr<ProtocolAdapter> adapter_;
    std::shared_ptr<TransactionSource> source_;
    std::shared_ptr<TransactionLog> log_;
    std::shared_ptr<PriceCache> prices_;

    std::mutex cursor_mutex_;
    std::optional<std::string> cursor_;

    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> fetched_{0};
    std::atomic<uint64_t> events_{0};
    std::atomic<uint64_t> duplicates_{0};
    std::atomic<uint64_t> decode_errors_{0};
    std::atomic<uint64_t> prices_updated_{0};
    std::atomic<uint64_t> degenerate_{0};
    std::atomic<uint64_t> fetch_errors_{0};
};

}  // namespace dexpilot
