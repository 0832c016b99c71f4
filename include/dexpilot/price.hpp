// DexPilot - Price Derivation and Cache
// Thread-safe latest-price store with TTL expiry

#pragma once

#include <dexpilot/types.hpp>
#include <cstdint>
#include <deque>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace dexpilot {

enum class DerivationErrorKind : uint8_t {
    DegenerateAmount
};

class DerivationError : public std::runtime_error {
public:
    DerivationError(DerivationErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    [[nodiscard]] DerivationErrorKind kind() const noexcept { return kind_; }

private:
    DerivationErrorKind kind_;
};

// Price of one raw base unit in SOL, from the event's own amounts.
// Throws DerivationError when the base amount is zero.
[[nodiscard]] TokenPrice derive_price(const CanonicalTradeEvent& event);

class PriceCache {
public:
    explicit PriceCache(int64_t ttl_ms);

    [[nodiscard]] int64_t ttl_ms() const noexcept { return ttl_ms_; }

    // Applies the observation unless the cached one is strictly newer.
    // Equal timestamps: the later call wins. Returns true if applied.
    // The observation's volume joins the token's rolling window either way;
    // the stored volume_sol covers trades within one TTL of the latest price.
    bool update(const TokenPrice& observation);

    // nullopt when absent or older than the TTL
    [[nodiscard]] std::optional<TokenPrice> get(const std::string& token) const;
    [[nodiscard]] std::optional<TokenPrice> get(const std::string& token, int64_t now) const;

    // Live entries only
    [[nodiscard]] std::vector<TokenPrice> all() const;
    [[nodiscard]] std::vector<TokenPrice> all(int64_t now) const;

    // Removes entries with now - timestamp > ttl; returns the number removed
    size_t sweep(int64_t now);
    size_t sweep() { return sweep(now_ms()); }

    [[nodiscard]] size_t size() const;
    [[nodiscard]] int64_t last_update() const;
    void clear();

private:
    [[nodiscard]] bool expired(const TokenPrice& p, int64_t now) const noexcept {
        return now - p.timestamp > ttl_ms_;
    }

    struct Entry {
        TokenPrice price;
        std::deque<std::pair<int64_t, double>> trades;  // (timestamp, SOL volume)
    };

    double window_volume(Entry& entry) const;

    int64_t ttl_ms_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> prices_;
    int64_t last_update_ = 0;
};

}  // namespace dexpilot
