// DexPilot - Price Derivation and Cache Implementation

#include <dexpilot/price.hpp>
#include <algorithm>
#include <mutex>

namespace dexpilot {

TokenPrice derive_price(const CanonicalTradeEvent& event) {
    if (event.base_amount == 0) {
        throw DerivationError(DerivationErrorKind::DegenerateAmount,
            "zero base amount in " + event.signature);
    }

    TokenPrice price;
    price.token = event.token;
    price.price_sol = event.quote_sol() / static_cast<double>(event.base_amount);
    price.volume_sol = event.quote_sol();
    price.timestamp = event.timestamp;
    price.source = std::string(to_string(event.protocol));
    return price;
}

PriceCache::PriceCache(int64_t ttl_ms) : ttl_ms_(ttl_ms) {}

bool PriceCache::update(const TokenPrice& observation) {
    std::unique_lock lock(mutex_);

    auto [it, fresh] = prices_.try_emplace(observation.token);
    auto& entry = it->second;
    if (observation.volume_sol) {
        entry.trades.emplace_back(observation.timestamp, *observation.volume_sol);
    }

    bool applied = fresh || entry.price.timestamp <= observation.timestamp;
    if (applied) {
        entry.price = observation;
    }
    entry.price.volume_sol = window_volume(entry);

    if (applied && observation.timestamp > last_update_) {
        last_update_ = observation.timestamp;
    }
    return applied;
}

double PriceCache::window_volume(Entry& entry) const {
    // Trades in (latest - ttl, latest], latest being the entry's timestamp
    int64_t cutoff = entry.price.timestamp - ttl_ms_;
    auto& trades = entry.trades;
    trades.erase(std::remove_if(trades.begin(), trades.end(),
                                [cutoff](const auto& t) { return t.first <= cutoff; }),
                 trades.end());
    double total = 0.0;
    for (const auto& t : trades) total += t.second;
    return total;
}

std::optional<TokenPrice> PriceCache::get(const std::string& token) const {
    return get(token, now_ms());
}

std::optional<TokenPrice> PriceCache::get(const std::string& token, int64_t now) const {
    std::shared_lock lock(mutex_);
    auto it = prices_.find(token);
    if (it == prices_.end() || expired(it->second.price, now)) {
        return std::nullopt;
    }
    return it->second.price;
}

std::vector<TokenPrice> PriceCache::all() const {
    return all(now_ms());
}

std::vector<TokenPrice> PriceCache::all(int64_t now) const {
    std::shared_lock lock(mutex_);
    std::vector<TokenPrice> out;
    out.reserve(prices_.size());
    for (const auto& [token, entry] : prices_) {
        if (!expired(entry.price, now)) out.push_back(entry.price);
    }
    return out;
}

size_t PriceCache::sweep(int64_t now) {
    std::unique_lock lock(mutex_);
    size_t removed = 0;
    for (auto it = prices_.begin(); it != prices_.end();) {
        if (expired(it->second.price, now)) {
            it = prices_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t PriceCache::size() const {
    std::shared_lock lock(mutex_);
    return prices_.size();
}

int64_t PriceCache::last_update() const {
    std::shared_lock lock(mutex_);
    return last_update_;
}

void PriceCache::clear() {
    std::unique_lock lock(mutex_);
    prices_.clear();
    last_update_ = 0;
}

}  // namespace dexpilot
