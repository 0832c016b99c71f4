// DexPilot - Position Tracker Implementation

#include <dexpilot/position.hpp>
#include <mutex>

namespace dexpilot {

std::string_view to_string(PositionErrorKind kind) noexcept {
    switch (kind) {
        case PositionErrorKind::InsufficientQuantity: return "insufficient_quantity";
        case PositionErrorKind::NotFound: return "not_found";
        case PositionErrorKind::InvalidQuantity: return "invalid_quantity";
    }
    return "unknown";
}

PositionTracker::PositionTracker(size_t max_closed_history)
    : max_closed_history_(max_closed_history) {}

Position PositionTracker::open_or_increase(const std::string& token, uint64_t quantity,
                                           double price, int64_t timestamp) {
    if (quantity == 0) {
        throw PositionError(PositionErrorKind::InvalidQuantity, "zero quantity for " + token);
    }
    if (!(price > 0.0)) {
        throw PositionError(PositionErrorKind::InvalidQuantity, "non-positive price for " + token);
    }

    std::unique_lock lock(mutex_);
    auto it = open_.find(token);
    if (it == open_.end()) {
        Position pos;
        pos.token = token;
        pos.quantity = quantity;
        pos.cost_basis = price;
        pos.entry_time = timestamp;
        pos.updated_time = timestamp;
        pos.status = PositionStatus::Open;
        open_.emplace(token, pos);
        return pos;
    }

    auto& pos = it->second;
    double old_qty = static_cast<double>(pos.quantity);
    double add_qty = static_cast<double>(quantity);
    pos.cost_basis = (old_qty * pos.cost_basis + add_qty * price) / (old_qty + add_qty);
    pos.quantity += quantity;
    pos.updated_time = timestamp;
    return pos;
}

double PositionTracker::decrease_or_close(const std::string& token, uint64_t quantity,
                                          double price, int64_t timestamp) {
    if (quantity == 0) {
        throw PositionError(PositionErrorKind::InvalidQuantity, "zero quantity for " + token);
    }

    std::unique_lock lock(mutex_);
    auto it = open_.find(token);
    if (it == open_.end()) {
        throw PositionError(PositionErrorKind::NotFound, "no open position for " + token);
    }

    auto& pos = it->second;
    if (quantity > pos.quantity) {
        throw PositionError(PositionErrorKind::InsufficientQuantity,
            "sell " + std::to_string(quantity) + " exceeds held " +
            std::to_string(pos.quantity) + " for " + token);
    }

    double pnl = (price - pos.cost_basis) * static_cast<double>(quantity);
    pos.quantity -= quantity;
    pos.realized_pnl += pnl;
    pos.updated_time = timestamp;
    realized_pnl_ += pnl;

    if (pos.quantity == 0) {
        pos.status = PositionStatus::Closed;
        closed_.push_back(pos);
        while (closed_.size() > max_closed_history_) {
            closed_.pop_front();
        }
        open_.erase(it);
    }
    return pnl;
}

std::optional<Position> PositionTracker::get(const std::string& token) const {
    std::shared_lock lock(mutex_);
    auto it = open_.find(token);
    if (it == open_.end()) return std::nullopt;
    return it->second;
}

bool PositionTracker::has_open(const std::string& token) const {
    std::shared_lock lock(mutex_);
    return open_.count(token) > 0;
}

std::vector<Position> PositionTracker::list_open() const {
    std::shared_lock lock(mutex_);
    std::vector<Position> out;
    out.reserve(open_.size());
    for (const auto& [token, pos] : open_) {
        out.push_back(pos);
    }
    return out;
}

std::vector<Position> PositionTracker::list_closed() const {
    std::shared_lock lock(mutex_);
    return {closed_.begin(), closed_.end()};
}

size_t PositionTracker::open_count() const {
    std::shared_lock lock(mutex_);
    return open_.size();
}

PositionSummary PositionTracker::summary() const {
    std::shared_lock lock(mutex_);
    PositionSummary s;
    s.open_positions = open_.size();
    s.closed_positions = closed_.size();
    s.realized_pnl_sol = realized_pnl_;
    for (const auto& [token, pos] : open_) {
        s.total_cost_sol += pos.cost_sol();
    }
    return s;
}

}  // namespace dexpilot
