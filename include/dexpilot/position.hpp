// DexPilot - Position Tracker
// Authoritative record of the service's own holdings

#pragma once

#include <dexpilot/types.hpp>
#include <deque>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace dexpilot {

enum class PositionErrorKind : uint8_t {
    InsufficientQuantity,
    NotFound,
    InvalidQuantity
};

[[nodiscard]] std::string_view to_string(PositionErrorKind kind) noexcept;

class PositionError : public std::runtime_error {
public:
    PositionError(PositionErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    [[nodiscard]] PositionErrorKind kind() const noexcept { return kind_; }

private:
    PositionErrorKind kind_;
};

struct PositionSummary {
    size_t open_positions = 0;
    size_t closed_positions = 0;
    double total_cost_sol = 0.0;
    double realized_pnl_sol = 0.0;
};

// Thread-safe position tracker. One open position per token.
// Failed operations leave state untouched.
class PositionTracker {
public:
    explicit PositionTracker(size_t max_closed_history = 1000);

    // Weighted-average basis: (q0*b0 + q*p) / (q0 + q). Price must be positive,
    // so an open position always has a positive basis.
    Position open_or_increase(const std::string& token, uint64_t quantity, double price,
                              int64_t timestamp = now_ms());

    // Returns realized PnL in SOL: (price - basis) * quantity.
    // Closes the position when the remaining quantity is zero.
    double decrease_or_close(const std::string& token, uint64_t quantity, double price,
                             int64_t timestamp = now_ms());

    [[nodiscard]] std::optional<Position> get(const std::string& token) const;
    [[nodiscard]] bool has_open(const std::string& token) const;
    [[nodiscard]] std::vector<Position> list_open() const;
    [[nodiscard]] std::vector<Position> list_closed() const;
    [[nodiscard]] size_t open_count() const;
    [[nodiscard]] PositionSummary summary() const;

private:
    size_t max_closed_history_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Position> open_;
    std::deque<Position> closed_;
    double realized_pnl_ = 0.0;
};

}  // namespace dexpilot
