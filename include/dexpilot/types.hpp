// DexPilot - Core Types
// Canonical trade events, prices, positions and order intents

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace dexpilot {

inline constexpr uint64_t LAMPORTS_PER_SOL = 1000000000ULL;
inline constexpr std::string_view WSOL_MINT = "So11111111111111111111111111111111111111112";

// Supported DEX protocols
enum class DexType : uint8_t {
    RaydiumCpmm,
    PumpFun,
    PumpSwap,
    Bonk
};

// Trade direction from the trader's point of view
enum class TradeDirection : uint8_t {
    Buy,
    Sell
};

enum class PositionStatus : uint8_t {
    Open,
    Closed
};

enum class SellReason : uint8_t {
    TakeProfit,
    StopLoss
};

// Configuration or input validation failure
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

[[nodiscard]] std::string_view to_string(DexType type) noexcept;
[[nodiscard]] std::string_view to_string(TradeDirection dir) noexcept;
[[nodiscard]] std::string_view to_string(PositionStatus status) noexcept;
[[nodiscard]] std::string_view to_string(SellReason reason) noexcept;

// Parses a protocol name ("raydium_cpmm", "pumpfun", "pumpswap", "bonk").
// Throws ConfigError for anything else.
[[nodiscard]] DexType parse_dex_type(std::string_view name);
[[nodiscard]] std::vector<DexType> all_dex_types();

[[nodiscard]] inline double lamports_to_sol(uint64_t lamports) noexcept {
    return static_cast<double>(lamports) / static_cast<double>(LAMPORTS_PER_SOL);
}

[[nodiscard]] inline uint64_t sol_to_lamports(double sol) noexcept {
    if (sol <= 0.0) return 0;
    return static_cast<uint64_t>(sol * static_cast<double>(LAMPORTS_PER_SOL) + 0.5);
}

// One normalized on-chain swap. Amounts are raw integer units:
// base in token units, quote in lamports.
struct CanonicalTradeEvent {
    DexType protocol = DexType::PumpFun;
    std::string token;
    TradeDirection direction = TradeDirection::Buy;
    uint64_t base_amount = 0;
    uint64_t quote_amount = 0;
    int64_t timestamp = 0;  // ms since epoch
    std::string signature;
    std::optional<std::string> pool;
    std::string trader;
    uint64_t slot = 0;
    uint8_t base_decimals = 0;

    [[nodiscard]] double quote_sol() const noexcept { return lamports_to_sol(quote_amount); }
    [[nodiscard]] bool is_buy() const noexcept { return direction == TradeDirection::Buy; }
};

// Latest observed price of a token, in SOL per raw base unit
struct TokenPrice {
    std::string token;
    double price_sol = 0.0;
    std::optional<double> price_usd;
    std::optional<double> volume_sol;
    int64_t timestamp = 0;
    std::string source;
};

// A watched wallet bought a token
struct CopySignal {
    std::string wallet;
    std::string token;
    uint64_t amount_lamports = 0;
    int64_t timestamp = 0;
    std::string signature;
    DexType protocol = DexType::PumpFun;

    [[nodiscard]] double amount_sol() const noexcept { return lamports_to_sol(amount_lamports); }
};

// Service-held position; quantity in raw base units
struct Position {
    std::string token;
    uint64_t quantity = 0;
    double cost_basis = 0.0;  // SOL per raw unit
    int64_t entry_time = 0;
    int64_t updated_time = 0;
    double realized_pnl = 0.0;  // SOL
    PositionStatus status = PositionStatus::Open;

    [[nodiscard]] bool is_open() const noexcept { return status == PositionStatus::Open; }
    [[nodiscard]] double cost_sol() const noexcept { return cost_basis * static_cast<double>(quantity); }
    [[nodiscard]] double value_at(double price) const noexcept { return price * static_cast<double>(quantity); }
};

struct BuyIntent {
    std::string token;
    uint64_t quote_amount = 0;  // lamports
    uint16_t slippage_bps = 0;
    std::string source_signature;
    std::string source_wallet;
    int64_t created_at = 0;
};

struct SellIntent {
    std::string token;
    uint64_t base_amount = 0;
    uint16_t slippage_bps = 0;
    SellReason reason = SellReason::TakeProfit;
    double trigger_price = 0.0;
    double pnl_pct = 0.0;
    int64_t created_at = 0;
};

// Result of a filled order
struct ExecutionReceipt {
    std::string token;
    TradeDirection side = TradeDirection::Buy;
    uint64_t base_amount = 0;
    uint64_t quote_amount = 0;
    double price = 0.0;
    std::string signature;
    int64_t timestamp = 0;
};

// Timestamp helpers
[[nodiscard]] inline int64_t now_ms() noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace dexpilot
