// DexPilot - Core Types Implementation

#include <dexpilot/types.hpp>

namespace dexpilot {

std::string_view to_string(DexType type) noexcept {
    switch (type) {
        case DexType::RaydiumCpmm: return "raydium_cpmm";
        case DexType::PumpFun: return "pumpfun";
        case DexType::PumpSwap: return "pumpswap";
        case DexType::Bonk: return "bonk";
    }
    return "unknown";
}

std::string_view to_string(TradeDirection dir) noexcept {
    return dir == TradeDirection::Buy ? "buy" : "sell";
}

std::string_view to_string(PositionStatus status) noexcept {
    return status == PositionStatus::Open ? "open" : "closed";
}

std::string_view to_string(SellReason reason) noexcept {
    return reason == SellReason::TakeProfit ? "take_profit" : "stop_loss";
}

DexType parse_dex_type(std::string_view name) {
    for (auto type : all_dex_types()) {
        if (to_string(type) == name) return type;
    }
    // Accept the spellings used by other tooling
    if (name == "raydium" || name == "cpmm") return DexType::RaydiumCpmm;
    if (name == "pump_fun") return DexType::PumpFun;
    if (name == "pump_swap") return DexType::PumpSwap;
    if (name == "launchpad" || name == "raydium_launchpad") return DexType::Bonk;
    throw ConfigError("Unknown DEX protocol: " + std::string(name));
}

std::vector<DexType> all_dex_types() {
    return {DexType::RaydiumCpmm, DexType::PumpFun, DexType::PumpSwap, DexType::Bonk};
}

}  // namespace dexpilot
