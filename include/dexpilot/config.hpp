// DexPilot - Configuration
// Builder pattern for fluent configuration

#pragma once

#include <dexpilot/types.hpp>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace dexpilot {

struct LoggingConfig {
    std::string level = "info";
    bool log_to_file = false;
    std::string file_path = "logs/dexpilot.log";
    size_t max_file_size_mb = 10;
    size_t max_files = 5;
};

// Solana JSON-RPC endpoint
struct RpcConfig {
    std::string url = "https://api.mainnet-beta.solana.com";
    int timeout_ms = 10000;
    size_t fetch_limit = 25;
    std::string commitment = "confirmed";
};

struct DexMonitoringConfig {
    bool enabled = true;
    std::vector<DexType> protocols = all_dex_types();
    int interval_seconds = 5;
    std::map<DexType, int> interval_overrides;

    [[nodiscard]] int interval_for(DexType type) const {
        auto it = interval_overrides.find(type);
        return it != interval_overrides.end() ? it->second : interval_seconds;
    }
};

struct PriceCacheConfig {
    int ttl_seconds = 300;
};

struct TransactionLogConfig {
    int retention_seconds = 86400;
    size_t max_events = 1000;
};

struct WalletMonitoringConfig {
    bool enabled = false;
    std::vector<std::string> wallets;
    double min_buy_amount_sol = 0.1;
    int interval_seconds = 5;
    int seen_retention_seconds = 86400;
    // First poll of a wallet only records its history, no signals
    bool skip_history = true;
};

// What a copy signal does for a token already held
enum class OpenPositionPolicy : uint8_t {
    Ignore,
    Add
};

[[nodiscard]] std::string_view to_string(OpenPositionPolicy policy) noexcept;
[[nodiscard]] OpenPositionPolicy parse_open_position_policy(std::string_view name);

struct CopyTradingConfig {
    bool enabled = true;
    double buy_ratio = 0.5;
    double min_buy_amount_sol = 0.01;
    double max_buy_amount_sol = 1.0;
    OpenPositionPolicy open_position_policy = OpenPositionPolicy::Ignore;
    uint16_t slippage_bps = 300;
    size_t signal_queue_capacity = 256;
};

// Thresholds in percent (20.0 = 20%)
struct TakeProfitStopLossConfig {
    bool enabled = true;
    double take_profit_percentage = 20.0;
    double stop_loss_percentage = 10.0;
    uint16_t slippage_bps = 500;

    [[nodiscard]] double take_profit() const noexcept { return take_profit_percentage / 100.0; }
    [[nodiscard]] double stop_loss() const noexcept { return stop_loss_percentage / 100.0; }
};

struct OrchestratorConfig {
    int strategy_interval_seconds = 10;
    int cleanup_interval_seconds = 60;
    int status_interval_seconds = 30;
};

// Main service configuration
class Config {
public:
    LoggingConfig logging;
    RpcConfig rpc;
    DexMonitoringConfig dex_monitoring;
    PriceCacheConfig price_cache;
    TransactionLogConfig transaction_log;
    WalletMonitoringConfig wallet_monitoring;
    CopyTradingConfig copy_trading;
    TakeProfitStopLossConfig take_profit_stop_loss;
    OrchestratorConfig orchestrator;

    Config() = default;

    // Load from TOML file (validated)
    static Config from_file(std::string_view path);

    // Load from TOML string (not validated)
    static Config from_toml(std::string_view content);

    // Throws ConfigError on the first invalid setting
    void validate() const;

    // Builder methods
    Config& with_rpc(std::string_view url, int timeout_ms = 10000) {
        rpc.url = std::string(url);
        rpc.timeout_ms = timeout_ms;
        return *this;
    }

    Config& with_protocols(std::vector<DexType> protocols) {
        dex_monitoring.protocols = std::move(protocols);
        return *this;
    }

    Config& with_wallet(std::string_view address) {
        wallet_monitoring.wallets.emplace_back(address);
        wallet_monitoring.enabled = true;
        return *this;
    }

    Config& set_copy_bounds(double ratio, double min_sol, double max_sol) {
        copy_trading.buy_ratio = ratio;
        copy_trading.min_buy_amount_sol = min_sol;
        copy_trading.max_buy_amount_sol = max_sol;
        return *this;
    }

    Config& set_thresholds(double take_profit_pct, double stop_loss_pct) {
        take_profit_stop_loss.take_profit_percentage = take_profit_pct;
        take_profit_stop_loss.stop_loss_percentage = stop_loss_pct;
        return *this;
    }

    Config& set_price_ttl(int seconds) {
        price_cache.ttl_seconds = seconds;
        return *this;
    }

    Config& enable_file_logging(std::string_view path) {
        logging.log_to_file = true;
        logging.file_path = std::string(path);
        return *this;
    }
};

}  // namespace dexpilot
