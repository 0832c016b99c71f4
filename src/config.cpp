// DexPilot - Configuration Implementation

#include <dexpilot/config.hpp>
#include <dexpilot/transaction.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace dexpilot {

// Simple TOML parser (sections, scalars, single-line string arrays)
namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && (s[0] == '"' || s[0] == '\'') && s.back() == s[0]) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// Drops a trailing "# comment" outside of quotes
std::string strip_comment(const std::string& s) {
    bool quoted = false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') quoted = !quoted;
        else if (s[i] == '#' && !quoted) return s.substr(0, i);
    }
    return s;
}

std::vector<std::string> parse_array(const std::string& value) {
    std::vector<std::string> items;
    if (value.size() < 2 || value.front() != '[' || value.back() != ']') {
        throw ConfigError("Expected array, got: " + value);
    }
    std::string body = value.substr(1, value.size() - 2);
    std::stringstream ss(body);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) items.push_back(unquote(item));
    }
    return items;
}

bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "true") return true;
    if (value == "false") return false;
    throw ConfigError("Invalid boolean for " + key + ": " + value);
}

int parse_int(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        int v = std::stoi(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::logic_error&) {
        throw ConfigError("Invalid integer for " + key + ": " + value);
    }
}

double parse_double(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        double v = std::stod(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::logic_error&) {
        throw ConfigError("Invalid number for " + key + ": " + value);
    }
}

size_t parse_size(const std::string& key, const std::string& value) {
    int v = parse_int(key, value);
    if (v < 0) throw ConfigError(key + " must not be negative");
    return static_cast<size_t>(v);
}

uint16_t parse_bps(const std::string& key, const std::string& value) {
    int v = parse_int(key, value);
    if (v < 0 || v > 10000) throw ConfigError(key + " must be within 0..10000 bps");
    return static_cast<uint16_t>(v);
}

}  // namespace

std::string_view to_string(OpenPositionPolicy policy) noexcept {
    return policy == OpenPositionPolicy::Ignore ? "ignore" : "add";
}

OpenPositionPolicy parse_open_position_policy(std::string_view name) {
    if (name == "ignore") return OpenPositionPolicy::Ignore;
    if (name == "add") return OpenPositionPolicy::Add;
    throw ConfigError("Unknown open_position_policy: " + std::string(name));
}

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    Config config = from_toml(buffer.str());
    config.validate();
    return config;
}

Config Config::from_toml(std::string_view content) {
    Config config;
    std::string current_section;
    std::string current_subsection;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(strip_comment(line));

        // Skip empty lines and comments
        if (line.empty()) continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                throw ConfigError("Unterminated section header: " + line);
            }
            std::string section = line.substr(1, end - 1);

            // Check for subsection [section.name]
            auto dot = section.find('.');
            if (dot != std::string::npos) {
                current_section = section.substr(0, dot);
                current_subsection = section.substr(dot + 1);
            } else {
                current_section = section;
                current_subsection.clear();
            }
            continue;
        }

        // Key-value pair
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string raw = trim(line.substr(eq + 1));
        std::string value = unquote(raw);

        if (current_section == "general") {
            if (key == "log_level") config.logging.level = value;
        }
        else if (current_section == "logging") {
            if (key == "log_level" || key == "level") config.logging.level = value;
            else if (key == "log_to_file") config.logging.log_to_file = parse_bool(key, value);
            else if (key == "log_file_path") config.logging.file_path = value;
            else if (key == "max_file_size_mb") config.logging.max_file_size_mb = parse_size(key, value);
            else if (key == "max_files") config.logging.max_files = parse_size(key, value);
        }
        else if (current_section == "rpc") {
            if (key == "url") config.rpc.url = value;
            else if (key == "timeout_ms") config.rpc.timeout_ms = parse_int(key, value);
            else if (key == "fetch_limit") config.rpc.fetch_limit = parse_size(key, value);
            else if (key == "commitment") config.rpc.commitment = value;
        }
        else if (current_section == "dex_monitoring") {
            auto& dm = config.dex_monitoring;
            if (key == "enabled") dm.enabled = parse_bool(key, value);
            else if (key == "interval_seconds") dm.interval_seconds = parse_int(key, value);
            else if (key == "protocols") {
                dm.protocols.clear();
                for (const auto& name : parse_array(raw)) {
                    dm.protocols.push_back(parse_dex_type(name));
                }
            }
        }
        else if (current_section == "dex" && !current_subsection.empty()) {
            auto type = parse_dex_type(current_subsection);
            if (key == "interval_seconds") {
                config.dex_monitoring.interval_overrides[type] = parse_int(key, value);
            }
        }
        else if (current_section == "price_cache") {
            if (key == "ttl_seconds") config.price_cache.ttl_seconds = parse_int(key, value);
        }
        else if (current_section == "transaction_log") {
            if (key == "retention_seconds") config.transaction_log.retention_seconds = parse_int(key, value);
            else if (key == "max_events") config.transaction_log.max_events = parse_size(key, value);
        }
        else if (current_section == "wallet_monitoring") {
            auto& wm = config.wallet_monitoring;
            if (key == "enabled") wm.enabled = parse_bool(key, value);
            else if (key == "wallets" || key == "wallet_addresses") wm.wallets = parse_array(raw);
            else if (key == "min_buy_amount_sol") wm.min_buy_amount_sol = parse_double(key, value);
            else if (key == "interval_seconds") wm.interval_seconds = parse_int(key, value);
            else if (key == "seen_retention_seconds") wm.seen_retention_seconds = parse_int(key, value);
            else if (key == "skip_history") wm.skip_history = parse_bool(key, value);
        }
        else if (current_section == "copy_trading") {
            auto& ct = config.copy_trading;
            if (key == "enabled") ct.enabled = parse_bool(key, value);
            else if (key == "buy_ratio") ct.buy_ratio = parse_double(key, value);
            else if (key == "min_buy_amount_sol") ct.min_buy_amount_sol = parse_double(key, value);
            else if (key == "max_buy_amount_sol") ct.max_buy_amount_sol = parse_double(key, value);
            else if (key == "open_position_policy") ct.open_position_policy = parse_open_position_policy(value);
            else if (key == "slippage_bps") ct.slippage_bps = parse_bps(key, value);
            else if (key == "signal_queue_capacity") ct.signal_queue_capacity = parse_size(key, value);
        }
        else if (current_section == "take_profit_stop_loss") {
            auto& tp = config.take_profit_stop_loss;
            if (key == "enabled") tp.enabled = parse_bool(key, value);
            else if (key == "take_profit_percentage") tp.take_profit_percentage = parse_double(key, value);
            else if (key == "stop_loss_percentage") tp.stop_loss_percentage = parse_double(key, value);
            else if (key == "slippage_bps") tp.slippage_bps = parse_bps(key, value);
        }
        else if (current_section == "orchestrator") {
            auto& oc = config.orchestrator;
            if (key == "strategy_interval_seconds") oc.strategy_interval_seconds = parse_int(key, value);
            else if (key == "cleanup_interval_seconds") oc.cleanup_interval_seconds = parse_int(key, value);
            else if (key == "status_interval_seconds") oc.status_interval_seconds = parse_int(key, value);
        }
    }

    return config;
}

void Config::validate() const {
    static const std::vector<std::string> levels = {"trace", "debug", "info", "warn", "error"};
    if (std::find(levels.begin(), levels.end(), logging.level) == levels.end()) {
        throw ConfigError("Invalid log level: " + logging.level);
    }
    if (logging.log_to_file && logging.file_path.empty()) {
        throw ConfigError("log_file_path is required when log_to_file is enabled");
    }

    if (rpc.url.empty()) throw ConfigError("rpc.url must not be empty");
    if (rpc.timeout_ms <= 0) throw ConfigError("rpc.timeout_ms must be positive");
    if (rpc.fetch_limit == 0) throw ConfigError("rpc.fetch_limit must be positive");

    if (dex_monitoring.enabled) {
        if (dex_monitoring.protocols.empty()) {
            throw ConfigError("dex_monitoring enabled with no protocols");
        }
        for (auto type : dex_monitoring.protocols) {
            if (dex_monitoring.interval_for(type) <= 0) {
                throw ConfigError("Monitoring interval for " + std::string(to_string(type)) +
                                  " must be positive");
            }
        }
    }
    if (price_cache.ttl_seconds <= 0) throw ConfigError("price_cache.ttl_seconds must be positive");
    if (transaction_log.retention_seconds <= 0) {
        throw ConfigError("transaction_log.retention_seconds must be positive");
    }
    if (transaction_log.max_events == 0) throw ConfigError("transaction_log.max_events must be positive");

    if (wallet_monitoring.enabled) {
        if (wallet_monitoring.wallets.empty()) {
            throw ConfigError("wallet_monitoring enabled with no wallets");
        }
        for (const auto& wallet : wallet_monitoring.wallets) {
            if (!is_valid_pubkey(wallet)) {
                throw ConfigError("Invalid wallet address: " + wallet);
            }
        }
        if (wallet_monitoring.interval_seconds <= 0) {
            throw ConfigError("wallet_monitoring.interval_seconds must be positive");
        }
    }
    if (wallet_monitoring.min_buy_amount_sol < 0.0) {
        throw ConfigError("wallet_monitoring.min_buy_amount_sol must not be negative");
    }
    if (wallet_monitoring.seen_retention_seconds <= 0) {
        throw ConfigError("wallet_monitoring.seen_retention_seconds must be positive");
    }

    if (copy_trading.buy_ratio <= 0.0) throw ConfigError("copy_trading.buy_ratio must be positive");
    if (copy_trading.min_buy_amount_sol < 0.0) {
        throw ConfigError("copy_trading.min_buy_amount_sol must not be negative");
    }
    if (copy_trading.max_buy_amount_sol < copy_trading.min_buy_amount_sol) {
        throw ConfigError("copy_trading.max_buy_amount_sol must be >= min_buy_amount_sol");
    }
    if (copy_trading.signal_queue_capacity == 0) {
        throw ConfigError("copy_trading.signal_queue_capacity must be positive");
    }

    if (take_profit_stop_loss.enabled) {
        if (take_profit_stop_loss.take_profit_percentage <= 0.0) {
            throw ConfigError("take_profit_percentage must be positive");
        }
        if (take_profit_stop_loss.stop_loss_percentage <= 0.0) {
            throw ConfigError("stop_loss_percentage must be positive");
        }
    }

    if (orchestrator.strategy_interval_seconds <= 0 ||
        orchestrator.cleanup_interval_seconds <= 0 ||
        orchestrator.status_interval_seconds <= 0) {
        throw ConfigError("orchestrator intervals must be positive");
    }
}

}  // namespace dexpilot
