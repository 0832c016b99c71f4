// DexPilot - Service Orchestrator Implementation

#include <dexpilot/service.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace dexpilot {

using json = nlohmann::json;

namespace {

std::chrono::milliseconds seconds(int s) {
    return std::chrono::milliseconds(static_cast<int64_t>(s) * 1000);
}

}  // namespace

json ServiceStatus::to_json() const {
    json protocols_json = json::array();
    for (const auto& p : protocols) {
        protocols_json.push_back({
            {"protocol", std::string(to_string(p.type))},
            {"running", p.running},
            {"ticks", p.stats.ticks},
            {"fetched", p.stats.fetched},
            {"events", p.stats.events},
            {"duplicates", p.stats.duplicates},
            {"decode_errors", p.stats.decode_errors},
            {"prices", p.stats.prices},
            {"degenerate", p.stats.degenerate},
            {"fetch_errors", p.stats.fetch_errors},
            {"task_failures", p.task_failures}
        });
    }

    return {
        {"running", running},
        {"dex_monitoring", dex_monitoring},
        {"wallet_monitoring", wallet_monitoring},
        {"watched_wallets", watched_wallets},
        {"open_positions", open_positions},
        {"transactions", transactions},
        {"cached_prices", cached_prices},
        {"pending_signals", pending_signals},
        {"seen_signatures", seen_signatures},
        {"protocols", protocols_json},
        {"strategy", {
            {"signals_consumed", strategy.signals_consumed},
            {"signals_skipped", strategy.signals_skipped},
            {"buy_intents", strategy.buy_intents},
            {"sell_intents", strategy.sell_intents},
            {"take_profits", strategy.take_profits},
            {"stop_losses", strategy.stop_losses},
            {"skipped_no_price", strategy.skipped_no_price}
        }},
        {"execution", {
            {"submitted", execution.submitted},
            {"completed", execution.completed},
            {"failed", execution.failed},
            {"pending", execution.pending},
            {"success_rate", execution.success_rate()}
        }},
        {"positions", {
            {"open", positions.open_positions},
            {"closed", positions.closed_positions},
            {"total_cost_sol", positions.total_cost_sol},
            {"realized_pnl_sol", positions.realized_pnl_sol}
        }},
        {"wallet_signals", wallet_signals},
        {"wallet_errors", wallet_errors}
    };
}

Service::Service(Config config,
                 std::shared_ptr<TransactionSource> source,
                 std::shared_ptr<OrderExecutor> executor)
    : config_(std::move(config)), source_(std::move(source)) {
    config_.validate();
    if (!source_) {
        throw ConfigError("Service requires a transaction source");
    }

    prices_ = std::make_shared<PriceCache>(static_cast<int64_t>(config_.price_cache.ttl_seconds) * 1000);
    log_ = std::make_shared<TransactionLog>(
        static_cast<int64_t>(config_.transaction_log.retention_seconds) * 1000,
        config_.transaction_log.max_events);
    positions_ = std::make_shared<PositionTracker>();
    signals_ = std::make_shared<SignalQueue>(config_.copy_trading.signal_queue_capacity);
    executor_ = executor ? std::move(executor) : std::make_shared<PaperOrderExecutor>(prices_);
    strategy_ = std::make_shared<StrategyEngine>(
        config_.copy_trading, config_.take_profit_stop_loss, prices_, positions_, signals_,
        static_cast<int64_t>(config_.wallet_monitoring.seen_retention_seconds) * 1000);
    dispatcher_ = std::make_shared<IntentDispatcher>(executor_, positions_, strategy_);

    for (auto type : config_.dex_monitoring.protocols) {
        dex_monitors_.push_back(std::make_unique<DexMonitor>(
            AdapterFactory::create(type), source_, log_, prices_));
    }
    wallet_monitor_ = std::make_unique<WalletMonitor>(config_.wallet_monitoring, source_, signals_);

    spdlog::info("Service configured: {} protocols, {} wallets, executor {}",
                 dex_monitors_.size(), config_.wallet_monitoring.wallets.size(), executor_->name());
}

Service::~Service() {
    stop();
}

void Service::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;  // Already running
    }

    spdlog::info("Starting service");
    if (config_.dex_monitoring.enabled) start_dex_monitoring();
    if (config_.wallet_monitoring.enabled) start_wallet_monitoring();

    std::lock_guard lock(tasks_mutex_);
    strategy_task_ = std::make_unique<PeriodicTask>(
        "strategy", seconds(config_.orchestrator.strategy_interval_seconds),
        [this] { run_strategy_once(); });
    cleanup_task_ = std::make_unique<PeriodicTask>(
        "cleanup", seconds(config_.orchestrator.cleanup_interval_seconds),
        [this] { run_cleanup_once(); });
    status_task_ = std::make_unique<PeriodicTask>(
        "status", seconds(config_.orchestrator.status_interval_seconds),
        [this] { log_status(); });
    strategy_task_->start();
    cleanup_task_->start();
    status_task_->start();
}

void Service::stop() {
    // Monitoring may have been started without start(), so always tear down
    if (running_.exchange(false)) {
        spdlog::info("Stopping service");
    }
    stop_wallet_monitoring();
    stop_dex_monitoring();

    // Join outside the lock: the status task reads tasks_mutex_
    std::vector<std::unique_ptr<PeriodicTask>> tasks;
    {
        std::lock_guard lock(tasks_mutex_);
        for (auto* task : {&strategy_task_, &cleanup_task_, &status_task_}) {
            if (*task) tasks.push_back(std::move(*task));
        }
    }
    for (auto& task : tasks) {
        task->stop();
    }

    size_t settled = dispatcher_->drain(std::chrono::seconds(5));
    if (settled > 0) {
        spdlog::info("Settled {} outstanding orders on shutdown", settled);
    }
    if (dispatcher_->pending() > 0) {
        spdlog::warn("{} orders still outstanding at shutdown", dispatcher_->pending());
    }
}

void Service::start_dex_monitoring() {
    std::lock_guard lock(tasks_mutex_);
    if (!dex_tasks_.empty()) return;

    for (auto& monitor : dex_monitors_) {
        auto* m = monitor.get();
        auto interval = seconds(config_.dex_monitoring.interval_for(m->dex_type()));
        auto task = std::make_unique<PeriodicTask>(
            "dex:" + std::string(m->name()), interval, [m] { m->tick(); });
        task->start();
        dex_tasks_.push_back(std::move(task));
    }
    spdlog::info("DEX monitoring started for {} protocols", dex_tasks_.size());
}

void Service::stop_dex_monitoring() {
    std::vector<std::unique_ptr<PeriodicTask>> tasks;
    {
        std::lock_guard lock(tasks_mutex_);
        tasks.swap(dex_tasks_);
    }
    if (tasks.empty()) return;
    for (auto& task : tasks) {
        task->stop();
    }
    spdlog::info("DEX monitoring stopped");
}

bool Service::dex_monitoring_running() const {
    std::lock_guard lock(tasks_mutex_);
    return !dex_tasks_.empty();
}

void Service::start_wallet_monitoring() {
    std::lock_guard lock(tasks_mutex_);
    if (wallet_task_) return;

    auto* monitor = wallet_monitor_.get();
    wallet_task_ = std::make_unique<PeriodicTask>(
        "wallets", seconds(config_.wallet_monitoring.interval_seconds),
        [monitor] { monitor->tick(); });
    wallet_task_->start();
    spdlog::info("Wallet monitoring started for {} wallets", monitor->wallets().size());
}

void Service::stop_wallet_monitoring() {
    std::unique_ptr<PeriodicTask> task;
    {
        std::lock_guard lock(tasks_mutex_);
        task = std::move(wallet_task_);
    }
    if (!task) return;
    task->stop();
    spdlog::info("Wallet monitoring stopped");
}

bool Service::wallet_monitoring_running() const {
    std::lock_guard lock(tasks_mutex_);
    return wallet_task_ != nullptr;
}

void Service::run_strategy_once(int64_t now) {
    dispatcher_->poll(now);
    auto decisions = strategy_->tick(now);
    dispatcher_->dispatch(decisions, now);
}

void Service::run_cleanup_once(int64_t now) {
    size_t prices = prices_->sweep(now);
    size_t events = log_->sweep(now);
    size_t seen = wallet_monitor_->sweep(now);
    size_t consumed = strategy_->sweep(now);
    if (prices + events + seen + consumed > 0) {
        spdlog::debug("Cleanup removed {} prices, {} transactions, {} seen, {} consumed signals",
                      prices, events, seen, consumed);
    }
}

void Service::log_status() const {
    auto s = status();
    auto p = portfolio();
    spdlog::info("Status: {} wallets, {} open positions, {} transactions, {} prices, {} pending orders",
                 s.watched_wallets, s.open_positions, s.transactions, s.cached_prices, s.execution.pending);
    if (s.open_positions > 0) {
        spdlog::info("Portfolio: cost {:.4f} SOL, value {:.4f} SOL, pnl {:.4f} SOL ({:.2f}%), realized {:.4f} SOL",
                     p.total_cost_sol, p.current_value_sol, p.unrealized_pnl_sol,
                     p.unrealized_pnl_pct * 100.0, s.positions.realized_pnl_sol);
    }
}

std::vector<CanonicalTradeEvent> Service::recent_transactions(const TransactionFilter& filter) const {
    return log_->query(filter);
}

std::optional<TokenPrice> Service::price(const std::string& token) const {
    return prices_->get(token);
}

std::vector<TokenPrice> Service::all_prices() const {
    return prices_->all();
}

std::vector<Position> Service::open_positions() const {
    return positions_->list_open();
}

PortfolioSnapshot Service::portfolio() const {
    PortfolioSnapshot snap;
    for (const auto& pos : positions_->list_open()) {
        snap.total_cost_sol += pos.cost_sol();
        auto p = prices_->get(pos.token);
        if (p) {
            snap.current_value_sol += pos.value_at(p->price_sol);
        } else {
            snap.current_value_sol += pos.cost_sol();
            snap.unpriced_positions++;
        }
    }
    snap.unrealized_pnl_sol = snap.current_value_sol - snap.total_cost_sol;
    if (snap.total_cost_sol > 0.0) {
        snap.unrealized_pnl_pct = snap.unrealized_pnl_sol / snap.total_cost_sol;
    }
    return snap;
}

ServiceStatus Service::status() const {
    ServiceStatus s;
    s.running = running_.load();
    s.watched_wallets = wallet_monitor_->wallets().size();
    s.open_positions = positions_->open_count();
    s.transactions = log_->size();
    s.cached_prices = prices_->size();
    s.pending_signals = signals_->size();
    s.seen_signatures = wallet_monitor_->seen_count();
    s.strategy = strategy_->stats();
    s.execution = dispatcher_->stats();
    s.positions = positions_->summary();
    s.wallet_signals = wallet_monitor_->total_signals();
    s.wallet_errors = wallet_monitor_->total_errors();

    std::lock_guard lock(tasks_mutex_);
    s.dex_monitoring = !dex_tasks_.empty();
    s.wallet_monitoring = wallet_task_ != nullptr;
    for (size_t i = 0; i < dex_monitors_.size(); ++i) {
        ProtocolStatus ps;
        ps.type = dex_monitors_[i]->dex_type();
        ps.stats = dex_monitors_[i]->stats();
        if (i < dex_tasks_.size()) {
            ps.running = dex_tasks_[i]->is_running();
            ps.task_failures = dex_tasks_[i]->failures();
        }
        s.protocols.push_back(ps);
    }
    return s;
}

void Service::add_wallet(const std::string& address) {
    if (!is_valid_pubkey(address)) {
        throw ConfigError("Invalid wallet address: " + address);
    }
    wallet_monitor_->add_wallet(address);
}

bool Service::remove_wallet(const std::string& address) {
    return wallet_monitor_->remove_wallet(address);
}

void Service::simulate_wallet_buy(const std::string& wallet, const std::string& token, double amount_sol) {
    CopySignal signal;
    signal.wallet = wallet;
    signal.token = token;
    signal.amount_lamports = sol_to_lamports(amount_sol);
    signal.timestamp = now_ms();
    signal.signature = "simulated-" + std::to_string(simulated_.fetch_add(1) + 1) +
                       "-" + std::to_string(signal.timestamp);
    spdlog::info("Simulated buy: wallet {} bought {} for {:.4f} SOL", wallet, token, amount_sol);
    signals_->push(std::move(signal));
}

void Service::simulate_price_update(const std::string& token, double price_sol, const std::string& source) {
    TokenPrice p;
    p.token = token;
    p.price_sol = price_sol;
    p.timestamp = now_ms();
    p.source = source;
    prices_->update(p);
}

}  // namespace dexpilot
