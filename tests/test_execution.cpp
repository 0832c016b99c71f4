// DexPilot - Execution Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "fixtures.hpp"

using namespace dexpilot;
using namespace dexpilot::test;
using Catch::Approx;

namespace {

void set_price(PriceCache& cache, const std::string& token, double price) {
    TokenPrice p;
    p.token = token;
    p.price_sol = price;
    p.timestamp = now_ms();
    cache.update(p);
}

struct DispatchFixture {
    std::shared_ptr<PriceCache> prices = std::make_shared<PriceCache>(300000);
    std::shared_ptr<PositionTracker> positions = std::make_shared<PositionTracker>();
    std::shared_ptr<SignalQueue> signals = std::make_shared<SignalQueue>(16);
    std::shared_ptr<StrategyEngine> strategy = std::make_shared<StrategyEngine>(
        CopyTradingConfig{}, TakeProfitStopLossConfig{}, prices, positions, signals);
    std::shared_ptr<ManualExecutor> executor = std::make_shared<ManualExecutor>();
    IntentDispatcher dispatcher{executor, positions, strategy};

    BuyIntent buy_intent(const std::string& token) {
        CopySignal s;
        s.wallet = "W";
        s.token = token;
        s.amount_lamports = LAMPORTS_PER_SOL;
        s.signature = "sig-" + token;
        auto intent = strategy->evaluate_signal(s, 1000);
        REQUIRE(intent.has_value());
        return *intent;
    }

    SellIntent sell_intent(const std::string& token, uint64_t amount) {
        SellIntent intent;
        intent.token = token;
        intent.base_amount = amount;
        intent.reason = SellReason::TakeProfit;
        return intent;
    }
};

}  // namespace

TEST_CASE("Paper executor", "[execution]") {
    auto prices = std::make_shared<PriceCache>(300000);
    PaperOrderExecutor executor(prices);
    set_price(*prices, "A", 0.001);

    SECTION("Buy fills at the slipped price") {
        auto receipt = executor.submit_buy("A", LAMPORTS_PER_SOL, 100).get();
        REQUIRE(receipt.side == TradeDirection::Buy);
        REQUIRE(receipt.base_amount == 990);
        REQUIRE(receipt.quote_amount == LAMPORTS_PER_SOL);
        REQUIRE(receipt.price == Approx(1.0 / 990.0));
        REQUIRE(receipt.signature == "paper-1");
    }

    SECTION("Sell fills at the slipped price") {
        auto receipt = executor.submit_sell("A", 500, 0).get();
        REQUIRE(receipt.side == TradeDirection::Sell);
        REQUIRE(receipt.price == Approx(0.001));
        REQUIRE(receipt.quote_amount == sol_to_lamports(0.5));
    }

    SECTION("Failures surface through the future") {
        auto no_price = executor.submit_buy("UNKNOWN", LAMPORTS_PER_SOL, 0);
        REQUIRE_THROWS_AS(no_price.get(), ExecutionError);

        auto zero = executor.submit_sell("A", 0, 0);
        REQUIRE_THROWS_AS(zero.get(), ExecutionError);
    }
}

TEST_CASE("Dispatching buys", "[execution]") {
    DispatchFixture f;
    auto intent = f.buy_intent("A");
    REQUIRE(f.strategy->buy_pending("A"));

    f.dispatcher.dispatch(intent, 2000);
    REQUIRE(f.executor->orders.size() == 1);
    REQUIRE(f.executor->orders[0].amount == intent.quote_amount);
    REQUIRE(f.dispatcher.pending() == 1);
    REQUIRE(f.dispatcher.poll(2000) == 0);

    SECTION("Fill opens the position") {
        f.executor->fill(0, 1000, 0.0005);
        REQUIRE(f.dispatcher.poll(3000) == 1);

        auto pos = f.positions->get("A");
        REQUIRE(pos.has_value());
        REQUIRE(pos->quantity == 1000);
        REQUIRE(pos->cost_basis == Approx(0.0005));
        REQUIRE_FALSE(f.strategy->buy_pending("A"));

        auto history = f.dispatcher.history();
        REQUIRE(history.size() == 1);
        REQUIRE(history[0].status == ExecutionStatus::Completed);
        REQUIRE(history[0].completed_at == 3000);
        REQUIRE(history[0].receipt->signature == "fill-0");
    }

    SECTION("Rejection leaves no position") {
        f.executor->reject(0, "slippage exceeded");
        REQUIRE(f.dispatcher.poll(3000) == 1);

        REQUIRE_FALSE(f.positions->has_open("A"));
        REQUIRE_FALSE(f.strategy->buy_pending("A"));

        auto history = f.dispatcher.history();
        REQUIRE(history[0].status == ExecutionStatus::Failed);
        REQUIRE(history[0].error == "slippage exceeded");

        auto stats = f.dispatcher.stats();
        REQUIRE(stats.submitted == 1);
        REQUIRE(stats.failed == 1);
        REQUIRE(stats.success_rate() == 0.0);
    }

    SECTION("Zero-price fill opens nothing") {
        f.executor->fill(0, 1000, 0.0);
        REQUIRE(f.dispatcher.poll(3000) == 1);

        REQUIRE_FALSE(f.positions->has_open("A"));
        REQUIRE_FALSE(f.strategy->buy_pending("A"));
        REQUIRE(f.dispatcher.history()[0].status == ExecutionStatus::Failed);
    }
}

TEST_CASE("Dispatching sells", "[execution]") {
    DispatchFixture f;
    f.positions->open_or_increase("A", 100, 0.001, 1000);

    SECTION("Fill closes the position and realizes PnL") {
        f.dispatcher.dispatch(f.sell_intent("A", 100), 2000);
        f.executor->fill(0, 100, 0.002);
        REQUIRE(f.dispatcher.poll(3000) == 1);

        REQUIRE_FALSE(f.positions->has_open("A"));
        auto history = f.dispatcher.history();
        REQUIRE(history[0].status == ExecutionStatus::Completed);
        REQUIRE(history[0].realized_pnl == Approx(0.1));
        REQUIRE(history[0].reason == std::optional<SellReason>(SellReason::TakeProfit));
        REQUIRE(f.dispatcher.stats().success_rate() == Approx(1.0));
    }

    SECTION("Fill larger than the position is rejected without changes") {
        f.dispatcher.dispatch(f.sell_intent("A", 100), 2000);
        f.executor->fill(0, 150, 0.002);
        REQUIRE(f.dispatcher.poll(3000) == 1);

        REQUIRE(f.positions->get("A")->quantity == 100);
        REQUIRE_FALSE(f.strategy->sell_pending("A"));
        REQUIRE(f.dispatcher.history()[0].status == ExecutionStatus::Failed);
    }
}

TEST_CASE("Drain settles outstanding paper orders", "[execution]") {
    auto prices = std::make_shared<PriceCache>(300000);
    auto positions = std::make_shared<PositionTracker>();
    auto signals = std::make_shared<SignalQueue>(16);
    auto strategy = std::make_shared<StrategyEngine>(
        CopyTradingConfig{}, TakeProfitStopLossConfig{}, prices, positions, signals);
    IntentDispatcher dispatcher(std::make_shared<PaperOrderExecutor>(prices), positions, strategy);

    set_price(*prices, "A", 0.0078125);
    BuyIntent intent;
    intent.token = "A";
    intent.quote_amount = LAMPORTS_PER_SOL / 2;
    dispatcher.dispatch(intent);

    REQUIRE(dispatcher.drain(std::chrono::seconds(5)) == 1);
    REQUIRE(dispatcher.pending() == 0);
    REQUIRE(positions->get("A")->quantity == 64);
}
