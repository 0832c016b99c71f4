// DexPilot - Protocol Adapter Tests

#include <catch2/catch_test_macros.hpp>
#include "fixtures.hpp"

using namespace dexpilot;
using namespace dexpilot::test;

namespace {

const std::string TRADER = "TraderWallet111";
const std::string MINT = "TokenMintAAA";
const std::string OTHER_MINT = "TokenMintBBB";

RawTransaction cpmm_swap(const std::string& input_mint, const std::string& output_mint) {
    TxBuilder b("cpmm-sig", TRADER);
    b.instruction(std::string(RaydiumCpmmAdapter::PROGRAM_ID),
                  {TRADER, "authority", "amm_config", "pool:cpmm", "in_acct", "out_acct",
                   "in_vault", "out_vault", "tp_in", "tp_out", input_mint, output_mint, "observation"},
                  ix_data(RaydiumCpmmAdapter::SWAP_BASE_INPUT, 1000000000, 1));
    return b.build();
}

}  // namespace

TEST_CASE("PumpFun adapter", "[adapters][pumpfun]") {
    PumpFunAdapter adapter;

    SECTION("Buy decoded from balance changes") {
        auto tx = pumpfun_trade("pf-buy", TRADER, MINT, true, 1000000000, 2 * LAMPORTS_PER_SOL);
        auto result = adapter.decode(tx);

        REQUIRE(result.ok());
        const auto& ev = *result.event;
        REQUIRE(ev.protocol == DexType::PumpFun);
        REQUIRE(ev.direction == TradeDirection::Buy);
        REQUIRE(ev.token == MINT);
        REQUIRE(ev.base_amount == 1000000000);
        REQUIRE(ev.quote_amount == 2 * LAMPORTS_PER_SOL);
        REQUIRE(ev.signature == "pf-buy");
        REQUIRE(ev.trader == TRADER);
        REQUIRE(ev.pool == std::optional<std::string>("curve:" + MINT));
        REQUIRE(ev.timestamp == BLOCK_TIME * 1000);
        REQUIRE(ev.base_decimals == 6);
    }

    SECTION("Sell decoded from balance changes") {
        auto tx = pumpfun_trade("pf-sell", TRADER, MINT, false, 500000000, LAMPORTS_PER_SOL);
        auto result = adapter.decode(tx);

        REQUIRE(result.ok());
        REQUIRE(result.event->direction == TradeDirection::Sell);
        REQUIRE(result.event->base_amount == 500000000);
        REQUIRE(result.event->quote_amount == LAMPORTS_PER_SOL);
    }

    SECTION("Instruction arguments used when balances are silent") {
        TxBuilder b("pf-hint", TRADER);
        b.instruction(std::string(PumpFunAdapter::PROGRAM_ID),
                      {"global", "fee", MINT, "curve", "abc", "ata", TRADER},
                      ix_data(PumpFunAdapter::BUY, 777, 3000));
        b.lamports(LAMPORTS_PER_SOL, LAMPORTS_PER_SOL - FEE);
        auto result = adapter.decode(b.build());

        REQUIRE(result.ok());
        REQUIRE(result.event->base_amount == 777);
        REQUIRE(result.event->quote_amount == 3000);
    }

    SECTION("Found through inner instructions") {
        TxBuilder b("pf-inner", TRADER);
        b.instruction("RouterProgram111", {TRADER}, {1, 2, 3});
        b.inner_instruction(std::string(PumpFunAdapter::PROGRAM_ID),
                            {"global", "fee", MINT, "curve", "abc", "ata", TRADER},
                            ix_data(PumpFunAdapter::BUY, 10, 20));
        b.token_change(TRADER, MINT, 0, 10);
        b.lamports(LAMPORTS_PER_SOL, LAMPORTS_PER_SOL - 20 - FEE);
        auto result = adapter.decode(b.build());

        REQUIRE(result.ok());
        REQUIRE(result.event->base_amount == 10);
        REQUIRE(result.event->quote_amount == 20);
    }

    SECTION("Launch: create followed by buy decodes as the buy") {
        const std::string program{PumpFunAdapter::PROGRAM_ID};
        TxBuilder b("pf-launch", TRADER);
        b.instruction(program, {MINT, "mint_authority", "curve", "abc", "global", TRADER},
                      {24, 30, 200, 40, 5, 28, 7, 119, 4, 0, 0, 0, 'T', 'E', 'S', 'T'});
        b.instruction(program, {"global", "fee", MINT, "curve", "abc", "ata", TRADER},
                      ix_data(PumpFunAdapter::BUY, 35000000, LAMPORTS_PER_SOL));
        b.token_change(TRADER, MINT, 0, 35000000);
        b.lamports(10 * LAMPORTS_PER_SOL, 9 * LAMPORTS_PER_SOL - FEE);
        auto result = adapter.decode(b.build());

        REQUIRE(result.ok());
        REQUIRE(result.event->direction == TradeDirection::Buy);
        REQUIRE(result.event->token == MINT);
        REQUIRE(result.event->base_amount == 35000000);
        REQUIRE(result.event->quote_amount == LAMPORTS_PER_SOL);
    }
}

TEST_CASE("Adapter rejections", "[adapters]") {
    PumpFunAdapter adapter;
    const std::string program{PumpFunAdapter::PROGRAM_ID};
    const std::vector<std::string> accounts = {"global", "fee", MINT, "curve", "abc", "ata", TRADER};

    SECTION("Other program") {
        TxBuilder b("other", TRADER);
        b.instruction("SomeOtherProgram", accounts, ix_data(PumpFunAdapter::BUY, 1, 1));
        auto result = adapter.decode(b.build());
        REQUIRE_FALSE(result.ok());
        REQUIRE(result.error == DecodeError::ProgramMismatch);
    }

    SECTION("Truncated instruction data") {
        TxBuilder b("short", TRADER);
        std::vector<uint8_t> data(PumpFunAdapter::BUY.begin(), PumpFunAdapter::BUY.end());
        data.push_back(1);
        b.instruction(program, accounts, data);
        auto result = adapter.decode(b.build());
        REQUIRE(result.error == DecodeError::Malformed);
    }

    SECTION("Too few accounts") {
        TxBuilder b("few", TRADER);
        b.instruction(program, {"global", "fee"}, ix_data(PumpFunAdapter::BUY, 1, 1));
        auto result = adapter.decode(b.build());
        REQUIRE(result.error == DecodeError::Malformed);
    }

    SECTION("Account index outside the key list") {
        TxBuilder b("bad-index", TRADER);
        b.instruction(program, accounts, ix_data(PumpFunAdapter::BUY, 1, 1));
        auto tx = b.build();
        tx.instructions[0].accounts[2] = 250;
        auto result = adapter.decode(tx);
        REQUIRE(result.error == DecodeError::Malformed);
    }

    SECTION("Missing meta") {
        TxBuilder b("no-meta", TRADER);
        b.instruction(program, accounts, ix_data(PumpFunAdapter::BUY, 1, 1));
        b.without_meta();
        auto result = adapter.decode(b.build());
        REQUIRE(result.error == DecodeError::Malformed);
    }

    SECTION("Unknown discriminator") {
        TxBuilder b("unknown", TRADER);
        b.instruction(program, accounts, {9, 9, 9, 9, 9, 9, 9, 9, 0, 0, 0, 0, 0, 0, 0, 0});
        auto result = adapter.decode(b.build());
        REQUIRE(result.error == DecodeError::Unrecognized);
    }

    SECTION("Truncated trade reported ahead of a non-trade instruction") {
        TxBuilder b("create-short", TRADER);
        b.instruction(program, accounts, {9, 9, 9, 9, 9, 9, 9, 9});
        std::vector<uint8_t> data(PumpFunAdapter::BUY.begin(), PumpFunAdapter::BUY.end());
        b.instruction(program, accounts, data);
        auto result = adapter.decode(b.build());
        REQUIRE(result.error == DecodeError::Malformed);
    }

    SECTION("Transaction whose body could not be loaded") {
        RawTransaction tx;
        tx.signature = "unloadable";
        tx.load_error = "Malformed instruction data";
        auto result = adapter.decode(tx);
        REQUIRE(result.error == DecodeError::Malformed);
        REQUIRE(result.detail == "Malformed instruction data");
    }

    SECTION("Failed on chain") {
        TxBuilder b("failed", TRADER);
        b.instruction(program, accounts, ix_data(PumpFunAdapter::BUY, 1, 1));
        b.failed();
        auto result = adapter.decode(b.build());
        REQUIRE(result.error == DecodeError::Failed);
    }

    SECTION("Garbage never throws") {
        TxBuilder b("garbage", TRADER);
        b.instruction(program, {}, {});
        RawTransaction tx = b.build();
        tx.instructions.push_back({999, {1000, 2000}, {0xff}});
        REQUIRE_NOTHROW((void)adapter.decode(tx));
        REQUIRE_FALSE(adapter.decode(tx).ok());
    }
}

TEST_CASE("Raydium CPMM adapter", "[adapters][cpmm]") {
    RaydiumCpmmAdapter adapter;

    SECTION("SOL in is a buy of the output mint") {
        TxBuilder b("cpmm-buy", TRADER);
        b.instruction(std::string(RaydiumCpmmAdapter::PROGRAM_ID),
                      {TRADER, "authority", "amm_config", "pool:cpmm", "in_acct", "out_acct",
                       "in_vault", "out_vault", "tp_in", "tp_out", WSOL, MINT, "observation"},
                      ix_data(RaydiumCpmmAdapter::SWAP_BASE_INPUT, LAMPORTS_PER_SOL, 1));
        b.token_change(TRADER, WSOL, 5 * LAMPORTS_PER_SOL, 4 * LAMPORTS_PER_SOL, 9);
        b.token_change(TRADER, MINT, 0, 250000000);
        auto result = adapter.decode(b.build());

        REQUIRE(result.ok());
        REQUIRE(result.event->direction == TradeDirection::Buy);
        REQUIRE(result.event->token == MINT);
        REQUIRE(result.event->base_amount == 250000000);
        REQUIRE(result.event->quote_amount == LAMPORTS_PER_SOL);
        REQUIRE(result.event->pool == std::optional<std::string>("pool:cpmm"));
    }

    SECTION("SOL out is a sell of the input mint") {
        TxBuilder b("cpmm-sell", TRADER);
        b.instruction(std::string(RaydiumCpmmAdapter::PROGRAM_ID),
                      {TRADER, "authority", "amm_config", "pool:cpmm", "in_acct", "out_acct",
                       "in_vault", "out_vault", "tp_in", "tp_out", MINT, WSOL, "observation"},
                      ix_data(RaydiumCpmmAdapter::SWAP_BASE_OUTPUT, 100, 2000));
        b.token_change(TRADER, MINT, 500, 400);
        b.token_change(TRADER, WSOL, 0, 2000, 9);
        auto result = adapter.decode(b.build());

        REQUIRE(result.ok());
        REQUIRE(result.event->direction == TradeDirection::Sell);
        REQUIRE(result.event->token == MINT);
        REQUIRE(result.event->base_amount == 100);
        REQUIRE(result.event->quote_amount == 2000);
    }

    SECTION("Token to token swap is unrecognized") {
        auto result = adapter.decode(cpmm_swap(MINT, OTHER_MINT));
        REQUIRE(result.error == DecodeError::Unrecognized);
    }
}

TEST_CASE("PumpSwap adapter", "[adapters][pumpswap]") {
    PumpSwapAdapter adapter;
    const std::string program{PumpSwapAdapter::PROGRAM_ID};

    SECTION("Token/SOL pool buy") {
        TxBuilder b("ps-buy", TRADER);
        b.instruction(program, {"pool:ps", TRADER, "global", MINT, WSOL},
                      ix_data(PumpSwapAdapter::BUY, 1000, 50000));
        b.token_change(TRADER, MINT, 0, 1000);
        b.token_change(TRADER, WSOL, 60000, 10000, 9);
        auto result = adapter.decode(b.build());

        REQUIRE(result.ok());
        REQUIRE(result.event->direction == TradeDirection::Buy);
        REQUIRE(result.event->token == MINT);
        REQUIRE(result.event->base_amount == 1000);
        REQUIRE(result.event->quote_amount == 50000);
        REQUIRE(result.event->pool == std::optional<std::string>("pool:ps"));
    }

    SECTION("SOL as pool base inverts the trader's side") {
        TxBuilder b("ps-inverted", TRADER);
        b.instruction(program, {"pool:ps", TRADER, "global", WSOL, MINT},
                      ix_data(PumpSwapAdapter::BUY, 50000, 1000));
        b.token_change(TRADER, MINT, 1000, 0);
        b.token_change(TRADER, WSOL, 0, 50000, 9);
        auto result = adapter.decode(b.build());

        REQUIRE(result.ok());
        REQUIRE(result.event->direction == TradeDirection::Sell);
        REQUIRE(result.event->token == MINT);
        REQUIRE(result.event->base_amount == 1000);
        REQUIRE(result.event->quote_amount == 50000);
    }

    SECTION("No SOL side") {
        TxBuilder b("ps-none", TRADER);
        b.instruction(program, {"pool:ps", TRADER, "global", MINT, OTHER_MINT},
                      ix_data(PumpSwapAdapter::SELL, 1, 1));
        REQUIRE(adapter.decode(b.build()).error == DecodeError::Unrecognized);
    }
}

TEST_CASE("Bonk adapter", "[adapters][bonk]") {
    BonkAdapter adapter;
    const std::string program{BonkAdapter::PROGRAM_ID};
    auto accounts = [](const std::string& base, const std::string& quote) {
        return std::vector<std::string>{TRADER, "authority", "global", "platform", "pool:bonk",
                                        "user_base", "user_quote", "base_vault", "quote_vault",
                                        base, quote};
    };

    SECTION("buy_exact_in") {
        TxBuilder b("bonk-buy", TRADER);
        b.instruction(program, accounts(MINT, WSOL), ix_data(BonkAdapter::BUY_EXACT_IN, 3000, 100));
        b.token_change(TRADER, MINT, 0, 120);
        b.token_change(TRADER, WSOL, 3000, 0, 9);
        auto result = adapter.decode(b.build());

        REQUIRE(result.ok());
        REQUIRE(result.event->protocol == DexType::Bonk);
        REQUIRE(result.event->direction == TradeDirection::Buy);
        REQUIRE(result.event->base_amount == 120);
        REQUIRE(result.event->quote_amount == 3000);
        REQUIRE(result.event->pool == std::optional<std::string>("pool:bonk"));
    }

    SECTION("sell_exact_out falls back to arguments") {
        TxBuilder b("bonk-sell", TRADER);
        b.instruction(program, accounts(MINT, WSOL), ix_data(BonkAdapter::SELL_EXACT_OUT, 4000, 90));
        auto result = adapter.decode(b.build());

        REQUIRE(result.ok());
        REQUIRE(result.event->direction == TradeDirection::Sell);
        REQUIRE(result.event->base_amount == 90);
        REQUIRE(result.event->quote_amount == 4000);
    }

    SECTION("Pool not quoted in SOL") {
        TxBuilder b("bonk-usd", TRADER);
        b.instruction(program, accounts(MINT, OTHER_MINT), ix_data(BonkAdapter::BUY_EXACT_OUT, 1, 1));
        REQUIRE(adapter.decode(b.build()).error == DecodeError::Unrecognized);
    }
}

TEST_CASE("Protocol registry", "[adapters]") {
    REQUIRE(protocol_registry().size() == all_dex_types().size());

    for (auto type : all_dex_types()) {
        auto adapter = AdapterFactory::create(type);
        REQUIRE(adapter->dex_type() == type);
        REQUIRE(adapter->program_id() == protocol_info(type).program_id);
        REQUIRE(adapter->name() == to_string(type));
    }

    auto adapters = AdapterFactory::create_all({DexType::PumpFun, DexType::Bonk});
    REQUIRE(adapters.size() == 2);
    REQUIRE(adapters[1]->dex_type() == DexType::Bonk);
}
