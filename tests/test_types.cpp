// DexPilot - Core Types Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <dexpilot/transaction.hpp>
#include <dexpilot/types.hpp>

using namespace dexpilot;
using Catch::Approx;

TEST_CASE("DexType names", "[types]") {
    SECTION("Every protocol parses from its own name") {
        for (auto type : all_dex_types()) {
            REQUIRE(parse_dex_type(to_string(type)) == type);
        }
    }

    SECTION("Alternate spellings") {
        REQUIRE(parse_dex_type("raydium") == DexType::RaydiumCpmm);
        REQUIRE(parse_dex_type("launchpad") == DexType::Bonk);
    }

    SECTION("Unknown protocol rejected") {
        REQUIRE_THROWS_AS(parse_dex_type("orca"), ConfigError);
        REQUIRE_THROWS_AS(parse_dex_type(""), ConfigError);
    }
}

TEST_CASE("Lamport conversion", "[types]") {
    REQUIRE(lamports_to_sol(LAMPORTS_PER_SOL) == Approx(1.0));
    REQUIRE(lamports_to_sol(250000000) == Approx(0.25));
    REQUIRE(sol_to_lamports(1.5) == 1500000000ULL);
    REQUIRE(sol_to_lamports(0.1) == 100000000ULL);
    REQUIRE(sol_to_lamports(-1.0) == 0);
}

TEST_CASE("Position helpers", "[types]") {
    Position pos;
    pos.quantity = 1000;
    pos.cost_basis = 0.002;

    REQUIRE(pos.is_open());
    REQUIRE(pos.cost_sol() == Approx(2.0));
    REQUIRE(pos.value_at(0.003) == Approx(3.0));
}

TEST_CASE("Base58 codec", "[types][base58]") {
    SECTION("Known vector") {
        std::string text = "Hello World!";
        std::vector<uint8_t> bytes(text.begin(), text.end());
        REQUIRE(base58_encode(bytes) == "2NEpo7TZRRrLZSi2U");
        REQUIRE(base58_decode("2NEpo7TZRRrLZSi2U") == bytes);
    }

    SECTION("Leading ones are zero bytes") {
        auto zeros = base58_decode("11111111111111111111111111111111");
        REQUIRE(zeros.size() == 32);
        for (auto b : zeros) REQUIRE(b == 0);
        REQUIRE(base58_encode(zeros) == "11111111111111111111111111111111");
    }

    SECTION("Empty input") {
        REQUIRE(base58_decode("").empty());
        REQUIRE(base58_encode({}).empty());
    }

    SECTION("Invalid characters") {
        REQUIRE_THROWS_AS(base58_decode("0OIl"), Base58Error);
        REQUIRE_THROWS_AS(base58_decode("abc+"), Base58Error);
    }

    SECTION("Public key validation") {
        REQUIRE(is_valid_pubkey(WSOL_MINT));
        REQUIRE(is_valid_pubkey("TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA"));
        REQUIRE(is_valid_pubkey("11111111111111111111111111111111"));
        REQUIRE_FALSE(is_valid_pubkey("not-a-key"));
        REQUIRE_FALSE(is_valid_pubkey("2NEpo7TZRRrLZSi2U"));
        REQUIRE_FALSE(is_valid_pubkey("TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5D0"));
    }
}
