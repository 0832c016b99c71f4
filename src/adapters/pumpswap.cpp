// DexPilot - PumpSwap Adapter Implementation

#include <dexpilot/adapters/pumpswap.hpp>

namespace dexpilot {

DecodeResult PumpSwapAdapter::decode_instruction(
    const RawTransaction& tx, const CompiledInstruction& ix) const {
    TradeDirection direction;
    if (has_discriminator(ix.data, BUY)) {
        direction = TradeDirection::Buy;
    } else if (has_discriminator(ix.data, SELL)) {
        direction = TradeDirection::Sell;
    } else {
        return DecodeResult::failure(DecodeError::Unrecognized, "not a pumpswap buy/sell");
    }

    // buy(base_amount_out, max_quote_amount_in) / sell(base_amount_in, min_quote_amount_out)
    auto base_amount = read_u64(ix.data, 8);
    auto quote_amount = read_u64(ix.data, 16);
    if (!base_amount || !quote_amount) {
        return DecodeResult::failure(DecodeError::Malformed, "pumpswap instruction data truncated");
    }

    const auto* pool = instruction_account(tx, ix, POOL_ACCOUNT);
    const auto* base_mint = instruction_account(tx, ix, BASE_MINT_ACCOUNT);
    const auto* quote_mint = instruction_account(tx, ix, QUOTE_MINT_ACCOUNT);
    if (pool == nullptr || base_mint == nullptr || quote_mint == nullptr) {
        return DecodeResult::failure(DecodeError::Malformed, "pumpswap account index out of range");
    }

    if (*quote_mint == WSOL_MINT) {
        return make_event(tx, *base_mint, direction, *pool, AmountHint{*base_amount, *quote_amount});
    }

    // Pool stored with SOL as base: trader's side is inverted
    if (*base_mint == WSOL_MINT) {
        auto inverted = direction == TradeDirection::Buy ? TradeDirection::Sell : TradeDirection::Buy;
        return make_event(tx, *quote_mint, inverted, *pool, AmountHint{*quote_amount, *base_amount});
    }

    return DecodeResult::failure(DecodeError::Unrecognized, "pumpswap pool without a SOL side");
}

}  // namespace dexpilot
