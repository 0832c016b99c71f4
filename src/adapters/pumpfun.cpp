// DexPilot - PumpFun Adapter Implementation

#include <dexpilot/adapters/pumpfun.hpp>

namespace dexpilot {

DecodeResult PumpFunAdapter::decode_instruction(
    const RawTransaction& tx, const CompiledInstruction& ix) const {
    TradeDirection direction;
    if (has_discriminator(ix.data, BUY)) {
        direction = TradeDirection::Buy;
    } else if (has_discriminator(ix.data, SELL)) {
        direction = TradeDirection::Sell;
    } else {
        return DecodeResult::failure(DecodeError::Unrecognized, "not a pumpfun buy/sell");
    }

    // buy(amount, max_sol_cost) / sell(amount, min_sol_output)
    auto token_amount = read_u64(ix.data, 8);
    auto sol_amount = read_u64(ix.data, 16);
    if (!token_amount || !sol_amount) {
        return DecodeResult::failure(DecodeError::Malformed, "pumpfun instruction data truncated");
    }

    const auto* mint = instruction_account(tx, ix, MINT_ACCOUNT);
    const auto* curve = instruction_account(tx, ix, BONDING_CURVE_ACCOUNT);
    if (mint == nullptr || curve == nullptr) {
        return DecodeResult::failure(DecodeError::Malformed, "pumpfun account index out of range");
    }

    return make_event(tx, *mint, direction, *curve, AmountHint{*token_amount, *sol_amount});
}

}  // namespace dexpilot
