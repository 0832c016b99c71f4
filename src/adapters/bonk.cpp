// DexPilot - Bonk Adapter Implementation

#include <dexpilot/adapters/bonk.hpp>

namespace dexpilot {

DecodeResult BonkAdapter::decode_instruction(
    const RawTransaction& tx, const CompiledInstruction& ix) const {
    TradeDirection direction;
    bool exact_in;
    if (has_discriminator(ix.data, BUY_EXACT_IN)) {
        direction = TradeDirection::Buy;
        exact_in = true;
    } else if (has_discriminator(ix.data, BUY_EXACT_OUT)) {
        direction = TradeDirection::Buy;
        exact_in = false;
    } else if (has_discriminator(ix.data, SELL_EXACT_IN)) {
        direction = TradeDirection::Sell;
        exact_in = true;
    } else if (has_discriminator(ix.data, SELL_EXACT_OUT)) {
        direction = TradeDirection::Sell;
        exact_in = false;
    } else {
        return DecodeResult::failure(DecodeError::Unrecognized, "not a launchpad trade");
    }

    auto first = read_u64(ix.data, 8);
    auto second = read_u64(ix.data, 16);
    if (!first || !second) {
        return DecodeResult::failure(DecodeError::Malformed, "launchpad instruction data truncated");
    }

    // exact_in: (amount_in, minimum_amount_out); exact_out: (amount_out, maximum_amount_in)
    uint64_t amount_in = exact_in ? *first : *second;
    uint64_t amount_out = exact_in ? *second : *first;

    const auto* pool = instruction_account(tx, ix, POOL_STATE_ACCOUNT);
    const auto* base_mint = instruction_account(tx, ix, BASE_MINT_ACCOUNT);
    const auto* quote_mint = instruction_account(tx, ix, QUOTE_MINT_ACCOUNT);
    if (pool == nullptr || base_mint == nullptr || quote_mint == nullptr) {
        return DecodeResult::failure(DecodeError::Malformed, "launchpad account index out of range");
    }
    if (*quote_mint != WSOL_MINT) {
        return DecodeResult::failure(DecodeError::Unrecognized, "launchpad pool not quoted in SOL");
    }

    AmountHint hint = direction == TradeDirection::Buy
        ? AmountHint{amount_out, amount_in}
        : AmountHint{amount_in, amount_out};
    return make_event(tx, *base_mint, direction, *pool, hint);
}

}  // namespace dexpilot
