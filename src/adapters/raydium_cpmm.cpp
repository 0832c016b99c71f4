// DexPilot - Raydium CPMM Adapter Implementation

#include <dexpilot/adapters/raydium_cpmm.hpp>

namespace dexpilot {

DecodeResult RaydiumCpmmAdapter::decode_instruction(
    const RawTransaction& tx, const CompiledInstruction& ix) const {
    if (!has_discriminator(ix.data, SWAP_BASE_INPUT) &&
        !has_discriminator(ix.data, SWAP_BASE_OUTPUT)) {
        return DecodeResult::failure(DecodeError::Unrecognized, "not a cpmm swap");
    }

    // Both variants carry (input side, output side):
    // swap_base_input(amount_in, minimum_amount_out)
    // swap_base_output(max_amount_in, amount_out)
    auto first = read_u64(ix.data, 8);
    auto second = read_u64(ix.data, 16);
    if (!first || !second) {
        return DecodeResult::failure(DecodeError::Malformed, "cpmm instruction data truncated");
    }
    uint64_t amount_in = *first;
    uint64_t amount_out = *second;

    const auto* pool = instruction_account(tx, ix, POOL_STATE_ACCOUNT);
    const auto* input_mint = instruction_account(tx, ix, INPUT_MINT_ACCOUNT);
    const auto* output_mint = instruction_account(tx, ix, OUTPUT_MINT_ACCOUNT);
    if (pool == nullptr || input_mint == nullptr || output_mint == nullptr) {
        return DecodeResult::failure(DecodeError::Malformed, "cpmm account index out of range");
    }

    if (*input_mint == WSOL_MINT) {
        return make_event(tx, *output_mint, TradeDirection::Buy, *pool, AmountHint{amount_out, amount_in});
    }
    if (*output_mint == WSOL_MINT) {
        return make_event(tx, *input_mint, TradeDirection::Sell, *pool, AmountHint{amount_in, amount_out});
    }

    return DecodeResult::failure(DecodeError::Unrecognized, "cpmm swap without a SOL side");
}

}  // namespace dexpilot
