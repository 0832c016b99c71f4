// DexPilot - Bonk Adapter
// Raydium Launchpad program used by the Bonk launch platform

#pragma once

#include <dexpilot/adapter.hpp>

namespace dexpilot {

class BonkAdapter : public ProtocolAdapter {
public:
    static constexpr std::string_view PROGRAM_ID = "LanMV9sAd7wArD4vJFi2qDdfnVhFxYSUg6eADduJ3uj";
    static constexpr Discriminator BUY_EXACT_IN{250, 234, 13, 123, 213, 156, 19, 236};
    static constexpr Discriminator BUY_EXACT_OUT{24, 211, 116, 40, 105, 3, 153, 56};
    static constexpr Discriminator SELL_EXACT_IN{149, 39, 222, 155, 211, 124, 152, 26};
    static constexpr Discriminator SELL_EXACT_OUT{95, 200, 71, 34, 8, 9, 11, 166};

    static constexpr size_t POOL_STATE_ACCOUNT = 4;
    static constexpr size_t BASE_MINT_ACCOUNT = 9;
    static constexpr size_t QUOTE_MINT_ACCOUNT = 10;

    [[nodiscard]] DexType dex_type() const noexcept override { return DexType::Bonk; }
    [[nodiscard]] std::string_view program_id() const noexcept override { return PROGRAM_ID; }

protected:
    [[nodiscard]] DecodeResult decode_instruction(
        const RawTransaction& tx, const CompiledInstruction& ix) const override;
};

}  // namespace dexpilot
