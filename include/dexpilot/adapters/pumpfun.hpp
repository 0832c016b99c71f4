// DexPilot - PumpFun Adapter
// Bonding-curve buy/sell instructions

#pragma once

#include <dexpilot/adapter.hpp>

namespace dexpilot {

class PumpFunAdapter : public ProtocolAdapter {
public:
    static constexpr std::string_view PROGRAM_ID = "6EF8rrecthR5Dkzon8Nwu78hRvfCKubJ14M5uBEwF6P";
    static constexpr Discriminator BUY{102, 6, 61, 18, 1, 218, 235, 234};
    static constexpr Discriminator SELL{51, 230, 133, 164, 1, 127, 131, 173};

    // Account positions within buy/sell
    static constexpr size_t MINT_ACCOUNT = 2;
    static constexpr size_t BONDING_CURVE_ACCOUNT = 3;

    [[nodiscard]] DexType dex_type() const noexcept override { return DexType::PumpFun; }
    [[nodiscard]] std::string_view program_id() const noexcept override { return PROGRAM_ID; }

protected:
    [[nodiscard]] DecodeResult decode_instruction(
        const RawTransaction& tx, const CompiledInstruction& ix) const override;
};

}  // namespace dexpilot
