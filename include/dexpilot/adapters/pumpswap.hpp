// DexPilot - PumpSwap Adapter
// Constant-product AMM for graduated PumpFun tokens

#pragma once

#include <dexpilot/adapter.hpp>

namespace dexpilot {

class PumpSwapAdapter : public ProtocolAdapter {
public:
    static constexpr std::string_view PROGRAM_ID = "pAMMBay6oceH9fJKBRHGP5D4bD4sWpmSwMn52FMfXEA";
    static constexpr Discriminator BUY{102, 6, 61, 18, 1, 218, 235, 234};
    static constexpr Discriminator SELL{51, 230, 133, 164, 1, 127, 131, 173};

    static constexpr size_t POOL_ACCOUNT = 0;
    static constexpr size_t BASE_MINT_ACCOUNT = 3;
    static constexpr size_t QUOTE_MINT_ACCOUNT = 4;

    [[nodiscard]] DexType dex_type() const noexcept override { return DexType::PumpSwap; }
    [[nodiscard]] std::string_view program_id() const noexcept override { return PROGRAM_ID; }

protected:
    [[nodiscard]] DecodeResult decode_instruction(
        const RawTransaction& tx, const CompiledInstruction& ix) const override;
};

}  // namespace dexpilot
