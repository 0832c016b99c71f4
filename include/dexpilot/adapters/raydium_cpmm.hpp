// DexPilot - Raydium CPMM Adapter

#pragma once

#include <dexpilot/adapter.hpp>

namespace dexpilot {

class RaydiumCpmmAdapter : public ProtocolAdapter {
public:
    static constexpr std::string_view PROGRAM_ID = "CPMMoo8L3F4NbTegBCKVNunggL7H1ZpdTHKxQB5qKP1C";
    static constexpr Discriminator SWAP_BASE_INPUT{143, 190, 90, 218, 196, 30, 51, 222};
    static constexpr Discriminator SWAP_BASE_OUTPUT{55, 217, 98, 86, 163, 74, 180, 173};

    static constexpr size_t POOL_STATE_ACCOUNT = 3;
    static constexpr size_t INPUT_MINT_ACCOUNT = 10;
    static constexpr size_t OUTPUT_MINT_ACCOUNT = 11;

    [[nodiscard]] DexType dex_type() const noexcept override { return DexType::RaydiumCpmm; }
    [[nodiscard]] std::string_view program_id() const noexcept override { return PROGRAM_ID; }

protected:
    // Direction follows the WSOL side: WSOL in is a buy of the output mint,
    // WSOL out is a sell of the input mint.
    [[nodiscard]] DecodeResult decode_instruction(
        const RawTransaction& tx, const CompiledInstruction& ix) const override;
};

}  // namespace dexpilot
