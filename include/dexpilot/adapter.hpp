// DexPilot - Protocol Adapter Interface
// Decodes raw chain transactions into canonical trade events

#pragma once

#include <dexpilot/transaction.hpp>
#include <dexpilot/types.hpp>
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dexpilot {

// Why a transaction produced no event. Never fatal to the caller.
enum class DecodeError : uint8_t {
    None,
    ProgramMismatch,  // no instruction for this protocol's program
    Malformed,        // truncated data, bad account index, missing meta
    Unrecognized,     // program matched but instruction shape is unsupported
    Failed            // transaction failed on chain
};

[[nodiscard]] std::string_view to_string(DecodeError err) noexcept;

struct DecodeResult {
    std::optional<CanonicalTradeEvent> event;
    DecodeError error = DecodeError::None;
    std::string detail;

    [[nodiscard]] bool ok() const noexcept { return event.has_value(); }

    static DecodeResult success(CanonicalTradeEvent ev) {
        DecodeResult r;
        r.event = std::move(ev);
        return r;
    }

    static DecodeResult failure(DecodeError err, std::string detail) {
        DecodeResult r;
        r.error = err;
        r.detail = std::move(detail);
        return r;
    }
};

using Discriminator = std::array<uint8_t, 8>;

// Amounts read from instruction arguments, used when the transaction's
// balance changes do not show the trader's side of the swap
struct AmountHint {
    uint64_t base = 0;
    uint64_t quote = 0;
};

// Base adapter interface
class ProtocolAdapter {
public:
    virtual ~ProtocolAdapter() = default;

    [[nodiscard]] virtual DexType dex_type() const noexcept = 0;
    [[nodiscard]] virtual std::string_view program_id() const noexcept = 0;
    [[nodiscard]] std::string_view name() const noexcept { return to_string(dex_type()); }

    // Tries every instruction (outer, then inner) addressed to this
    // protocol's program and returns the first trade found, so a create
    // followed by a buy decodes as the buy. Does not throw on bad input.
    [[nodiscard]] DecodeResult decode(const RawTransaction& tx) const;

protected:
    [[nodiscard]] virtual DecodeResult decode_instruction(
        const RawTransaction& tx, const CompiledInstruction& ix) const = 0;

    // Builds the event from balance changes of the fee payer
    [[nodiscard]] DecodeResult make_event(
        const RawTransaction& tx,
        const std::string& mint,
        TradeDirection direction,
        std::optional<std::string> pool,
        AmountHint hint) const;

    // Account key at instruction-local position, or nullptr when out of range
    [[nodiscard]] static const std::string* instruction_account(
        const RawTransaction& tx, const CompiledInstruction& ix, size_t position) noexcept;

    [[nodiscard]] static bool has_discriminator(
        const std::vector<uint8_t>& data, const Discriminator& disc) noexcept;

    // Little-endian u64 at byte offset; nullopt if the data is too short
    [[nodiscard]] static std::optional<uint64_t> read_u64(
        const std::vector<uint8_t>& data, size_t offset) noexcept;
};

// Signed balance change of one owner's holdings of one mint
struct BalanceDelta {
    bool present = false;
    int64_t delta = 0;
    uint8_t decimals = 0;
};

[[nodiscard]] BalanceDelta token_balance_delta(
    const TransactionMeta& meta, const std::string& owner, const std::string& mint);

// Registry of supported protocols
struct ProtocolInfo {
    DexType type;
    std::string_view name;
    std::string_view program_id;
    std::unique_ptr<ProtocolAdapter> (*create)();
};

[[nodiscard]] const std::vector<ProtocolInfo>& protocol_registry();
[[nodiscard]] const ProtocolInfo& protocol_info(DexType type);

// Adapter factory
class AdapterFactory {
public:
    [[nodiscard]] static std::unique_ptr<ProtocolAdapter> create(DexType type);
    [[nodiscard]] static std::vector<std::unique_ptr<ProtocolAdapter>> create_all(
        const std::vector<DexType>& types);
};

}  // namespace dexpilot
