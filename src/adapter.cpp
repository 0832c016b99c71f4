// DexPilot - Protocol Adapter Implementation

#include <dexpilot/adapter.hpp>
#include <dexpilot/adapters/bonk.hpp>
#include <dexpilot/adapters/pumpfun.hpp>
#include <dexpilot/adapters/pumpswap.hpp>
#include <dexpilot/adapters/raydium_cpmm.hpp>
#include <algorithm>

namespace dexpilot {

std::string_view to_string(DecodeError err) noexcept {
    switch (err) {
        case DecodeError::None: return "none";
        case DecodeError::ProgramMismatch: return "program_mismatch";
        case DecodeError::Malformed: return "malformed";
        case DecodeError::Unrecognized: return "unrecognized";
        case DecodeError::Failed: return "failed";
    }
    return "unknown";
}

DecodeResult ProtocolAdapter::decode(const RawTransaction& tx) const {
    if (tx.load_error) {
        return DecodeResult::failure(DecodeError::Malformed, *tx.load_error);
    }

    std::vector<const CompiledInstruction*> candidates;
    auto collect = [&](const std::vector<CompiledInstruction>& list) {
        for (const auto& ix : list) {
            const auto* program = tx.account(ix.program_id_index);
            if (program != nullptr && *program == program_id()) {
                candidates.push_back(&ix);
            }
        }
    };

    collect(tx.instructions);
    if (tx.meta) {
        for (const auto& set : tx.meta->inner_instructions) {
            collect(set.instructions);
        }
    }

    if (candidates.empty()) {
        return DecodeResult::failure(DecodeError::ProgramMismatch,
            "no " + std::string(name()) + " instruction in " + tx.signature);
    }
    if (!tx.meta) {
        return DecodeResult::failure(DecodeError::Malformed, "transaction meta missing");
    }
    if (tx.meta->failed) {
        return DecodeResult::failure(DecodeError::Failed, "transaction failed on chain");
    }
    if (tx.account_keys.empty()) {
        return DecodeResult::failure(DecodeError::Malformed, "no account keys");
    }

    // First trade wins. Without one, a malformed trade instruction is
    // reported ahead of instructions that are simply not trades.
    DecodeResult rejected;
    for (const auto* ix : candidates) {
        auto result = decode_instruction(tx, *ix);
        if (result.ok()) return result;
        if (rejected.error == DecodeError::None ||
            (result.error == DecodeError::Malformed && rejected.error != DecodeError::Malformed)) {
            rejected = std::move(result);
        }
    }
    return rejected;
}

DecodeResult ProtocolAdapter::make_event(
    const RawTransaction& tx,
    const std::string& mint,
    TradeDirection direction,
    std::optional<std::string> pool,
    AmountHint hint) const {
    const auto& meta = *tx.meta;
    const std::string& trader = tx.account_keys.front();

    CanonicalTradeEvent ev;
    ev.protocol = dex_type();
    ev.token = mint;
    ev.direction = direction;
    ev.signature = tx.signature;
    ev.pool = std::move(pool);
    ev.trader = trader;
    ev.slot = tx.slot;
    ev.timestamp = tx.block_time ? *tx.block_time * 1000 : now_ms();

    auto base = token_balance_delta(meta, trader, mint);
    if (base.present && base.delta != 0) {
        ev.base_amount = static_cast<uint64_t>(base.delta < 0 ? -base.delta : base.delta);
        ev.base_decimals = base.decimals;
    } else {
        ev.base_amount = hint.base;
    }

    auto wsol = token_balance_delta(meta, trader, std::string(WSOL_MINT));
    if (wsol.present && wsol.delta != 0) {
        ev.quote_amount = static_cast<uint64_t>(wsol.delta < 0 ? -wsol.delta : wsol.delta);
    } else if (!meta.pre_balances.empty() && !meta.post_balances.empty()) {
        uint64_t pre = meta.pre_balances.front();
        uint64_t post = meta.post_balances.front();
        if (direction == TradeDirection::Buy) {
            ev.quote_amount = pre > post + meta.fee ? pre - post - meta.fee : 0;
        } else {
            ev.quote_amount = post + meta.fee > pre ? post + meta.fee - pre : 0;
        }
    }
    if (ev.quote_amount == 0) {
        ev.quote_amount = hint.quote;
    }

    return DecodeResult::success(std::move(ev));
}

const std::string* ProtocolAdapter::instruction_account(
    const RawTransaction& tx, const CompiledInstruction& ix, size_t position) noexcept {
    if (position >= ix.accounts.size()) return nullptr;
    return tx.account(ix.accounts[position]);
}

bool ProtocolAdapter::has_discriminator(
    const std::vector<uint8_t>& data, const Discriminator& disc) noexcept {
    return data.size() >= disc.size() && std::equal(disc.begin(), disc.end(), data.begin());
}

std::optional<uint64_t> ProtocolAdapter::read_u64(
    const std::vector<uint8_t>& data, size_t offset) noexcept {
    if (data.size() < offset + 8) return std::nullopt;
    uint64_t v = 0;
    for (size_t i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(data[offset + i]) << (8 * i);
    }
    return v;
}

BalanceDelta token_balance_delta(
    const TransactionMeta& meta, const std::string& owner, const std::string& mint) {
    BalanceDelta out;
    int64_t pre = 0;
    int64_t post = 0;

    for (const auto& b : meta.pre_token_balances) {
        if (b.owner == owner && b.mint == mint) {
            out.present = true;
            out.decimals = b.decimals;
            pre += static_cast<int64_t>(b.amount);
        }
    }
    for (const auto& b : meta.post_token_balances) {
        if (b.owner == owner && b.mint == mint) {
            out.present = true;
            out.decimals = b.decimals;
            post += static_cast<int64_t>(b.amount);
        }
    }

    out.delta = post - pre;
    return out;
}

namespace {

template <typename T>
std::unique_ptr<ProtocolAdapter> make() {
    return std::make_unique<T>();
}

}  // namespace

const std::vector<ProtocolInfo>& protocol_registry() {
    static const std::vector<ProtocolInfo> registry = {
        {DexType::RaydiumCpmm, "raydium_cpmm", RaydiumCpmmAdapter::PROGRAM_ID, &make<RaydiumCpmmAdapter>},
        {DexType::PumpFun, "pumpfun", PumpFunAdapter::PROGRAM_ID, &make<PumpFunAdapter>},
        {DexType::PumpSwap, "pumpswap", PumpSwapAdapter::PROGRAM_ID, &make<PumpSwapAdapter>},
        {DexType::Bonk, "bonk", BonkAdapter::PROGRAM_ID, &make<BonkAdapter>},
    };
    return registry;
}

const ProtocolInfo& protocol_info(DexType type) {
    for (const auto& info : protocol_registry()) {
        if (info.type == type) return info;
    }
    throw ConfigError("Unsupported DEX type: " + std::string(to_string(type)));
}

std::unique_ptr<ProtocolAdapter> AdapterFactory::create(DexType type) {
    return protocol_info(type).create();
}

std::vector<std::unique_ptr<ProtocolAdapter>> AdapterFactory::create_all(
    const std::vector<DexType>& types) {
    std::vector<std::unique_ptr<ProtocolAdapter>> adapters;
    adapters.reserve(types.size());
    for (auto type : types) {
        adapters.push_back(create(type));
    }
    return adapters;
}

}  // namespace dexpilot
