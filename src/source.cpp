// DexPilot - JSON-RPC Transaction Source Implementation

#include <dexpilot/source.hpp>
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace dexpilot {

using json = nlohmann::json;

namespace {

CompiledInstruction parse_instruction(const json& ix) {
    CompiledInstruction out;
    out.program_id_index = ix.at("programIdIndex").get<uint32_t>();
    out.accounts = ix.at("accounts").get<std::vector<uint32_t>>();
    out.data = base58_decode(ix.at("data").get<std::string>());
    return out;
}

RawTransaction unloadable(const std::string& signature, const std::string& reason) {
    RawTransaction tx;
    tx.signature = signature;
    tx.load_error = reason;
    return tx;
}

std::vector<TokenBalance> parse_token_balances(const json& list) {
    std::vector<TokenBalance> out;
    if (!list.is_array()) return out;
    for (const auto& b : list) {
        TokenBalance tb;
        tb.account_index = b.at("accountIndex").get<uint32_t>();
        tb.mint = b.at("mint").get<std::string>();
        tb.owner = b.value("owner", "");
        const auto& ui = b.at("uiTokenAmount");
        tb.amount = std::stoull(ui.at("amount").get<std::string>());
        tb.decimals = ui.at("decimals").get<uint8_t>();
        out.push_back(std::move(tb));
    }
    return out;
}

}  // namespace

std::string_view to_string(RpcErrorKind kind) noexcept {
    switch (kind) {
        case RpcErrorKind::Transport: return "transport";
        case RpcErrorKind::Http: return "http";
        case RpcErrorKind::Response: return "response";
        case RpcErrorKind::Malformed: return "malformed";
    }
    return "unknown";
}

RpcTransactionSource::RpcTransactionSource(const RpcConfig& config) : config_(config) {}

json RpcTransactionSource::call(const std::string& method, const json& params) {
    json body = {
        {"jsonrpc", "2.0"},
        {"id", next_id_.fetch_add(1, std::memory_order_relaxed)},
        {"method", method},
        {"params", params}
    };

    requests_.fetch_add(1, std::memory_order_relaxed);
    auto response = cpr::Post(
        cpr::Url{config_.url},
        cpr::Header{{"Content-Type", "application/json"}},
        cpr::Body{body.dump()},
        cpr::Timeout{config_.timeout_ms});

    if (response.error) {
        throw RpcError(method + " transport error: " + response.error.message);
    }
    if (response.status_code != 200) {
        throw RpcError(method + " HTTP " + std::to_string(response.status_code) +
                       ": " + response.text, RpcErrorKind::Http);
    }

    json data;
    try {
        data = json::parse(response.text);
    } catch (const json::parse_error& e) {
        throw RpcError(method + " returned invalid JSON: " + e.what(), RpcErrorKind::Malformed);
    }

    if (data.contains("error") && !data["error"].is_null()) {
        const auto& err = data["error"];
        throw RpcError(method + " error: " +
                       (err.is_object() ? err.value("message", err.dump()) : err.dump()),
                       RpcErrorKind::Response);
    }
    if (!data.contains("result")) {
        throw RpcError(method + " response has no result", RpcErrorKind::Response);
    }
    return data["result"];
}

std::vector<RawTransaction> RpcTransactionSource::fetch_recent(
    const std::string& address,
    const std::optional<std::string>& since_cursor) {
    json options = {
        {"limit", config_.fetch_limit},
        {"commitment", config_.commitment}
    };
    if (since_cursor) {
        options["until"] = *since_cursor;
    }

    auto signatures = parse_signature_list(call("getSignaturesForAddress", json::array({address, options})));

    std::vector<RawTransaction> out;
    out.reserve(signatures.size());

    // Newest-first from the node; deliver oldest-first
    for (auto it = signatures.rbegin(); it != signatures.rend(); ++it) {
        json tx_options = {
            {"encoding", "json"},
            {"commitment", config_.commitment},
            {"maxSupportedTransactionVersion", 0}
        };

        json result;
        try {
            result = call("getTransaction", json::array({*it, tx_options}));
        } catch (const RpcError& e) {
            if (!e.transient()) {
                spdlog::warn("Skipping transaction {}: {}", *it, e.what());
                out.push_back(unloadable(*it, e.what()));
                continue;
            }
            // Keep what is contiguous; the rest is newer than the cursor and refetched
            if (out.empty()) throw;
            spdlog::warn("Batch for {} cut short at {}: {}", address, *it, e.what());
            break;
        }

        if (result.is_null()) {
            spdlog::debug("Transaction {} not yet available, batch ends here", *it);
            break;
        }

        try {
            out.push_back(parse_transaction(result, *it));
        } catch (const RpcError& e) {
            spdlog::warn("Skipping transaction {}: {}", *it, e.what());
            out.push_back(unloadable(*it, e.what()));
        }
    }
    return out;
}

std::vector<std::string> parse_signature_list(const json& result) {
    if (!result.is_array()) {
        throw RpcError("getSignaturesForAddress result is not an array", RpcErrorKind::Malformed);
    }
    std::vector<std::string> out;
    try {
        for (const auto& entry : result) {
            if (entry.contains("err") && !entry["err"].is_null()) continue;
            out.push_back(entry.at("signature").get<std::string>());
        }
    } catch (const json::exception& e) {
        throw RpcError(std::string("Malformed signature entry: ") + e.what(), RpcErrorKind::Malformed);
    }
    return out;
}

RawTransaction parse_transaction(const json& result, const std::string& signature) {
    try {
        RawTransaction tx;
        tx.signature = signature;
        tx.slot = result.value("slot", uint64_t{0});
        if (result.contains("blockTime") && !result["blockTime"].is_null()) {
            tx.block_time = result["blockTime"].get<int64_t>();
        }

        const auto& message = result.at("transaction").at("message");
        tx.account_keys = message.at("accountKeys").get<std::vector<std::string>>();
        for (const auto& ix : message.at("instructions")) {
            tx.instructions.push_back(parse_instruction(ix));
        }

        if (result.contains("meta") && !result["meta"].is_null()) {
            const auto& m = result["meta"];
            TransactionMeta meta;
            meta.failed = m.contains("err") && !m["err"].is_null();
            meta.fee = m.value("fee", uint64_t{0});
            meta.pre_balances = m.value("preBalances", std::vector<uint64_t>{});
            meta.post_balances = m.value("postBalances", std::vector<uint64_t>{});
            if (m.contains("preTokenBalances")) meta.pre_token_balances = parse_token_balances(m["preTokenBalances"]);
            if (m.contains("postTokenBalances")) meta.post_token_balances = parse_token_balances(m["postTokenBalances"]);
            if (m.contains("logMessages") && m["logMessages"].is_array()) {
                meta.log_messages = m["logMessages"].get<std::vector<std::string>>();
            }
            if (m.contains("innerInstructions") && m["innerInstructions"].is_array()) {
                for (const auto& set : m["innerInstructions"]) {
                    InnerInstructionSet inner;
                    inner.index = set.at("index").get<uint32_t>();
                    for (const auto& ix : set.at("instructions")) {
                        inner.instructions.push_back(parse_instruction(ix));
                    }
                    meta.inner_instructions.push_back(std::move(inner));
                }
            }

            // Address-table lookups extend the key list for versioned transactions
            if (m.contains("loadedAddresses") && m["loadedAddresses"].is_object()) {
                const auto& loaded = m["loadedAddresses"];
                for (const auto* group : {"writable", "readonly"}) {
                    if (loaded.contains(group)) {
                        auto keys = loaded[group].get<std::vector<std::string>>();
                        tx.account_keys.insert(tx.account_keys.end(), keys.begin(), keys.end());
                    }
                }
            }
            tx.meta = std::move(meta);
        }
        return tx;
    } catch (const json::exception& e) {
        throw RpcError("Malformed transaction " + signature + ": " + e.what(),
                       RpcErrorKind::Malformed);
    } catch (const Base58Error& e) {
        throw RpcError("Malformed instruction data in " + signature + ": " + e.what(),
                       RpcErrorKind::Malformed);
    } catch (const std::logic_error& e) {
        throw RpcError("Malformed token amount in " + signature + ": " + e.what(),
                       RpcErrorKind::Malformed);
    }
}

}  // namespace dexpilot
