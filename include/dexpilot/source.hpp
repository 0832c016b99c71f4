// DexPilot - Transaction Sources
// Where raw transactions come from (Solana JSON-RPC over cpr)

#pragma once

#include <dexpilot/config.hpp>
#include <dexpilot/transaction.hpp>
#include <nlohmann/json_fwd.hpp>
#include <atomic>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace dexpilot {

enum class RpcErrorKind : uint8_t {
    Transport,  // connection failure or timeout
    Http,       // non-200 status
    Response,   // JSON-RPC error object or missing result
    Malformed   // payload not in the expected shape
};

[[nodiscard]] std::string_view to_string(RpcErrorKind kind) noexcept;

// Transport, HTTP or JSON-RPC level failure. Transient: retry next tick.
class RpcError : public std::runtime_error {
public:
    explicit RpcError(const std::string& msg, RpcErrorKind kind = RpcErrorKind::Transport)
        : std::runtime_error(msg), kind_(kind) {}

    [[nodiscard]] RpcErrorKind kind() const noexcept { return kind_; }

    // Transport and HTTP failures say nothing about the request itself
    [[nodiscard]] bool transient() const noexcept {
        return kind_ == RpcErrorKind::Transport || kind_ == RpcErrorKind::Http;
    }

private:
    RpcErrorKind kind_;
};

class TransactionSource {
public:
    virtual ~TransactionSource() = default;

    // Transactions touching `address` newer than `since_cursor` (a signature),
    // oldest first. The last element is the caller's next cursor, so a batch
    // never skips past a transaction that could still be fetched later.
    // Throws RpcError.
    virtual std::vector<RawTransaction> fetch_recent(
        const std::string& address,
        const std::optional<std::string>& since_cursor) = 0;
};

// getSignaturesForAddress then one getTransaction per signature.
// A transaction the node has not served yet ends the batch there. One that
// cannot be loaded (RPC error for that signature, unparseable body) is
// delivered with load_error set so the cursor moves past it.
class RpcTransactionSource : public TransactionSource {
public:
    explicit RpcTransactionSource(const RpcConfig& config);

    std::vector<RawTransaction> fetch_recent(
        const std::string& address,
        const std::optional<std::string>& since_cursor) override;

    [[nodiscard]] uint64_t request_count() const noexcept {
        return requests_.load(std::memory_order_relaxed);
    }

protected:
    // One JSON-RPC round trip; returns the "result" member
    virtual nlohmann::json call(const std::string& method, const nlohmann::json& params);

private:

    RpcConfig config_;
    std::atomic<uint64_t> next_id_{1};
    std::atomic<uint64_t> requests_{0};
};

// Signatures from a getSignaturesForAddress result, skipping failed ones,
// in the order returned (newest first)
[[nodiscard]] std::vector<std::string> parse_signature_list(const nlohmann::json& result);

// Converts a getTransaction result (encoding "json") into a RawTransaction.
// Throws RpcError when required fields are missing or mistyped.
[[nodiscard]] RawTransaction parse_transaction(const nlohmann::json& result,
                                               const std::string& signature);

}  // namespace dexpilot
