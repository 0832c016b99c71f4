// DexPilot - Raw Transaction Model
// Chain transactions as delivered by the transaction source

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace dexpilot {

// Instruction referencing accounts by index into RawTransaction::account_keys
struct CompiledInstruction {
    uint32_t program_id_index = 0;
    std::vector<uint32_t> accounts;
    std::vector<uint8_t> data;
};

struct InnerInstructionSet {
    uint32_t index = 0;  // outer instruction that produced them
    std::vector<CompiledInstruction> instructions;
};

// SPL token balance of one account
struct TokenBalance {
    uint32_t account_index = 0;
    std::string mint;
    std::string owner;
    uint64_t amount = 0;  // raw units
    uint8_t decimals = 0;
};

struct TransactionMeta {
    bool failed = false;
    uint64_t fee = 0;
    std::vector<uint64_t> pre_balances;
    std::vector<uint64_t> post_balances;
    std::vector<TokenBalance> pre_token_balances;
    std::vector<TokenBalance> post_token_balances;
    std::vector<InnerInstructionSet> inner_instructions;
    std::vector<std::string> log_messages;
};

struct RawTransaction {
    std::string signature;
    uint64_t slot = 0;
    std::optional<int64_t> block_time;  // seconds since epoch
    std::vector<std::string> account_keys;  // [0] is the fee payer
    std::vector<CompiledInstruction> instructions;
    std::optional<TransactionMeta> meta;
    // Set when the signature was listed but its body could not be loaded
    std::optional<std::string> load_error;

    [[nodiscard]] const std::string* account(uint32_t index) const noexcept {
        return index < account_keys.size() ? &account_keys[index] : nullptr;
    }

    [[nodiscard]] const std::string* fee_payer() const noexcept { return account(0); }
};

// Base58 (Bitcoin alphabet) codec used for Solana keys and instruction data
class Base58Error : public std::runtime_error {
public:
    explicit Base58Error(const std::string& msg) : std::runtime_error(msg) {}
};

[[nodiscard]] std::vector<uint8_t> base58_decode(std::string_view input);
[[nodiscard]] std::string base58_encode(const std::vector<uint8_t>& bytes);

// True if the string decodes to a 32-byte public key
[[nodiscard]] bool is_valid_pubkey(std::string_view address) noexcept;

}  // namespace dexpilot
