// DexPilot - Base58 Codec Implementation

#include <dexpilot/transaction.hpp>
#include <algorithm>
#include <array>

namespace dexpilot {

namespace {

constexpr std::string_view ALPHABET =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

constexpr std::array<int8_t, 128> build_index() {
    std::array<int8_t, 128> table{};
    for (auto& v : table) v = -1;
    for (size_t i = 0; i < ALPHABET.size(); ++i) {
        table[static_cast<size_t>(ALPHABET[i])] = static_cast<int8_t>(i);
    }
    return table;
}

constexpr auto INDEX = build_index();

}  // namespace

std::vector<uint8_t> base58_decode(std::string_view input) {
    size_t leading_zeros = 0;
    while (leading_zeros < input.size() && input[leading_zeros] == '1') {
        ++leading_zeros;
    }

    // Big-endian base256 accumulator
    std::vector<uint8_t> b256((input.size() - leading_zeros) * 733 / 1000 + 1, 0);
    size_t length = 0;

    for (size_t pos = leading_zeros; pos < input.size(); ++pos) {
        auto c = static_cast<unsigned char>(input[pos]);
        if (c >= 128 || INDEX[c] < 0) {
            throw Base58Error("Invalid base58 character at offset " + std::to_string(pos));
        }
        uint32_t carry = static_cast<uint32_t>(INDEX[c]);
        size_t i = 0;
        for (auto it = b256.rbegin(); (carry != 0 || i < length) && it != b256.rend(); ++it, ++i) {
            carry += 58u * (*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        length = i;
    }

    auto it = b256.begin() + static_cast<std::ptrdiff_t>(b256.size() - length);
    std::vector<uint8_t> out(leading_zeros, 0);
    out.insert(out.end(), it, b256.end());
    return out;
}

std::string base58_encode(const std::vector<uint8_t>& bytes) {
    size_t leading_zeros = 0;
    while (leading_zeros < bytes.size() && bytes[leading_zeros] == 0) {
        ++leading_zeros;
    }

    std::vector<uint8_t> b58((bytes.size() - leading_zeros) * 138 / 100 + 1, 0);
    size_t length = 0;

    for (size_t pos = leading_zeros; pos < bytes.size(); ++pos) {
        uint32_t carry = bytes[pos];
        size_t i = 0;
        for (auto it = b58.rbegin(); (carry != 0 || i < length) && it != b58.rend(); ++it, ++i) {
            carry += 256u * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = i;
    }

    std::string out(leading_zeros, '1');
    for (auto it = b58.begin() + static_cast<std::ptrdiff_t>(b58.size() - length); it != b58.end(); ++it) {
        out.push_back(ALPHABET[*it]);
    }
    return out;
}

bool is_valid_pubkey(std::string_view address) noexcept {
    if (address.size() < 32 || address.size() > 44) return false;
    bool ok = std::all_of(address.begin(), address.end(), [](char ch) {
        auto c = static_cast<unsigned char>(ch);
        return c < 128 && INDEX[c] >= 0;
    });
    if (!ok) return false;
    try {
        return base58_decode(address).size() == 32;
    } catch (const Base58Error&) {
        return false;
    }
}

}  // namespace dexpilot
