// =============================================================================
// types.cpp - Pubkey text form, error names and status rendering
// =============================================================================

#include "cpamm/types.hpp"
#include <vector>

namespace cpamm {

namespace {

constexpr char BASE58_ALPHABET[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int base58_index(char c) {
    for (int i = 0; i < 58; ++i) {
        if (BASE58_ALPHABET[i] == c) return i;
    }
    return -1;
}

} // namespace

// =============================================================================
// Base58
// =============================================================================

std::string Pubkey::to_base58() const {
    size_t zeros = 0;
    while (zeros < bytes.size() && bytes[zeros] == 0) ++zeros;

    // log(256) / log(58) ~ 1.37
    std::vector<uint8_t> b58((bytes.size() - zeros) * 138 / 100 + 1, 0);
    for (size_t i = zeros; i < bytes.size(); ++i) {
        uint32_t carry = bytes[i];
        for (auto it = b58.rbegin(); it != b58.rend(); ++it) {
            carry += 256u * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
    }

    auto it = b58.begin();
    while (it != b58.end() && *it == 0) ++it;

    std::string out(zeros, '1');
    out.reserve(zeros + static_cast<size_t>(b58.end() - it));
    for (; it != b58.end(); ++it) out += BASE58_ALPHABET[*it];
    return out;
}

std::optional<Pubkey> Pubkey::from_base58(std::string_view text) {
    if (text.empty()) return std::nullopt;

    size_t zeros = 0;
    while (zeros < text.size() && text[zeros] == '1') ++zeros;

    // log(58) / log(256) ~ 0.733
    std::vector<uint8_t> b256((text.size() - zeros) * 733 / 1000 + 1, 0);
    for (size_t i = zeros; i < text.size(); ++i) {
        int digit = base58_index(text[i]);
        if (digit < 0) return std::nullopt;

        uint32_t carry = static_cast<uint32_t>(digit);
        for (auto it = b256.rbegin(); it != b256.rend(); ++it) {
            carry += 58u * (*it);
            *it = static_cast<uint8_t>(carry & 0xFF);
            carry >>= 8;
        }
        if (carry != 0) return std::nullopt;
    }

    auto it = b256.begin();
    while (it != b256.end() && *it == 0) ++it;

    size_t len = zeros + static_cast<size_t>(b256.end() - it);
    if (len != 32) return std::nullopt;

    Pubkey key;
    size_t pos = zeros;
    for (; it != b256.end(); ++it) key.bytes[pos++] = *it;
    return key;
}

size_t PubkeyHash::operator()(const Pubkey& key) const {
    // Keys are uniformly distributed; fold the first 8 bytes
    uint64_t h = 0;
    for (size_t i = 0; i < 8; ++i) h = (h << 8) | key.bytes[i];
    return static_cast<size_t>(h);
}

// =============================================================================
// Errors
// =============================================================================

const char* error_name(int32_t code) {
    switch (code) {
        case errors::OK:                 return "Valid";
        case errors::POOL_PAUSED:        return "PoolPaused";
        case errors::DECIMALS_MISMATCH:  return "DecimalsMismatch";
        case errors::AUTHORITY_MISMATCH: return "AuthorityMismatch";
        case errors::MISSING_AUTHORITY:  return "MissingAuthority";
        case errors::MINT_MISMATCH:      return "MintMismatch";
        case errors::RESERVE_MISMATCH:   return "ReserveMismatch";
        case errors::FEE_MISMATCH:       return "FeeMismatch";
        case errors::OWNER_MISMATCH:     return "OwnerMismatch";
        case errors::ATA_MISMATCH:       return "AtaMismatch";
        case errors::FEE_EQUALS_RESERVE: return "FeeEqualsReserve";
        case errors::SELF_DEALING:       return "SelfDealing";
        case errors::SELF_OWNERSHIP:     return "SelfOwnership";
        case errors::TOKENS_EQUAL:       return "TokensEqual";
        case errors::TOKENS_NOT_SORTED:  return "TokensNotSorted";
        case errors::KEY_MISMATCH:       return "KeyMismatch";
        case errors::KEY_COLLISION:      return "KeyCollision";
        default:                         return "Unknown";
    }
}

std::string Status::to_string() const {
    if (ok()) return "Valid";
    std::string out = error_name(code);
    if (!label.empty()) {
        out += ": ";
        out += label;
    }
    return out;
}

} // namespace cpamm
