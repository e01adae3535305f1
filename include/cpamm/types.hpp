#ifndef CPAMM_TYPES_HPP
#define CPAMM_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <optional>
#include <cstddef>

namespace cpamm {

// =============================================================================
// Account Identity (32-byte public key)
// =============================================================================

struct Pubkey {
    std::array<uint8_t, 32> bytes;

    Pubkey() : bytes{} {}
    explicit Pubkey(const std::array<uint8_t, 32>& b) : bytes(b) {}

    bool is_default() const {
        for (auto b : bytes) if (b != 0) return false;
        return true;
    }

    // Base58 text form (Bitcoin alphabet)
    std::string to_base58() const;
    static std::optional<Pubkey> from_base58(std::string_view text);

    // Lexicographic byte order; this is the canonical mint ordering
    bool operator==(const Pubkey& other) const { return bytes == other.bytes; }
    bool operator!=(const Pubkey& other) const { return bytes != other.bytes; }
    bool operator<(const Pubkey& other) const { return bytes < other.bytes; }
    bool operator>(const Pubkey& other) const { return bytes > other.bytes; }
};

struct PubkeyHash {
    size_t operator()(const Pubkey& key) const;
};

// =============================================================================
// Account Views (deserialized by the dispatch layer)
// =============================================================================

// SPL token account: identity plus its declared mint and owner
struct TokenAccount {
    Pubkey key;
    Pubkey mint;
    Pubkey owner;
};

// SPL mint. Authorities are optional on-chain and may be absent.
struct Mint {
    Pubkey key;
    uint8_t decimals;
    std::optional<Pubkey> mint_authority;
    std::optional<Pubkey> freeze_authority;
};

// =============================================================================
// Persisted Pool State
// =============================================================================

// One asset side of a pool
struct TokenSlot {
    uint8_t index;        // 0 or 1
    Pubkey mint;          // Underlying asset
    Pubkey reserves;      // Pooled funds
    Pubkey admin_fees;    // Protocol fee accrual, never equal to reserves
};

// Fee rates as fractions. Carried for completeness; no fee math happens here.
struct Fraction {
    uint64_t numerator;
    uint64_t denominator;
};

struct Fees {
    Fraction trade_fee;
    Fraction withdraw_fee;
    Fraction admin_trade_fee;
    Fraction admin_withdraw_fee;
};

struct Pool {
    Pubkey key;           // The pool's own identity (owner of reserves and fees)
    Pubkey factory;
    uint64_t index;
    uint8_t bump;
    TokenSlot token_0;    // token_0.mint < token_1.mint, fixed at creation
    TokenSlot token_1;
    Pubkey pool_mint;     // LP share mint
    bool is_paused;
    Pubkey admin;
    Pubkey pending_admin;
    Fees fees;
};

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t POOL_PAUSED = -1;
constexpr int32_t DECIMALS_MISMATCH = -2;
constexpr int32_t AUTHORITY_MISMATCH = -3;
constexpr int32_t MISSING_AUTHORITY = -4;
constexpr int32_t MINT_MISMATCH = -5;
constexpr int32_t RESERVE_MISMATCH = -6;
constexpr int32_t FEE_MISMATCH = -7;
constexpr int32_t OWNER_MISMATCH = -8;
constexpr int32_t ATA_MISMATCH = -9;
constexpr int32_t FEE_EQUALS_RESERVE = -10;
constexpr int32_t SELF_DEALING = -11;
constexpr int32_t SELF_OWNERSHIP = -12;
constexpr int32_t TOKENS_EQUAL = -13;
constexpr int32_t TOKENS_NOT_SORTED = -14;
constexpr int32_t KEY_MISMATCH = -20;
constexpr int32_t KEY_COLLISION = -21;
}

// Stable name for an error code ("PoolPaused", "MintMismatch", ...)
const char* error_name(int32_t code);

// =============================================================================
// Validation Outcome
// =============================================================================

struct Status {
    int32_t code;
    std::string label;   // Names the violated check, e.g. "user.mint"

    bool ok() const { return code == errors::OK; }
    explicit operator bool() const { return ok(); }

    static Status valid() { return Status{errors::OK, {}}; }
    static Status invalid(int32_t code, std::string_view label) {
        return Status{code, std::string(label)};
    }

    // "Valid" or "MintMismatch: user.mint"
    std::string to_string() const;
};

} // namespace cpamm

#endif // CPAMM_TYPES_HPP
