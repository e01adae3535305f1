#ifndef CPAMM_ADDRESS_HPP
#define CPAMM_ADDRESS_HPP

#include <optional>
#include <utility>
#include <vector>

#include "types.hpp"

namespace cpamm {

// =============================================================================
// Program Identities
// =============================================================================

namespace programs {
constexpr const char* TOKEN_PROGRAM_ID = "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA";
constexpr const char* ASSOCIATED_TOKEN_PROGRAM_ID = "ATokenGPvbdGVxr1b2hvZbsiqW5xWH25efTNsLJA8knL";
}

struct ProgramIds {
    Pubkey token_program;
    Pubkey associated_token_program;

    // Mainnet SPL token and associated-token programs
    static ProgramIds defaults();
};

// =============================================================================
// Program Derived Addresses
// =============================================================================

using Seed = std::vector<uint8_t>;

constexpr size_t MAX_SEEDS = 16;
constexpr size_t MAX_SEED_LEN = 32;

// True if the bytes decompress to a valid Ed25519 point
bool is_on_curve(const Pubkey& key);

// sha256(seeds || program_id || "ProgramDerivedAddress"), rejected if on curve
// or if the seed limits are exceeded
std::optional<Pubkey> create_program_address(const std::vector<Seed>& seeds,
                                             const Pubkey& program_id);

// Searches bump seeds from 255 down; returns the address and the bump used
std::optional<std::pair<Pubkey, uint8_t>> find_program_address(const std::vector<Seed>& seeds,
                                                               const Pubkey& program_id);

// Canonical token account for (owner, mint)
std::optional<Pubkey> associated_token_address(const Pubkey& owner,
                                               const Pubkey& mint,
                                               const ProgramIds& ids);

} // namespace cpamm

#endif // CPAMM_ADDRESS_HPP
