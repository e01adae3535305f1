#ifndef CPAMM_CHECKS_HPP
#define CPAMM_CHECKS_HPP

#include <string_view>

#include "types.hpp"
#include "address.hpp"
#include "instructions.hpp"

namespace cpamm {

// =============================================================================
// Reference Resolver
// =============================================================================

enum class Role : uint8_t {
    TOKEN0_MINT = 0,
    TOKEN0_RESERVE = 1,
    TOKEN0_FEES = 2,
    TOKEN1_MINT = 3,
    TOKEN1_RESERVE = 4,
    TOKEN1_FEES = 5,
    POOL_MINT = 6,
    ADMIN = 7,
    FACTORY = 8
};

// The one account that must appear in `role` for this pool
const Pubkey& resolve(const Pool& pool, Role role);

// "token_0.reserve", "pool_mint", ...
const char* role_label(Role role);

// =============================================================================
// Key Checks
// =============================================================================

// Fails with `code` when expected != actual
Status check_keys_eq(const Pubkey& expected, const Pubkey& actual,
                     std::string_view label, int32_t code = errors::KEY_MISMATCH);

// Fails with `code` when a == b
Status check_keys_neq(const Pubkey& a, const Pubkey& b,
                      std::string_view label, int32_t code = errors::KEY_COLLISION);

// Compares the account supplied for `role` against the pool
Status check_role(const Pool& pool, Role role, const Pubkey& actual, int32_t code);

// =============================================================================
// Token-Side Validation
// =============================================================================

// reserve, user.mint, user != reserve
Status validate_swap_token(const SwapToken& side, const TokenSlot& slot);

// fees, reserve, user.mint, user != fees, user != reserve
Status validate_swap_token_with_fees(const SwapTokenWithFees& side, const TokenSlot& slot);

// Establishes the slot invariants at pool creation:
// fees.mint, fees.owner, reserve is the pool's associated account, fees != reserve
Status validate_init_swap_token(const InitSwapToken& side, const Pubkey& swap,
                                const ProgramIds& ids);

} // namespace cpamm

#endif // CPAMM_CHECKS_HPP
