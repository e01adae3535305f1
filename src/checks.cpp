// =============================================================================
// checks.cpp - Key comparison primitives and token-side validation
// =============================================================================

#include "cpamm/checks.hpp"

namespace cpamm {

// =============================================================================
// Reference Resolver
// =============================================================================

const Pubkey& resolve(const Pool& pool, Role role) {
    switch (role) {
        case Role::TOKEN0_MINT:    return pool.token_0.mint;
        case Role::TOKEN0_RESERVE: return pool.token_0.reserves;
        case Role::TOKEN0_FEES:    return pool.token_0.admin_fees;
        case Role::TOKEN1_MINT:    return pool.token_1.mint;
        case Role::TOKEN1_RESERVE: return pool.token_1.reserves;
        case Role::TOKEN1_FEES:    return pool.token_1.admin_fees;
        case Role::POOL_MINT:      return pool.pool_mint;
        case Role::ADMIN:          return pool.admin;
        case Role::FACTORY:        return pool.factory;
    }
    return pool.key;  // unreachable
}

const char* role_label(Role role) {
    switch (role) {
        case Role::TOKEN0_MINT:    return "token_0.mint";
        case Role::TOKEN0_RESERVE: return "token_0.reserve";
        case Role::TOKEN0_FEES:    return "token_0.admin_fees";
        case Role::TOKEN1_MINT:    return "token_1.mint";
        case Role::TOKEN1_RESERVE: return "token_1.reserve";
        case Role::TOKEN1_FEES:    return "token_1.admin_fees";
        case Role::POOL_MINT:      return "pool_mint";
        case Role::ADMIN:          return "admin";
        case Role::FACTORY:        return "factory";
    }
    return "unknown";
}

// =============================================================================
// Key Checks
// =============================================================================

Status check_keys_eq(const Pubkey& expected, const Pubkey& actual,
                     std::string_view label, int32_t code) {
    if (expected != actual) return Status::invalid(code, label);
    return Status::valid();
}

Status check_keys_neq(const Pubkey& a, const Pubkey& b,
                      std::string_view label, int32_t code) {
    if (a == b) return Status::invalid(code, label);
    return Status::valid();
}

Status check_role(const Pool& pool, Role role, const Pubkey& actual, int32_t code) {
    return check_keys_eq(resolve(pool, role), actual, role_label(role), code);
}

// =============================================================================
// Token-Side Validation
// =============================================================================

Status validate_swap_token(const SwapToken& side, const TokenSlot& slot) {
    Status s = check_keys_eq(slot.reserves, side.reserve.key, "reserve", errors::RESERVE_MISMATCH);
    if (!s) return s;
    s = check_keys_eq(slot.mint, side.user.mint, "user.mint", errors::MINT_MISMATCH);
    if (!s) return s;

    // No self-dealing
    return check_keys_neq(side.reserve.key, side.user.key,
                          "user cannot be reserve account", errors::SELF_DEALING);
}

Status validate_swap_token_with_fees(const SwapTokenWithFees& side, const TokenSlot& slot) {
    Status s = check_keys_eq(slot.admin_fees, side.fees.key, "fees", errors::FEE_MISMATCH);
    if (!s) return s;
    s = check_keys_eq(slot.reserves, side.reserve.key, "reserve", errors::RESERVE_MISMATCH);
    if (!s) return s;
    s = check_keys_eq(slot.mint, side.user.mint, "user.mint", errors::MINT_MISMATCH);
    if (!s) return s;

    s = check_keys_neq(side.fees.key, side.user.key,
                       "user cannot be fees account", errors::SELF_DEALING);
    if (!s) return s;
    return check_keys_neq(side.reserve.key, side.user.key,
                          "user cannot be reserve account", errors::SELF_DEALING);
}

Status validate_init_swap_token(const InitSwapToken& side, const Pubkey& swap,
                                const ProgramIds& ids) {
    Status s = check_keys_eq(side.mint.key, side.fees.mint, "fees.mint", errors::MINT_MISMATCH);
    if (!s) return s;
    s = check_keys_eq(swap, side.fees.owner, "fees.owner", errors::OWNER_MISMATCH);
    if (!s) return s;

    auto expected_reserve = associated_token_address(swap, side.mint.key, ids);
    if (!expected_reserve) {
        return Status::invalid(errors::ATA_MISMATCH, "reserve");
    }
    s = check_keys_eq(*expected_reserve, side.reserve.key, "reserve", errors::ATA_MISMATCH);
    if (!s) return s;

    // Otherwise protocol fees would accrue to LP holders
    return check_keys_neq(side.fees.key, side.reserve.key,
                          "fees cannot equal reserve", errors::FEE_EQUALS_RESERVE);
}

} // namespace cpamm
