#ifndef CPAMM_INSTRUCTIONS_HPP
#define CPAMM_INSTRUCTIONS_HPP

#include <variant>

#include "types.hpp"

namespace cpamm {

// =============================================================================
// Token-Side Account Groups
// =============================================================================

// One leg of a swap
struct SwapToken {
    TokenAccount user;       // Caller's token account
    TokenAccount reserve;    // Pool reserve claimed by the caller
};

// One leg of a deposit or withdrawal
struct SwapTokenWithFees {
    TokenAccount user;
    TokenAccount reserve;
    TokenAccount fees;       // Admin fee destination claimed by the caller
};

// One side of a pool being created; nothing is persisted yet
struct InitSwapToken {
    Mint mint;
    TokenAccount reserve;
    TokenAccount fees;
};

// =============================================================================
// Instruction Account Sets
// =============================================================================

struct CreateFactory {
    Pubkey factory;
    Pubkey base;
    Pubkey payer;
};

struct CreatePool {
    Pubkey factory;
    Pubkey swap;             // Identity the new pool will have
    Mint pool_mint;
    TokenAccount output_lp;  // Receives the initial LP tokens
    InitSwapToken token_0;
    InitSwapToken token_1;
};

struct CreatePoolMeta {
    Pubkey swap;
    Pubkey swap_meta;
    Pubkey payer;
};

struct Swap {
    Pool pool;
    Pubkey user_authority;
    SwapToken input;
    SwapToken output;
};

struct Deposit {
    Pool pool;
    Pubkey user_authority;
    Pubkey pool_mint;
    SwapTokenWithFees input_0;
    SwapTokenWithFees input_1;
    TokenAccount output_lp;
};

struct Withdraw {
    Pool pool;
    Pubkey user_authority;
    Pubkey pool_mint;
    TokenAccount input_lp;
    SwapTokenWithFees output_0;
    SwapTokenWithFees output_1;
};

using Instruction = std::variant<CreateFactory,
                                 CreatePool,
                                 CreatePoolMeta,
                                 Swap,
                                 Deposit,
                                 Withdraw>;

// "create_factory", "create_pool", "create_pool_meta", "swap", "deposit", "withdraw"
const char* instruction_name(const Instruction& ix);

} // namespace cpamm

#endif // CPAMM_INSTRUCTIONS_HPP
