#ifndef CPAMM_CPAMM_HPP
#define CPAMM_CPAMM_HPP

// =============================================================================
// cpamm - Constant-product AMM account validation
//
//   types.hpp        Pubkey, account views, pool state, error codes
//   address.hpp      Program derived / associated token addresses
//   instructions.hpp Per-instruction account sets
//   checks.hpp       Key checks, reference resolver, token-side validation
//   validator.hpp    Operation validators and the Validator entry point
//   config.hpp       Configuration
//
// =============================================================================

#include "types.hpp"
#include "address.hpp"
#include "instructions.hpp"
#include "checks.hpp"
#include "config.hpp"
#include "validator.hpp"

#endif // CPAMM_CPAMM_HPP
