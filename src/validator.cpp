// =============================================================================
// validator.cpp - Per-instruction account validation
// =============================================================================

#include "cpamm/validator.hpp"
#include "cpamm/checks.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>

namespace cpamm {

namespace {

// Each facade gets its own logger so its level stays private; the stderr sink
// is shared between them.
std::shared_ptr<spdlog::logger> make_logger(const std::string& level) {
    static auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();

    auto logger = std::make_shared<spdlog::logger>("cpamm", sink);
    logger->set_level(spdlog::level::from_str(level));
    return logger;
}

struct Dispatch {
    const ProgramIds& ids;

    Status operator()(const CreateFactory& ix) const { return validate_create_factory(ix); }
    Status operator()(const CreatePool& ix) const { return validate_create_pool(ix, ids); }
    Status operator()(const CreatePoolMeta& ix) const { return validate_create_pool_meta(ix); }
    Status operator()(const Swap& ix) const { return validate_swap(ix); }
    Status operator()(const Deposit& ix) const { return validate_deposit(ix); }
    Status operator()(const Withdraw& ix) const { return validate_withdraw(ix); }
};

struct Name {
    const char* operator()(const CreateFactory&) const { return "create_factory"; }
    const char* operator()(const CreatePool&) const { return "create_pool"; }
    const char* operator()(const CreatePoolMeta&) const { return "create_pool_meta"; }
    const char* operator()(const Swap&) const { return "swap"; }
    const char* operator()(const Deposit&) const { return "deposit"; }
    const char* operator()(const Withdraw&) const { return "withdraw"; }
};

Status paused() {
    return Status::invalid(errors::POOL_PAUSED, "pool is paused");
}

} // namespace

const char* instruction_name(const Instruction& ix) {
    return std::visit(Name{}, ix);
}

// =============================================================================
// Pool Lifecycle
// =============================================================================

Status validate_create_factory(const CreateFactory&) {
    return Status::valid();
}

Status validate_create_pool(const CreatePool& ix, const ProgramIds& ids) {
    const Mint& pool_mint = ix.pool_mint;

    uint8_t decimals = std::max(ix.token_0.mint.decimals, ix.token_1.mint.decimals);
    if (pool_mint.decimals != decimals) {
        return Status::invalid(errors::DECIMALS_MISMATCH,
                               "pool mint decimals must be the max of token A and token B mint");
    }

    // Pool mint belongs to the pool
    if (!pool_mint.mint_authority) {
        return Status::invalid(errors::MISSING_AUTHORITY, "pool_mint.mint_authority");
    }
    Status s = check_keys_eq(ix.swap, *pool_mint.mint_authority,
                             "pool_mint.mint_authority", errors::AUTHORITY_MISMATCH);
    if (!s) return s;
    if (!pool_mint.freeze_authority) {
        return Status::invalid(errors::MISSING_AUTHORITY, "pool_mint.freeze_authority");
    }
    s = check_keys_eq(ix.swap, *pool_mint.freeze_authority,
                      "pool_mint.freeze_authority", errors::AUTHORITY_MISMATCH);
    if (!s) return s;

    s = check_keys_eq(pool_mint.key, ix.output_lp.mint, "output_lp.mint", errors::MINT_MISMATCH);
    if (!s) return s;

    const Pubkey& mint_0 = ix.token_0.mint.key;
    const Pubkey& mint_1 = ix.token_1.mint.key;
    s = check_keys_neq(mint_0, mint_1, "swap tokens cannot be equal", errors::TOKENS_EQUAL);
    if (!s) return s;
    if (!(mint_0 < mint_1)) {
        return Status::invalid(errors::TOKENS_NOT_SORTED, "swap tokens must be sorted");
    }

    s = validate_init_swap_token(ix.token_0, ix.swap, ids);
    if (!s) return s;
    return validate_init_swap_token(ix.token_1, ix.swap, ids);
}

Status validate_create_pool_meta(const CreatePoolMeta&) {
    // Metadata is informational only
    return Status::valid();
}

// =============================================================================
// Trading
// =============================================================================

SwapSides swap_sides(const Pool& pool, const Pubkey& input_reserve) {
    if (input_reserve == pool.token_0.reserves) {
        return SwapSides{&pool.token_0, &pool.token_1};
    }
    return SwapSides{&pool.token_1, &pool.token_0};
}

Status validate_swap(const Swap& ix) {
    if (ix.pool.is_paused) return paused();

    // The leg checks below confirm the caller's mints match the chosen sides
    SwapSides sides = swap_sides(ix.pool, ix.input.reserve.key);
    Status s = validate_swap_token(ix.input, *sides.input);
    if (!s) return s;
    return validate_swap_token(ix.output, *sides.output);
}

// =============================================================================
// Liquidity
// =============================================================================

Status validate_deposit(const Deposit& ix) {
    const Pool& pool = ix.pool;
    if (pool.is_paused) return paused();

    Status s = validate_swap_token_with_fees(ix.input_0, pool.token_0);
    if (!s) return s;
    s = validate_swap_token_with_fees(ix.input_1, pool.token_1);
    if (!s) return s;

    s = check_role(pool, Role::POOL_MINT, ix.pool_mint, errors::MINT_MISMATCH);
    if (!s) return s;

    // LP output destination
    s = check_keys_eq(pool.pool_mint, ix.output_lp.mint, "output_lp.mint", errors::MINT_MISMATCH);
    if (!s) return s;
    return check_keys_neq(pool.key, ix.output_lp.owner,
                          "output_lp.owner should not be the swap", errors::SELF_OWNERSHIP);
}

Status validate_withdraw(const Withdraw& ix) {
    const Pool& pool = ix.pool;
    if (pool.is_paused) return paused();

    Status s = check_role(pool, Role::POOL_MINT, ix.pool_mint, errors::MINT_MISMATCH);
    if (!s) return s;
    s = check_keys_eq(ix.pool_mint, ix.input_lp.mint, "input_lp.mint", errors::MINT_MISMATCH);
    if (!s) return s;

    s = validate_swap_token_with_fees(ix.output_0, pool.token_0);
    if (!s) return s;
    return validate_swap_token_with_fees(ix.output_1, pool.token_1);
}

Status validate(const Instruction& ix, const ProgramIds& ids) {
    return std::visit(Dispatch{ids}, ix);
}

// =============================================================================
// Validator
// =============================================================================

Validator::Validator(Config config, std::shared_ptr<spdlog::logger> logger)
    : config_(std::move(config)),
      logger_(logger ? std::move(logger) : make_logger(config_.log_level)) {
}

Status Validator::validate(const Instruction& ix) const {
    Status status = cpamm::validate(ix, config_.programs);
    {
        // Counters move together so a snapshot always adds up
        std::unique_lock lock(stats_mutex_);
        ++total_validated_;
        if (!status.ok()) {
            ++total_rejected_;
            ++rejected_by_code_[status.code];
        }
    }

    if (status.ok()) {
        logger_->trace("{} accepted", instruction_name(ix));
        return status;
    }

    auto level = config_.log_rejections ? spdlog::level::warn : spdlog::level::debug;
    logger_->log(level, "{} rejected: {} ({})",
                 instruction_name(ix), error_name(status.code), status.label);
    return status;
}

Validator::Stats Validator::get_stats() const {
    std::shared_lock lock(stats_mutex_);

    Stats stats;
    stats.total_validated = total_validated_;
    stats.total_rejected = total_rejected_;
    for (const auto& [code, count] : rejected_by_code_) {
        stats.rejected_by_code[code] = count;
    }
    return stats;
}

void Validator::reset_stats() {
    std::unique_lock lock(stats_mutex_);
    total_validated_ = 0;
    total_rejected_ = 0;
    rejected_by_code_.clear();
}

} // namespace cpamm
