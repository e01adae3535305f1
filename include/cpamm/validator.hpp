#ifndef CPAMM_VALIDATOR_HPP
#define CPAMM_VALIDATOR_HPP

#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "types.hpp"
#include "address.hpp"
#include "config.hpp"
#include "instructions.hpp"

namespace cpamm {

// =============================================================================
// Operation Validators
// =============================================================================
//
// Each runs once per request before any effect is applied. They read the
// supplied accounts and pool state only and stop at the first violated
// invariant.

Status validate_create_factory(const CreateFactory& ix);
Status validate_create_pool(const CreatePool& ix, const ProgramIds& ids);
Status validate_create_pool_meta(const CreatePoolMeta& ix);
Status validate_swap(const Swap& ix);
Status validate_deposit(const Deposit& ix);
Status validate_withdraw(const Withdraw& ix);

// Dispatch on the instruction tag
Status validate(const Instruction& ix, const ProgramIds& ids);

// Swap direction derived from which persisted reserve the input leg names.
// Anything other than token_0's reserve selects token_1 as input.
struct SwapSides {
    const TokenSlot* input;
    const TokenSlot* output;
};

SwapSides swap_sides(const Pool& pool, const Pubkey& input_reserve);

// =============================================================================
// Validator - configured entry point with logging and statistics
// =============================================================================

class Validator {
public:
    // Without a logger the facade creates a private one at config.log_level.
    // A supplied logger keeps the level its owner gave it.
    explicit Validator(Config config, std::shared_ptr<spdlog::logger> logger = nullptr);
    ~Validator() = default;

    // Non-copyable
    Validator(const Validator&) = delete;
    Validator& operator=(const Validator&) = delete;

    Status validate(const Instruction& ix) const;

    const Config& config() const { return config_; }
    const std::shared_ptr<spdlog::logger>& logger() const { return logger_; }

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_validated;
        uint64_t total_rejected;
        std::map<int32_t, uint64_t> rejected_by_code;
    };
    Stats get_stats() const;
    void reset_stats();

private:
    Config config_;
    std::shared_ptr<spdlog::logger> logger_;

    // Guarded by stats_mutex_
    mutable uint64_t total_validated_ = 0;
    mutable uint64_t total_rejected_ = 0;
    mutable std::unordered_map<int32_t, uint64_t> rejected_by_code_;
    mutable std::shared_mutex stats_mutex_;
};

} // namespace cpamm

#endif // CPAMM_VALIDATOR_HPP
