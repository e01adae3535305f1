#ifndef CPAMM_TEST_FIXTURES_HPP
#define CPAMM_TEST_FIXTURES_HPP

#include "cpamm/cpamm.hpp"

namespace cpamm::test {

// Key with every byte set to n; ordering follows n
inline Pubkey key_of(uint8_t n) {
    std::array<uint8_t, 32> bytes;
    bytes.fill(n);
    return Pubkey(bytes);
}

// A consistent pool: sorted mints, reserves at the pool's associated token
// addresses, fee accounts owned by the pool, and one user holding all three tokens.
struct PoolFixture {
    ProgramIds ids = ProgramIds::defaults();

    Pubkey pool_key = key_of(0x50);
    Pubkey factory = key_of(0x01);
    Pubkey admin = key_of(0x02);

    Pubkey mint_0 = key_of(0x10);
    Pubkey mint_1 = key_of(0x20);
    Pubkey pool_mint = key_of(0x30);

    Pubkey reserve_0;
    Pubkey reserve_1;
    Pubkey fees_0 = key_of(0x11);
    Pubkey fees_1 = key_of(0x21);

    Pubkey user = key_of(0x70);
    Pubkey user_0 = key_of(0x71);
    Pubkey user_1 = key_of(0x72);
    Pubkey user_lp = key_of(0x73);

    Pool pool;

    PoolFixture() {
        reserve_0 = associated_token_address(pool_key, mint_0, ids).value();
        reserve_1 = associated_token_address(pool_key, mint_1, ids).value();

        pool.key = pool_key;
        pool.factory = factory;
        pool.index = 0;
        pool.bump = 254;
        pool.token_0 = TokenSlot{0, mint_0, reserve_0, fees_0};
        pool.token_1 = TokenSlot{1, mint_1, reserve_1, fees_1};
        pool.pool_mint = pool_mint;
        pool.is_paused = false;
        pool.admin = admin;
        pool.pending_admin = Pubkey{};
        pool.fees = Fees{{30, 10000}, {0, 10000}, {0, 10000}, {0, 10000}};
    }

    TokenAccount user_account(const Pubkey& key, const Pubkey& mint) const {
        return TokenAccount{key, mint, user};
    }

    TokenAccount pool_account(const Pubkey& key, const Pubkey& mint) const {
        return TokenAccount{key, mint, pool_key};
    }

    SwapToken swap_leg(int side) const {
        if (side == 0) {
            return SwapToken{user_account(user_0, mint_0), pool_account(reserve_0, mint_0)};
        }
        return SwapToken{user_account(user_1, mint_1), pool_account(reserve_1, mint_1)};
    }

    SwapTokenWithFees fee_leg(int side) const {
        if (side == 0) {
            return SwapTokenWithFees{user_account(user_0, mint_0),
                                     pool_account(reserve_0, mint_0),
                                     pool_account(fees_0, mint_0)};
        }
        return SwapTokenWithFees{user_account(user_1, mint_1),
                                 pool_account(reserve_1, mint_1),
                                 pool_account(fees_1, mint_1)};
    }

    InitSwapToken init_leg(int side) const {
        if (side == 0) {
            return InitSwapToken{Mint{mint_0, 6, std::nullopt, std::nullopt},
                                 pool_account(reserve_0, mint_0),
                                 pool_account(fees_0, mint_0)};
        }
        return InitSwapToken{Mint{mint_1, 9, std::nullopt, std::nullopt},
                             pool_account(reserve_1, mint_1),
                             pool_account(fees_1, mint_1)};
    }

    CreatePool create_pool() const {
        CreatePool ix;
        ix.factory = factory;
        ix.swap = pool_key;
        ix.pool_mint = Mint{pool_mint, 9, pool_key, pool_key};
        ix.output_lp = user_account(user_lp, pool_mint);
        ix.token_0 = init_leg(0);
        ix.token_1 = init_leg(1);
        return ix;
    }

    // token_0 in, token_1 out
    Swap swap() const {
        return Swap{pool, user, swap_leg(0), swap_leg(1)};
    }

    Deposit deposit() const {
        return Deposit{pool, user, pool_mint, fee_leg(0), fee_leg(1),
                       user_account(user_lp, pool_mint)};
    }

    Withdraw withdraw() const {
        return Withdraw{pool, user, pool_mint, user_account(user_lp, pool_mint),
                        fee_leg(0), fee_leg(1)};
    }
};

} // namespace cpamm::test

#endif // CPAMM_TEST_FIXTURES_HPP
