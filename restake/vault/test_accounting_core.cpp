// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <restake/core/address.hpp>
#include <restake/core/int.hpp>
#include <restake/core/result.hpp>
#include <restake/ledger/asset.hpp>
#include <restake/ledger/ledger_error.hpp>
#include <restake/ledger/token_ledger.hpp>
#include <restake/vault/accounting_core.hpp>
#include <restake/vault/test_vault_fixture.hpp>
#include <restake/vault/util/constants.hpp>
#include <restake/vault/util/vault_error.hpp>
#include <restake/vault/vault.hpp>

#include <boost/outcome/success_failure.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <functional>
#include <optional>
#include <vector>

using namespace restake;
using namespace restake::vault;
using namespace restake::test;

namespace
{
    constexpr auto OTHER_TOKEN{
        0x00000000000000000000000000000000000070c1_address};

    // Pool whose deposit hook runs arbitrary code, for failure and
    // reentrancy paths
    struct HookPool final : public OperatorPool
    {
        sim::SimOperatorPool &inner;
        std::function<Result<void>()> on_deposit;

        explicit HookPool(sim::SimOperatorPool &inner)
            : inner{inner}
        {
        }

        Address const &address() const override
        {
            return inner.address();
        }

        uint256_t balance_of(Address const &asset) const override
        {
            return inner.balance_of(asset);
        }

        uint256_t native_staked_balance() const override
        {
            return inner.native_staked_balance();
        }

        Result<uint256_t>
        deposit(Address const &asset, uint256_t const &amount) override
        {
            if (on_deposit) {
                BOOST_OUTCOME_TRY(on_deposit());
            }
            return inner.deposit(asset, amount);
        }

        Result<uint64_t> initiate_withdraw(
            Address const &asset, uint256_t const &amount) override
        {
            return inner.initiate_withdraw(asset, amount);
        }

        Result<uint256_t> complete_withdraw(uint64_t const id) override
        {
            return inner.complete_withdraw(id);
        }
    };

    struct HookDirectory final : public OperatorPoolDirectory
    {
        OperatorPoolDirectory &fallback;
        Address hooked;
        HookPool *pool;

        HookDirectory(
            OperatorPoolDirectory &fallback, Address const &hooked,
            HookPool &pool)
            : fallback{fallback}
            , hooked{hooked}
            , pool{&pool}
        {
        }

        OperatorPool *resolve(Address const &delegate) override
        {
            return delegate == hooked ? pool : fallback.resolve(delegate);
        }
    };
}

struct AccountingCoreTest : public VaultTest
{
    AccountingCore core{state, env.collaborators};

    uint256_t shares_of(Address const &owner)
    {
        return vault.share_balance(owner);
    }
};

TEST_F(AccountingCoreTest, first_deposit_bootstraps)
{
    auto &pool = add_delegate(D1, 10'000);
    fund(ALICE, 100 * ONE);

    auto const minted = vault.deposit(ALICE, TOKEN, 100 * ONE);
    ASSERT_FALSE(minted.has_error());
    EXPECT_EQ(minted.value(), 100 * ONE);
    EXPECT_EQ(shares_of(ALICE), 100 * ONE);
    EXPECT_EQ(token.balance_of(ALICE), 0);
    EXPECT_EQ(pool.balance_of(TOKEN), 100 * ONE);

    auto const totals = vault.calculate_total_values();
    ASSERT_FALSE(totals.has_error());
    EXPECT_EQ(totals.value().grand_total, 100 * ONE);
    ASSERT_EQ(totals.value().per_delegate_total.size(), 1);
    EXPECT_EQ(totals.value().per_delegate_total[0], 100 * ONE);
    // token column plus the native column
    ASSERT_EQ(totals.value().per_delegate_per_asset[0].size(), 2);
    EXPECT_EQ(totals.value().per_delegate_per_asset[0][0], 100 * ONE);
    EXPECT_EQ(totals.value().per_delegate_per_asset[0][1], 0);

    // the deposit event comes last
    auto const &log = state.logs().back();
    EXPECT_EQ(log.address, ACCOUNTING_CA);
    ASSERT_EQ(log.topics.size(), 3);
}

TEST_F(AccountingCoreTest, second_deposit_mints_at_running_price)
{
    add_delegate(D1, 10'000);
    fund(ALICE, 100 * ONE);
    fund(BOB, 50 * ONE);

    ASSERT_FALSE(vault.deposit(ALICE, TOKEN, 100 * ONE).has_error());
    auto const minted = vault.deposit(BOB, TOKEN, 50 * ONE);
    ASSERT_FALSE(minted.has_error());
    EXPECT_EQ(minted.value(), 49999999999999999925_u256);
    EXPECT_EQ(vault.total_shares(), 149999999999999999925_u256);
}

TEST_F(AccountingCoreTest, deposit_goes_to_first_underallocated_delegate)
{
    auto &p1 = add_delegate(D1, 5'000);
    auto &p2 = add_delegate(D2, 5'000);
    fund(ALICE, 200 * ONE);

    // empty vault: first delegate
    ASSERT_FALSE(vault.deposit(ALICE, TOKEN, 100 * ONE).has_error());
    EXPECT_EQ(p1.balance_of(TOKEN), 100 * ONE);

    // D1 holds 100 of 100, above its half; D2 is below
    ASSERT_FALSE(vault.deposit(ALICE, TOKEN, 50 * ONE).has_error());
    EXPECT_EQ(p2.balance_of(TOKEN), 50 * ONE);

    // D1 100 of 150 is above 75, D2 50 is below
    ASSERT_FALSE(vault.deposit(ALICE, TOKEN, 50 * ONE).has_error());
    EXPECT_EQ(p1.balance_of(TOKEN), 100 * ONE);
    EXPECT_EQ(p2.balance_of(TOKEN), 100 * ONE);
}

TEST_F(AccountingCoreTest, deposit_falls_back_to_first_delegate)
{
    auto &p1 = add_delegate(D1, 0);
    auto &p2 = add_delegate(D2, 0);
    fund(ALICE, 100 * ONE);

    ASSERT_FALSE(vault.deposit(ALICE, TOKEN, 60 * ONE).has_error());
    ASSERT_FALSE(vault.deposit(ALICE, TOKEN, 40 * ONE).has_error());
    EXPECT_EQ(p1.balance_of(TOKEN), 100 * ONE);
    EXPECT_EQ(p2.balance_of(TOKEN), 0);
}

TEST_F(AccountingCoreTest, deposit_without_delegates)
{
    fund(ALICE, ONE);
    EXPECT_EQ(
        vault.deposit(ALICE, TOKEN, ONE).assume_error(),
        VaultError::NoEligibleDelegate);
    EXPECT_EQ(token.balance_of(ALICE), ONE);
}

TEST_F(AccountingCoreTest, withdraw_selection_prefers_overallocated)
{
    add_delegate(D1, 5'000);
    add_delegate(D2, 5'000);

    std::vector<std::vector<uint256_t>> const per_asset{
        {30 * ONE, 0}, {10 * ONE, 60 * ONE}};
    std::vector<uint256_t> const totals{30 * ONE, 70 * ONE};
    auto const grand = 100 * ONE;

    // D2 is above its half and holds enough
    EXPECT_EQ(
        core.choose_delegate_for_withdraw(0, 5 * ONE, per_asset, totals, grand)
            .value(),
        1);
    // D2 is above but short of the asset, D1 holds it
    EXPECT_EQ(
        core.choose_delegate_for_withdraw(
                0, 20 * ONE, per_asset, totals, grand)
            .value(),
        0);
    // native column
    EXPECT_EQ(
        core.choose_delegate_for_withdraw(
                1, 60 * ONE, per_asset, totals, grand)
            .value(),
        1);
    EXPECT_EQ(
        core.choose_delegate_for_withdraw(
                0, 31 * ONE, per_asset, totals, grand)
            .assume_error(),
        VaultError::NoEligibleDelegate);
}

TEST_F(AccountingCoreTest, deposit_selection_edge_cases)
{
    EXPECT_EQ(
        core.choose_delegate_for_deposit({}, 0).assume_error(),
        VaultError::NoEligibleDelegate);

    add_delegate(D1, 2'000);
    add_delegate(D2, 8'000);
    EXPECT_EQ(core.choose_delegate_for_deposit({0, 0}, 0).value(), 0);
    EXPECT_EQ(
        core.choose_delegate_for_deposit({20 * ONE, 70 * ONE}, 100 * ONE)
            .value(),
        1);
    EXPECT_EQ(
        core.choose_delegate_for_deposit({20 * ONE, 80 * ONE}, 100 * ONE)
            .value(),
        0);
}

TEST_F(AccountingCoreTest, global_cap)
{
    add_delegate(D1, 10'000);
    fund(ALICE, 200 * ONE);
    ASSERT_FALSE(vault.set_max_total_value(ADMIN, 120 * ONE).has_error());

    ASSERT_FALSE(vault.deposit(ALICE, TOKEN, 100 * ONE).has_error());
    EXPECT_EQ(
        vault.deposit(ALICE, TOKEN, 21 * ONE).assume_error(),
        VaultError::MaxTvlReached);
    EXPECT_FALSE(vault.deposit(ALICE, TOKEN, 20 * ONE).has_error());

    fund_native(ALICE, ONE);
    EXPECT_EQ(
        vault.deposit_native(ALICE, ONE).assume_error(),
        VaultError::MaxTvlReached);

    // zero disables the cap
    ASSERT_FALSE(vault.set_max_total_value(ADMIN, 0).has_error());
    EXPECT_FALSE(vault.deposit(ALICE, TOKEN, 50 * ONE).has_error());
}

TEST_F(AccountingCoreTest, token_cap)
{
    add_delegate(D1, 10'000);
    fund(ALICE, 100 * ONE);
    ASSERT_FALSE(vault.set_token_value_cap(ADMIN, TOKEN, 50 * ONE).has_error());

    EXPECT_EQ(
        vault.deposit(ALICE, TOKEN, 60 * ONE).assume_error(),
        VaultError::MaxTokenTvlReached);
    ASSERT_FALSE(vault.deposit(ALICE, TOKEN, 50 * ONE).has_error());
    EXPECT_EQ(
        vault.deposit(ALICE, TOKEN, 1).assume_error(),
        VaultError::MaxTokenTvlReached);

    EXPECT_EQ(
        vault.set_token_value_cap(ADMIN, OTHER_TOKEN, ONE).assume_error(),
        VaultError::AssetNotFound);
}

TEST_F(AccountingCoreTest, token_cap_counts_buffered_holdings)
{
    auto &pool = add_delegate(D1, 10'000);
    fund(ALICE, 100 * ONE);
    ASSERT_FALSE(vault.set_buffer_target(ADMIN, TOKEN, 10 * ONE).has_error());
    ASSERT_FALSE(vault.set_token_value_cap(ADMIN, TOKEN, 50 * ONE).has_error());

    ASSERT_FALSE(vault.deposit(ALICE, TOKEN, 30 * ONE).has_error());
    EXPECT_EQ(held(TOKEN), 10 * ONE);
    EXPECT_EQ(pool.balance_of(TOKEN), 20 * ONE);

    // 20 delegated and 10 buffered leave room for 20
    EXPECT_EQ(
        vault.deposit(ALICE, TOKEN, 20 * ONE + 1).assume_error(),
        VaultError::MaxTokenTvlReached);
    ASSERT_FALSE(vault.deposit(ALICE, TOKEN, 20 * ONE).has_error());
    EXPECT_EQ(
        vault.deposit(ALICE, TOKEN, 1).assume_error(),
        VaultError::MaxTokenTvlReached);
}

TEST_F(AccountingCoreTest, deposit_input_checks)
{
    add_delegate(D1, 10'000);
    fund(ALICE, ONE);

    EXPECT_EQ(
        vault.deposit(ALICE, TOKEN, 0).assume_error(), VaultError::ZeroAmount);
    EXPECT_EQ(
        vault.deposit(ALICE, OTHER_TOKEN, ONE).assume_error(),
        VaultError::AssetNotFound);
    EXPECT_EQ(
        vault.deposit(ALICE, NATIVE_ASSET, ONE).assume_error(),
        VaultError::InvalidInput);
    EXPECT_EQ(
        vault.deposit_native(ALICE, 0).assume_error(), VaultError::ZeroAmount);
    // more than the caller holds
    EXPECT_EQ(
        vault.deposit(ALICE, TOKEN, 2 * ONE).assume_error(),
        LedgerError::InsufficientBalance);
}

TEST_F(AccountingCoreTest, pause)
{
    add_delegate(D1, 10'000);
    fund(ALICE, 10 * ONE);

    EXPECT_EQ(
        vault.pause(ALICE, Component::Accounting).assume_error(),
        VaultError::NotAuthorized);
    ASSERT_FALSE(vault.pause(ADMIN, Component::Accounting).has_error());
    EXPECT_EQ(
        vault.deposit(ALICE, TOKEN, ONE).assume_error(), VaultError::Paused);
    ASSERT_FALSE(vault.unpause(ADMIN, Component::Accounting).has_error());
    EXPECT_FALSE(vault.deposit(ALICE, TOKEN, ONE).has_error());

    env.risk.set_paused(PauseFlag::Deposit, true);
    EXPECT_EQ(
        vault.deposit(ALICE, TOKEN, ONE).assume_error(), VaultError::Paused);
    fund_native(ALICE, ONE);
    EXPECT_EQ(
        vault.deposit_native(ALICE, ONE).assume_error(), VaultError::Paused);
}

TEST_F(AccountingCoreTest, deposit_fills_buffer_first)
{
    auto &pool = add_delegate(D1, 10'000);
    fund(ALICE, 100 * ONE);
    ASSERT_FALSE(vault.set_buffer_target(ADMIN, TOKEN, 10 * ONE).has_error());

    ASSERT_FALSE(vault.deposit(ALICE, TOKEN, 4 * ONE).has_error());
    EXPECT_EQ(held(TOKEN), 4 * ONE);
    EXPECT_EQ(pool.balance_of(TOKEN), 0);

    ASSERT_FALSE(vault.deposit(ALICE, TOKEN, 96 * ONE).has_error());
    EXPECT_EQ(held(TOKEN), 10 * ONE);
    EXPECT_EQ(pool.balance_of(TOKEN), 90 * ONE);
    EXPECT_EQ(vault.available_to_withdraw(TOKEN), 10 * ONE);
    EXPECT_EQ(vault.buffer_deficit(TOKEN), 0);

    // buffered value still counts
    EXPECT_EQ(vault.calculate_total_values().value().grand_total, 100 * ONE);
    expect_buffer_invariants(TOKEN);
}

TEST_F(AccountingCoreTest, native_deposit_goes_to_staging)
{
    add_delegate(D1, 10'000);
    fund_native(ALICE, 50 * ONE);
    ASSERT_FALSE(
        vault.set_buffer_target(ADMIN, NATIVE_ASSET, 5 * ONE).has_error());

    auto const minted = vault.deposit_native(ALICE, 40 * ONE);
    ASSERT_FALSE(minted.has_error());
    EXPECT_EQ(minted.value(), 40 * ONE);
    EXPECT_EQ(held(NATIVE_ASSET), 5 * ONE);
    EXPECT_EQ(state.get_balance(STAGING_CA), 35 * ONE);
    EXPECT_EQ(state.get_balance(ALICE), 10 * ONE);
    EXPECT_EQ(vault.calculate_total_values().value().grand_total, 40 * ONE);
}

TEST_F(AccountingCoreTest, stake_native_from_staging)
{
    auto &pool = add_delegate(D1, 10'000);
    fund_native(ALICE, 40 * ONE);
    ASSERT_FALSE(vault.deposit_native(ALICE, 40 * ONE).has_error());

    EXPECT_EQ(
        vault.stake_native_from_staging(ALICE, D1).assume_error(),
        VaultError::NotAuthorized);
    EXPECT_EQ(
        vault.stake_native_from_staging(ADMIN, D2).assume_error(),
        VaultError::DelegateNotFound);

    ASSERT_FALSE(vault.stake_native_from_staging(ADMIN, D1).has_error());
    EXPECT_EQ(state.get_balance(STAGING_CA), 8 * ONE);
    EXPECT_EQ(pool.native_staked_balance(), VALIDATOR_DEPOSIT);
    EXPECT_EQ(state.get_balance(pool.address()), VALIDATOR_DEPOSIT);

    auto const totals = vault.calculate_total_values().value();
    EXPECT_EQ(totals.per_delegate_per_asset[0].back(), VALIDATOR_DEPOSIT);
    EXPECT_EQ(totals.grand_total, 40 * ONE);

    EXPECT_EQ(
        vault.stake_native_from_staging(ADMIN, D1).assume_error(),
        VaultError::InsufficientStaging);
}

TEST_F(AccountingCoreTest, asset_registry)
{
    EXPECT_EQ(
        vault.add_collateral_asset(ADMIN, TOKEN, 0).assume_error(),
        VaultError::AlreadyRegistered);
    EXPECT_EQ(
        vault.add_collateral_asset(ADMIN, OTHER_TOKEN, 0).assume_error(),
        VaultError::OracleNotFound);
    EXPECT_EQ(
        vault.add_collateral_asset(ADMIN, NATIVE_ASSET, 0).assume_error(),
        VaultError::InvalidInput);
    EXPECT_EQ(
        vault.add_collateral_asset(ADMIN, Address{}, 0).assume_error(),
        VaultError::ZeroAddress);
    EXPECT_EQ(
        vault.add_collateral_asset(ALICE, OTHER_TOKEN, 0).assume_error(),
        VaultError::NotAuthorized);

    auto &pool = add_delegate(D1, 10'000);
    fund(ALICE, ONE);
    ASSERT_FALSE(vault.deposit(ALICE, TOKEN, ONE).has_error());
    EXPECT_EQ(
        vault.remove_collateral_asset(ADMIN, TOKEN).assume_error(),
        VaultError::NonZeroBalance);

    pool.slash(TOKEN, ONE);
    ASSERT_FALSE(vault.remove_collateral_asset(ADMIN, TOKEN).has_error());
    EXPECT_EQ(
        vault.remove_collateral_asset(ADMIN, TOKEN).assume_error(),
        VaultError::AssetNotFound);
    EXPECT_EQ(core.vars.assets.size(), 0);
}

TEST_F(AccountingCoreTest, remove_asset_held_by_buffer)
{
    add_delegate(D1, 10'000);
    fund(ALICE, 100 * ONE);
    ASSERT_FALSE(vault.set_buffer_target(ADMIN, TOKEN, 100 * ONE).has_error());
    ASSERT_FALSE(vault.deposit(ALICE, TOKEN, 100 * ONE).has_error());
    ASSERT_EQ(held(TOKEN), 100 * ONE);

    // no delegate holds the asset but the buffer does
    EXPECT_EQ(
        vault.remove_collateral_asset(ADMIN, TOKEN).assume_error(),
        VaultError::NonZeroBalance);
    EXPECT_EQ(vault.calculate_total_values().value().grand_total, 100 * ONE);

    // an open request keeps the reservation alive until it is claimed
    auto const index = vault.withdraw(ALICE, 100 * ONE, TOKEN);
    ASSERT_FALSE(index.has_error());
    EXPECT_EQ(buffer(TOKEN).claim_reserve().load().native(), 100 * ONE);
    EXPECT_EQ(
        vault.remove_collateral_asset(ADMIN, TOKEN).assume_error(),
        VaultError::NonZeroBalance);

    advance(DEFAULT_COOLDOWN_PERIOD);
    auto const paid = vault.claim(ALICE, index.value(), ALICE);
    ASSERT_FALSE(paid.has_error());
    EXPECT_EQ(paid.value(), 100 * ONE);
    EXPECT_EQ(held(TOKEN), 0);
    EXPECT_EQ(buffer(TOKEN).claim_reserve().load().native(), 0);
    EXPECT_EQ(buffer(TOKEN).queue_deficit(), 0);

    ASSERT_FALSE(vault.remove_collateral_asset(ADMIN, TOKEN).has_error());
    EXPECT_EQ(core.vars.assets.size(), 0);
}

TEST_F(AccountingCoreTest, remove_asset_with_unfunded_requests)
{
    auto &pool = add_delegate(D1, 10'000);
    fund(ALICE, 100 * ONE);
    ASSERT_FALSE(vault.set_buffer_target(ADMIN, TOKEN, 2 * ONE).has_error());
    ASSERT_FALSE(vault.deposit(ALICE, TOKEN, 100 * ONE).has_error());
    ASSERT_FALSE(vault.withdraw(ALICE, 5 * ONE, TOKEN).has_error());
    EXPECT_EQ(buffer(TOKEN).queue_deficit(), 3 * ONE);

    pool.slash(TOKEN, 98 * ONE);
    EXPECT_EQ(
        vault.remove_collateral_asset(ADMIN, TOKEN).assume_error(),
        VaultError::NonZeroBalance);
}

TEST_F(AccountingCoreTest, delegate_registry_keeps_order)
{
    add_delegate(D1, 1'000);
    add_delegate(D2, 2'000);
    add_delegate(D3, 3'000);

    EXPECT_EQ(
        vault.add_operator_delegate(ADMIN, D1, 0).assume_error(),
        VaultError::AlreadyRegistered);
    EXPECT_EQ(
        vault.add_operator_delegate(ADMIN, BOB, 10'001).assume_error(),
        VaultError::InvalidBasisPoints);
    // no pool deployed for BOB
    EXPECT_EQ(
        vault.add_operator_delegate(ADMIN, BOB, 0).assume_error(),
        VaultError::DelegateNotFound);

    ASSERT_FALSE(vault.remove_operator_delegate(ADMIN, D2).has_error());
    EXPECT_EQ(core.vars.delegates.addresses(), (std::vector<Address>{D1, D3}));
    EXPECT_EQ(core.vars.delegates.index_of(D3), std::optional<uint64_t>{1});
    EXPECT_EQ(core.vars.allocation_bps(D2).load().native(), 0);

    ASSERT_FALSE(vault.set_delegate_allocation(ADMIN, D3, 9'000).has_error());
    EXPECT_EQ(core.vars.allocation_bps(D3).load().native(), 9'000);
    EXPECT_EQ(
        vault.set_delegate_allocation(ADMIN, D2, 1).assume_error(),
        VaultError::DelegateNotFound);
    EXPECT_EQ(
        vault.set_delegate_allocation(ADMIN, D3, 10'001).assume_error(),
        VaultError::InvalidBasisPoints);
}

TEST_F(AccountingCoreTest, remove_delegate_holding_value)
{
    auto &pool = add_delegate(D1, 10'000);
    fund(ALICE, ONE);
    ASSERT_FALSE(vault.deposit(ALICE, TOKEN, ONE).has_error());
    EXPECT_EQ(
        vault.remove_operator_delegate(ADMIN, D1).assume_error(),
        VaultError::NonZeroBalance);

    pool.slash(TOKEN, ONE);
    pool.reward(NATIVE_ASSET, ONE);
    EXPECT_EQ(
        vault.remove_operator_delegate(ADMIN, D1).assume_error(),
        VaultError::NonZeroBalance);
}

TEST_F(AccountingCoreTest, delegate_withdrawal_refills_buffer)
{
    auto &pool = add_delegate(D1, 10'000);
    fund(ALICE, 100 * ONE);
    ASSERT_FALSE(vault.deposit(ALICE, TOKEN, 100 * ONE).has_error());
    ASSERT_FALSE(vault.set_buffer_target(ADMIN, TOKEN, 5 * ONE).has_error());

    auto const id = vault.queue_delegate_withdrawal(ADMIN, TOKEN, 20 * ONE);
    ASSERT_FALSE(id.has_error());
    EXPECT_EQ(id.value(), 1);
    auto const pending = core.pending_delegate_withdrawal(1).value();
    EXPECT_EQ(pending.delegate, D1);
    EXPECT_EQ(pending.amount.native(), 20 * ONE);
    // funds stay counted until they arrive
    EXPECT_EQ(pool.balance_of(TOKEN), 100 * ONE);

    auto const received = vault.complete_delegate_withdrawal(ADMIN, 1);
    ASSERT_FALSE(received.has_error());
    EXPECT_EQ(received.value(), 20 * ONE);
    EXPECT_EQ(held(TOKEN), 5 * ONE);
    EXPECT_EQ(pool.balance_of(TOKEN), 95 * ONE);
    EXPECT_EQ(token.balance_of(ACCOUNTING_CA), 0);
    EXPECT_EQ(vault.calculate_total_values().value().grand_total, 100 * ONE);

    EXPECT_EQ(
        vault.complete_delegate_withdrawal(ADMIN, 1).assume_error(),
        VaultError::DelegateWithdrawalNotFound);
    EXPECT_EQ(
        vault.queue_delegate_withdrawal(ALICE, TOKEN, ONE).assume_error(),
        VaultError::NotAuthorized);
    EXPECT_EQ(
        vault.queue_delegate_withdrawal(ADMIN, TOKEN, 101 * ONE)
            .assume_error(),
        VaultError::NoEligibleDelegate);
}

TEST_F(AccountingCoreTest, failed_deposit_rolls_back)
{
    auto &inner = add_delegate(D1, 10'000);
    HookPool hook{inner};
    HookDirectory directory{env.pools, D1, hook};
    Collaborators const collab{
        .pools = directory,
        .price_feed = env.price_feed,
        .access = env.access,
        .risk = env.risk};
    Vault hooked_vault{state, collab};

    fund(ALICE, 10 * ONE);
    ASSERT_FALSE(vault.set_buffer_target(ADMIN, TOKEN, ONE).has_error());
    auto const log_count = state.logs().size();

    hook.on_deposit = []() -> Result<void> { return VaultError::InvalidInput; };
    EXPECT_EQ(
        hooked_vault.deposit(ALICE, TOKEN, 10 * ONE).assume_error(),
        VaultError::InvalidInput);

    EXPECT_EQ(token.balance_of(ALICE), 10 * ONE);
    EXPECT_EQ(held(TOKEN), 0);
    EXPECT_EQ(inner.balance_of(TOKEN), 0);
    EXPECT_EQ(vault.total_shares(), 0);
    EXPECT_EQ(state.logs().size(), log_count);
    EXPECT_FALSE(core.vars.guard.locked());
}

TEST_F(AccountingCoreTest, reentrant_deposit_is_rejected)
{
    auto &inner = add_delegate(D1, 10'000);
    HookPool hook{inner};
    HookDirectory directory{env.pools, D1, hook};
    Collaborators const collab{
        .pools = directory,
        .price_feed = env.price_feed,
        .access = env.access,
        .risk = env.risk};
    Vault hooked_vault{state, collab};

    fund(ALICE, 10 * ONE);
    std::optional<Result<uint256_t>> nested;
    hook.on_deposit = [&]() -> Result<void> {
        nested.emplace(hooked_vault.deposit(ALICE, TOKEN, ONE));
        return outcome::success();
    };

    auto const minted = hooked_vault.deposit(ALICE, TOKEN, 5 * ONE);
    ASSERT_FALSE(minted.has_error());
    ASSERT_TRUE(nested.has_value());
    EXPECT_EQ(nested->assume_error(), VaultError::Reentrancy);
    EXPECT_EQ(inner.balance_of(TOKEN), 5 * ONE);
    EXPECT_EQ(token.balance_of(ALICE), 5 * ONE);
    EXPECT_FALSE(core.vars.guard.locked());
}
