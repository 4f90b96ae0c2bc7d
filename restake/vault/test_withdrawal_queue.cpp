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
#include <restake/ledger/ledger_error.hpp>
#include <restake/ledger/state.hpp>
#include <restake/vault/test_vault_fixture.hpp>
#include <restake/vault/util/constants.hpp>
#include <restake/vault/util/vault_error.hpp>
#include <restake/vault/vault.hpp>
#include <restake/vault/withdrawal_queue.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace restake;
using namespace restake::vault;
using namespace restake::test;

namespace
{
    constexpr uint64_t COOLDOWN{DEFAULT_COOLDOWN_PERIOD};
}

struct WithdrawalQueueTest : public VaultTest
{
    sim::SimOperatorPool *pool{nullptr};

    void SetUp() override
    {
        VaultTest::SetUp();
        pool = &add_delegate(D1, 10'000);
        fund(ALICE, 100 * ONE);
        fund(ADMIN, 100 * ONE);
    }

    // Deposits 100 tokens for ALICE with `buffered` of them kept in the
    // buffer, then moves the target to `target`
    void seed(uint256_t const &buffered, uint256_t const &target)
    {
        ASSERT_FALSE(
            vault.set_buffer_target(ADMIN, TOKEN, buffered).has_error());
        ASSERT_FALSE(vault.deposit(ALICE, TOKEN, 100 * ONE).has_error());
        ASSERT_EQ(held(TOKEN), buffered);
        ASSERT_FALSE(vault.set_buffer_target(ADMIN, TOKEN, target).has_error());
    }
};

TEST_F(WithdrawalQueueTest, shortfall_is_queued_then_filled)
{
    seed(2 * ONE, 10 * ONE);
    EXPECT_EQ(vault.available_to_withdraw(TOKEN), 2 * ONE);

    auto const index = vault.withdraw(ALICE, 5 * ONE, TOKEN);
    ASSERT_FALSE(index.has_error());
    EXPECT_EQ(index.value(), 0);

    auto const request = vault.withdraw_request(ALICE, 0).value();
    EXPECT_EQ(request.id.native(), 1);
    EXPECT_TRUE(request.queued);
    EXPECT_EQ(request.amount.native(), 5 * ONE);
    EXPECT_EQ(request.reserved.native(), 2 * ONE);
    EXPECT_EQ(request.fill_at.native(), 3 * ONE);
    EXPECT_EQ(request.created_at.native(), START_TIME);

    EXPECT_EQ(vault.claim_reserve(TOKEN), 2 * ONE);
    EXPECT_EQ(vault.available_to_withdraw(TOKEN), 0);
    EXPECT_EQ(vault.withdraw_deficit(TOKEN), 3 * ONE);
    EXPECT_EQ(vault.buffer_deficit(TOKEN), 13 * ONE);
    // shares sit with the queue until the claim
    EXPECT_EQ(vault.share_balance(ALICE), 95 * ONE);
    EXPECT_EQ(vault.share_balance(WITHDRAW_QUEUE_CA), 5 * ONE);

    auto const applied = vault.fill_buffer(ADMIN, TOKEN, 8 * ONE);
    ASSERT_FALSE(applied.has_error());
    EXPECT_EQ(applied.value(), 3 * ONE);
    EXPECT_EQ(buffer(TOKEN).queue_filled().load().native(), 3 * ONE);
    EXPECT_EQ(vault.withdraw_deficit(TOKEN), 0);
    EXPECT_EQ(vault.claim_reserve(TOKEN), 5 * ONE);
    EXPECT_EQ(held(TOKEN), 10 * ONE);
    EXPECT_EQ(vault.available_to_withdraw(TOKEN), 5 * ONE);
    expect_buffer_invariants(TOKEN);

    advance(COOLDOWN);
    auto const paid = vault.claim(ALICE, 0, ALICE);
    ASSERT_FALSE(paid.has_error());
    EXPECT_EQ(paid.value(), 5 * ONE);
    EXPECT_EQ(token.balance_of(ALICE), 5 * ONE);
    EXPECT_EQ(vault.claim_reserve(TOKEN), 0);
    EXPECT_EQ(vault.available_to_withdraw(TOKEN), 5 * ONE);
    EXPECT_EQ(vault.total_shares(), 95 * ONE);
    expect_buffer_invariants(TOKEN);
}

TEST_F(WithdrawalQueueTest, queue_counters_never_decrease)
{
    seed(2 * ONE, 10 * ONE);

    uint256_t to_fill = 0;
    uint256_t filled = 0;
    auto const check = [&] {
        auto const b = buffer(TOKEN);
        auto const next_to_fill = b.queue_to_fill().load().native();
        auto const next_filled = b.queue_filled().load().native();
        EXPECT_GE(next_to_fill, to_fill);
        EXPECT_GE(next_filled, filled);
        EXPECT_LE(next_filled, next_to_fill);
        to_fill = next_to_fill;
        filled = next_filled;
        expect_buffer_invariants(TOKEN);
    };

    ASSERT_FALSE(vault.withdraw(ALICE, 5 * ONE, TOKEN).has_error());
    check();
    ASSERT_FALSE(vault.withdraw(ALICE, 4 * ONE, TOKEN).has_error());
    check();
    EXPECT_EQ(to_fill, 7 * ONE);

    ASSERT_FALSE(vault.fill_buffer(ADMIN, TOKEN, 3 * ONE).has_error());
    check();
    advance(COOLDOWN);
    ASSERT_FALSE(vault.claim(ALICE, 0, ALICE).has_error());
    check();

    ASSERT_FALSE(vault.fill_buffer(ADMIN, TOKEN, 6 * ONE).has_error());
    check();
    EXPECT_EQ(filled, 7 * ONE);
    ASSERT_FALSE(vault.claim(ALICE, 1, ALICE).has_error());
    check();

    ASSERT_FALSE(vault.fill_buffer(ADMIN, TOKEN, 8 * ONE).has_error());
    check();
    ASSERT_FALSE(vault.instant_withdraw(ALICE, ONE, TOKEN, 0).has_error());
    check();

    // fully served queue, nothing outstanding
    EXPECT_EQ(to_fill, 7 * ONE);
    EXPECT_EQ(filled, 7 * ONE);
    EXPECT_EQ(vault.withdraw_deficit(TOKEN), 0);
}

TEST_F(WithdrawalQueueTest, covered_request_is_reserved_in_full)
{
    seed(10 * ONE, 10 * ONE);
    ASSERT_FALSE(vault.withdraw(ALICE, 4 * ONE, TOKEN).has_error());

    auto const request = vault.withdraw_request(ALICE, 0).value();
    EXPECT_FALSE(request.queued);
    EXPECT_EQ(request.reserved.native(), 4 * ONE);
    EXPECT_EQ(request.fill_at.native(), 0);
    EXPECT_EQ(vault.claim_reserve(TOKEN), 4 * ONE);
    EXPECT_EQ(vault.available_to_withdraw(TOKEN), 6 * ONE);
    EXPECT_EQ(vault.withdraw_deficit(TOKEN), 0);
    EXPECT_EQ(vault.buffer_deficit(TOKEN), 4 * ONE);

    auto const &log = state.logs().back();
    EXPECT_EQ(log.address, WITHDRAW_QUEUE_CA);
    ASSERT_EQ(log.topics.size(), 3);
}

TEST_F(WithdrawalQueueTest, claim_waits_for_cooldown)
{
    seed(10 * ONE, 10 * ONE);
    ASSERT_FALSE(vault.withdraw(ALICE, 4 * ONE, TOKEN).has_error());

    advance(COOLDOWN - 1);
    EXPECT_EQ(vault.claim(ALICE, 0, ALICE).assume_error(), VaultError::EarlyClaim);
    EXPECT_EQ(vault.withdraw_request_count(ALICE), 1);

    advance(1);
    auto const paid = vault.claim(ALICE, 0, ALICE);
    ASSERT_FALSE(paid.has_error());
    EXPECT_EQ(paid.value(), 4 * ONE);

    // the request is gone
    EXPECT_EQ(vault.withdraw_request_count(ALICE), 0);
    EXPECT_EQ(
        vault.claim(ALICE, 0, ALICE).assume_error(),
        VaultError::WithdrawRequestNotFound);
    EXPECT_EQ(token.balance_of(ALICE), 4 * ONE);
}

TEST_F(WithdrawalQueueTest, risk_override_lengthens_cooldown)
{
    seed(10 * ONE, 10 * ONE);
    ASSERT_FALSE(vault.withdraw(ALICE, ONE, TOKEN).has_error());
    env.risk.set_cooldown_override(2 * COOLDOWN);

    advance(COOLDOWN);
    EXPECT_EQ(vault.claim(ALICE, 0, ALICE).assume_error(), VaultError::EarlyClaim);
    advance(COOLDOWN);
    EXPECT_FALSE(vault.claim(ALICE, 0, ALICE).has_error());

    // a shorter override never shortens the local cooldown
    env.risk.set_cooldown_override(1);
    ASSERT_FALSE(vault.withdraw(ALICE, ONE, TOKEN).has_error());
    advance(DAY);
    EXPECT_EQ(vault.claim(ALICE, 0, ALICE).assume_error(), VaultError::EarlyClaim);
}

TEST_F(WithdrawalQueueTest, instant_withdrawer_skips_cooldown)
{
    seed(10 * ONE, 10 * ONE);
    ASSERT_FALSE(vault.withdraw(ALICE, 3 * ONE, TOKEN).has_error());

    auto const paid = vault.claim(INSTANT_WITHDRAWER_CA, 0, ALICE);
    ASSERT_FALSE(paid.has_error());
    EXPECT_EQ(paid.value(), 3 * ONE);
    EXPECT_EQ(token.balance_of(ALICE), 3 * ONE);
}

TEST_F(WithdrawalQueueTest, queued_request_waits_for_fill)
{
    seed(2 * ONE, 10 * ONE);
    ASSERT_FALSE(vault.withdraw(ALICE, 5 * ONE, TOKEN).has_error());
    advance(COOLDOWN);

    EXPECT_EQ(
        vault.claim(ALICE, 0, ALICE).assume_error(),
        VaultError::QueuedWithdrawalNotFilled);

    ASSERT_FALSE(vault.fill_buffer(ADMIN, TOKEN, 2 * ONE).has_error());
    EXPECT_EQ(
        vault.claim(ALICE, 0, ALICE).assume_error(),
        VaultError::QueuedWithdrawalNotFilled);

    ASSERT_FALSE(vault.fill_buffer(ADMIN, TOKEN, ONE).has_error());
    auto const paid = vault.claim(ALICE, 0, ALICE);
    ASSERT_FALSE(paid.has_error());
    EXPECT_EQ(paid.value(), 5 * ONE);
    EXPECT_EQ(held(TOKEN), 0);
    expect_buffer_invariants(TOKEN);
}

TEST_F(WithdrawalQueueTest, later_requests_queue_behind_earlier_ones)
{
    seed(2 * ONE, 10 * ONE);
    ASSERT_FALSE(vault.withdraw(ALICE, 5 * ONE, TOKEN).has_error());
    ASSERT_FALSE(vault.withdraw(ALICE, 4 * ONE, TOKEN).has_error());

    auto const second = vault.withdraw_request(ALICE, 1).value();
    EXPECT_TRUE(second.queued);
    EXPECT_EQ(second.reserved.native(), 0);
    EXPECT_EQ(second.fill_at.native(), 7 * ONE);
    EXPECT_EQ(vault.withdraw_deficit(TOKEN), 7 * ONE);

    advance(COOLDOWN);
    ASSERT_FALSE(vault.fill_buffer(ADMIN, TOKEN, 3 * ONE).has_error());
    EXPECT_FALSE(vault.claim(ALICE, 0, ALICE).has_error());
    // the claimed slot is taken by the last request
    ASSERT_EQ(vault.withdraw_request_count(ALICE), 1);
    EXPECT_EQ(vault.withdraw_request(ALICE, 0).value().id.native(), 2);
    EXPECT_EQ(
        vault.claim(ALICE, 0, ALICE).assume_error(),
        VaultError::QueuedWithdrawalNotFilled);

    ASSERT_FALSE(vault.fill_buffer(ADMIN, TOKEN, 4 * ONE).has_error());
    EXPECT_FALSE(vault.claim(ALICE, 0, ALICE).has_error());
    expect_buffer_invariants(TOKEN);
}

TEST_F(WithdrawalQueueTest, value_drop_lowers_payout)
{
    seed(10 * ONE, 10 * ONE);
    ASSERT_FALSE(vault.withdraw(ALICE, 10 * ONE, TOKEN).has_error());

    pool->slash(TOKEN, 45 * ONE);
    advance(COOLDOWN);

    // 55 of value left for 100 shares
    auto const paid = vault.claim(ALICE, 0, ALICE);
    ASSERT_FALSE(paid.has_error());
    EXPECT_EQ(paid.value(), 5'500'000'000'000'000'000_u256);
    // the unpaid part of the reservation is available again
    EXPECT_EQ(vault.claim_reserve(TOKEN), 0);
    EXPECT_EQ(vault.available_to_withdraw(TOKEN), 4'500'000'000'000'000'000_u256);
}

TEST_F(WithdrawalQueueTest, value_rise_keeps_quoted_payout)
{
    seed(10 * ONE, 10 * ONE);
    ASSERT_FALSE(vault.withdraw(ALICE, 10 * ONE, TOKEN).has_error());

    pool->reward(TOKEN, 100 * ONE);
    advance(COOLDOWN);

    auto const paid = vault.claim(ALICE, 0, ALICE);
    ASSERT_FALSE(paid.has_error());
    EXPECT_EQ(paid.value(), 10 * ONE);
}

TEST_F(WithdrawalQueueTest, request_checks)
{
    EXPECT_EQ(
        vault.quote_redeem(ONE, TOKEN).assume_error(),
        VaultError::ZeroRedeemAmount);

    ASSERT_FALSE(vault.deposit(ALICE, TOKEN, 100 * ONE).has_error());
    EXPECT_EQ(
        vault.withdraw(ALICE, ONE, TOKEN).assume_error(),
        VaultError::UnsupportedWithdrawAsset);

    ASSERT_FALSE(vault.set_buffer_target(ADMIN, TOKEN, ONE).has_error());
    EXPECT_EQ(
        vault.withdraw(ALICE, 0, TOKEN).assume_error(), VaultError::ZeroAmount);
    EXPECT_EQ(
        vault.withdraw(ALICE, 101 * ONE, TOKEN).assume_error(),
        LedgerError::InsufficientBalance);
    EXPECT_EQ(
        vault.withdraw_request(ALICE, 0).assume_error(),
        VaultError::WithdrawRequestNotFound);
}

TEST_F(WithdrawalQueueTest, shortfall_needs_delegated_collateral)
{
    ASSERT_FALSE(vault.deposit(ALICE, TOKEN, 100 * ONE).has_error());
    ASSERT_FALSE(vault.set_buffer_target(ADMIN, NATIVE_ASSET, ONE).has_error());

    // nothing native is staked or staged
    EXPECT_EQ(
        vault.withdraw(ALICE, 10 * ONE, NATIVE_ASSET).assume_error(),
        VaultError::InsufficientCollateral);
    EXPECT_EQ(vault.share_balance(ALICE), 100 * ONE);
    EXPECT_EQ(vault.withdraw_request_count(ALICE), 0);
}

TEST_F(WithdrawalQueueTest, native_withdrawal)
{
    fund_native(ALICE, 50 * ONE);
    ASSERT_FALSE(vault.set_buffer_target(ADMIN, NATIVE_ASSET, 5 * ONE).has_error());
    ASSERT_FALSE(vault.deposit_native(ALICE, 40 * ONE).has_error());
    ASSERT_FALSE(vault.withdraw(ALICE, 8 * ONE, NATIVE_ASSET).has_error());

    // 5 reserved, 3 backed by the staging area
    EXPECT_EQ(vault.withdraw_deficit(NATIVE_ASSET), 3 * ONE);

    fund_native(ADMIN, 3 * ONE);
    ASSERT_FALSE(vault.fill_buffer(ADMIN, NATIVE_ASSET, 3 * ONE).has_error());
    advance(COOLDOWN);
    auto const paid = vault.claim(ALICE, 0, ALICE);
    ASSERT_FALSE(paid.has_error());
    EXPECT_EQ(paid.value(), 8 * ONE);
    EXPECT_EQ(state.get_balance(ALICE), 18 * ONE);
}

TEST_F(WithdrawalQueueTest, fill_buffer_checks)
{
    EXPECT_EQ(
        vault.fill_buffer(ALICE, TOKEN, ONE).assume_error(),
        VaultError::NotAuthorized);
    EXPECT_EQ(
        vault.fill_buffer(ADMIN, TOKEN, 0).assume_error(),
        VaultError::ZeroAmount);

    // nothing queued: the whole fill tops up the buffer
    auto const applied = vault.fill_buffer(ADMIN, TOKEN, ONE);
    ASSERT_FALSE(applied.has_error());
    EXPECT_EQ(applied.value(), 0);
    EXPECT_EQ(vault.available_to_withdraw(TOKEN), ONE);
}

TEST_F(WithdrawalQueueTest, buffer_target_checks)
{
    EXPECT_EQ(
        vault.set_buffer_target(ALICE, TOKEN, ONE).assume_error(),
        VaultError::NotAuthorized);
    EXPECT_EQ(
        vault.set_buffer_target(ADMIN, Address{}, ONE).assume_error(),
        VaultError::ZeroAddress);
    EXPECT_EQ(
        vault.set_buffer_target(ADMIN, BOB, ONE).assume_error(),
        VaultError::AssetNotFound);
    ASSERT_FALSE(vault.set_buffer_target(ADMIN, TOKEN, 7 * ONE).has_error());
    EXPECT_EQ(vault.buffer_target(TOKEN), 7 * ONE);

    EXPECT_EQ(
        vault.set_cooldown_period(ALICE, 1).assume_error(),
        VaultError::NotAuthorized);
}

TEST_F(WithdrawalQueueTest, pause)
{
    seed(10 * ONE, 10 * ONE);
    ASSERT_FALSE(vault.withdraw(ALICE, ONE, TOKEN).has_error());
    advance(COOLDOWN);

    ASSERT_FALSE(vault.pause(ADMIN, Component::WithdrawalQueue).has_error());
    EXPECT_EQ(vault.withdraw(ALICE, ONE, TOKEN).assume_error(), VaultError::Paused);
    EXPECT_EQ(vault.claim(ALICE, 0, ALICE).assume_error(), VaultError::Paused);
    ASSERT_FALSE(vault.unpause(ADMIN, Component::WithdrawalQueue).has_error());

    // the risk feed pauses claims alone
    env.risk.set_paused(PauseFlag::Claim, true);
    EXPECT_EQ(vault.claim(ALICE, 0, ALICE).assume_error(), VaultError::Paused);
    EXPECT_FALSE(vault.withdraw(ALICE, ONE, TOKEN).has_error());
    env.risk.set_paused(PauseFlag::Claim, false);
    EXPECT_FALSE(vault.claim(ALICE, 0, ALICE).has_error());
}

TEST_F(WithdrawalQueueTest, failed_claim_rolls_back)
{
    seed(10 * ONE, 10 * ONE);
    ASSERT_FALSE(vault.withdraw(ALICE, ONE, TOKEN).has_error());
    auto const logs = state.logs().size();

    // the price goes stale during the cooldown
    state.advance_time(COOLDOWN);
    EXPECT_EQ(
        vault.claim(ALICE, 0, ALICE).assume_error(), VaultError::OracleStale);

    EXPECT_EQ(vault.withdraw_request_count(ALICE), 1);
    EXPECT_EQ(vault.claim_reserve(TOKEN), ONE);
    EXPECT_EQ(vault.share_balance(WITHDRAW_QUEUE_CA), ONE);
    EXPECT_EQ(state.logs().size(), logs);
    EXPECT_FALSE(
        WithdrawalQueue(state, env.collaborators).vars.guard.locked());
}
