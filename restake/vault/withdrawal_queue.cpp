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

#include <restake/core/assert.h>
#include <restake/core/fmt/address_fmt.hpp> // NOLINT
#include <restake/core/fmt/int_fmt.hpp> // NOLINT
#include <restake/core/likely.h>
#include <restake/ledger/abi_encode.hpp>
#include <restake/ledger/abi_signatures.hpp>
#include <restake/ledger/asset.hpp>
#include <restake/ledger/checked_math.hpp>
#include <restake/ledger/events.hpp>
#include <restake/ledger/state.hpp>
#include <restake/ledger/token_ledger.hpp>
#include <restake/vault/accounting_core.hpp>
#include <restake/vault/price_oracle.hpp>
#include <restake/vault/util/vault_error.hpp>
#include <restake/vault/withdrawal_queue.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>

RESTAKE_VAULT_NAMESPACE_BEGIN

WithdrawalQueue::WithdrawalQueue(State &state, Collaborators const &collab)
    : state_{state}
    , collab_{collab}
    , vars{state}
{
}

///////////
// Views //
///////////

bool WithdrawalQueue::is_paused(PauseFlag const flag) const
{
    return vars.paused.load() || collab_.risk.is_paused(flag);
}

uint256_t WithdrawalQueue::held(Address const &asset) const
{
    return asset_balance(state_, asset, WITHDRAW_QUEUE_CA);
}

uint256_t WithdrawalQueue::available_to_withdraw(Address const &asset)
{
    auto const reserve = vars.buffer(asset).claim_reserve().load().native();
    auto const balance = held(asset);
    RESTAKE_ASSERT(reserve <= balance, "claim reserve exceeds held balance");
    return balance - reserve;
}

uint256_t WithdrawalQueue::withdraw_deficit(Address const &asset)
{
    return vars.buffer(asset).queue_deficit();
}

uint256_t WithdrawalQueue::buffer_deficit(Address const &asset)
{
    auto const target = vars.buffer(asset).target().load().native();
    auto const available = available_to_withdraw(asset);
    auto const to_target =
        target > available ? target - available : uint256_t{0};
    return withdraw_deficit(asset) + to_target;
}

Result<uint256_t> WithdrawalQueue::quote_redeem(
    uint256_t const &shares, Address const &asset)
{
    TokenLedger const share_token{state_, SHARE_TOKEN_CA};
    auto const supply = share_token.total_supply();
    if (RESTAKE_UNLIKELY(shares == 0 || supply == 0)) {
        return VaultError::ZeroRedeemAmount;
    }

    AccountingCore core{state_, collab_};
    BOOST_OUTCOME_TRY(auto const totals, core.calculate_total_values());
    BOOST_OUTCOME_TRY(
        auto const value,
        PriceOracle::calculate_redeem_amount(
            shares, supply, totals.grand_total));

    PriceOracle const oracle{state_, collab_};
    BOOST_OUTCOME_TRY(
        auto const amount, oracle.lookup_amount_from_value(asset, value));
    if (RESTAKE_UNLIKELY(amount == 0)) {
        return VaultError::ZeroRedeemAmount;
    }
    return amount;
}

Result<WithdrawalQueue::WithdrawRequest>
WithdrawalQueue::withdraw_request(Address const &user, uint64_t const index)
{
    auto const requests = vars.requests(user);
    if (RESTAKE_UNLIKELY(index >= requests.length())) {
        return VaultError::WithdrawRequestNotFound;
    }
    return requests.get(index).load();
}

uint64_t WithdrawalQueue::withdraw_request_count(Address const &user)
{
    return vars.requests(user).length();
}

uint64_t WithdrawalQueue::effective_cooldown()
{
    return std::max(
        vars.cooldown_period.load().native(),
        collab_.risk.cooldown_override());
}

//////////////////
// Entry points //
//////////////////

Result<uint64_t> WithdrawalQueue::withdraw(
    Address const &caller, uint256_t const &shares, Address const &asset)
{
    if (RESTAKE_UNLIKELY(is_paused(PauseFlag::Withdraw))) {
        return VaultError::Paused;
    }
    if (RESTAKE_UNLIKELY(shares == 0)) {
        return VaultError::ZeroAmount;
    }
    auto buffer = vars.buffer(asset);
    if (RESTAKE_UNLIKELY(buffer.target().load().native() == 0)) {
        return VaultError::UnsupportedWithdrawAsset;
    }
    BOOST_OUTCOME_TRY(auto const lock, vars.guard.acquire());

    BOOST_OUTCOME_TRY(auto const amount, quote_redeem(shares, asset));

    // custody until claim, burned there
    TokenLedger share_token{state_, SHARE_TOKEN_CA};
    BOOST_OUTCOME_TRY(share_token.transfer(caller, WITHDRAW_QUEUE_CA, shares));

    auto const id = vars.last_request_id.load().native() + 1;
    vars.last_request_id.store(id);

    WithdrawRequest request{
        .id = id,
        .asset = asset,
        .queued = false,
        .created_at = state_.timestamp(),
        .shares = shares,
        .amount = amount,
        .reserved = amount,
        .fill_at = uint256_t{0}};

    auto const available = available_to_withdraw(asset);
    auto claim_reserve = buffer.claim_reserve();
    if (amount <= available) {
        claim_reserve.store(claim_reserve.load().native() + amount);
    }
    else {
        auto const shortfall = amount - available;
        BOOST_OUTCOME_TRY(
            auto const outstanding,
            checked_add(withdraw_deficit(asset), shortfall));
        AccountingCore core{state_, collab_};
        if (RESTAKE_UNLIKELY(outstanding > core.delegated_balance(asset))) {
            return VaultError::InsufficientCollateral;
        }

        auto queue_to_fill = buffer.queue_to_fill();
        auto const fill_at = queue_to_fill.load().native() + shortfall;
        queue_to_fill.store(fill_at);
        claim_reserve.store(claim_reserve.load().native() + available);

        request.queued = true;
        request.reserved = available;
        request.fill_at = fill_at;
    }

    auto requests = vars.requests(caller);
    auto const index = requests.length();
    requests.push(request);

    emit_withdraw_requested_event(caller, request);
    return index;
}

Result<uint256_t> WithdrawalQueue::claim(
    Address const &caller, uint64_t const request_index, Address const &user)
{
    if (RESTAKE_UNLIKELY(is_paused(PauseFlag::Claim))) {
        return VaultError::Paused;
    }
    BOOST_OUTCOME_TRY(auto const lock, vars.guard.acquire());

    auto requests = vars.requests(user);
    if (RESTAKE_UNLIKELY(request_index >= requests.length())) {
        return VaultError::WithdrawRequestNotFound;
    }
    auto const request = requests.get(request_index).load();

    if (!collab_.access.has_role(caller, Role::InstantWithdrawer)) {
        uint256_t const unlock_at =
            uint256_t{request.created_at.native()} + effective_cooldown();
        if (RESTAKE_UNLIKELY(uint256_t{state_.timestamp()} < unlock_at)) {
            LOG_DEBUG(
                "claim of request {} by {} rejected: unlocks at {}",
                request.id.native(),
                user,
                unlock_at);
            return VaultError::EarlyClaim;
        }
    }

    auto buffer = vars.buffer(request.asset);
    if (request.queued &&
        request.fill_at.native() > buffer.queue_filled().load().native()) {
        LOG_DEBUG(
            "claim of request {} by {} rejected: queue filled to {}, needs {}",
            request.id.native(),
            user,
            buffer.queue_filled().load().native(),
            request.fill_at.native());
        return VaultError::QueuedWithdrawalNotFilled;
    }

    // a NAV drop since the request lowers the payout, a rise does not
    // raise it
    auto const shares = request.shares.native();
    TokenLedger share_token{state_, SHARE_TOKEN_CA};
    AccountingCore core{state_, collab_};
    BOOST_OUTCOME_TRY(auto const totals, core.calculate_total_values());
    BOOST_OUTCOME_TRY(
        auto const value,
        checked_mul_div(totals.grand_total, shares, share_token.total_supply()));
    PriceOracle const oracle{state_, collab_};
    BOOST_OUTCOME_TRY(
        auto const recomputed,
        oracle.lookup_amount_from_value(request.asset, value));
    auto const amount = request.amount.native();
    auto const paid = std::min(amount, recomputed);

    // the whole reservation is released, any surplus returns to the
    // available balance
    auto claim_reserve = buffer.claim_reserve();
    RESTAKE_ASSERT(claim_reserve.load().native() >= amount);
    claim_reserve.store(claim_reserve.load().native() - amount);

    (void)requests.swap_remove(request_index);
    BOOST_OUTCOME_TRY(share_token.burn(WITHDRAW_QUEUE_CA, shares));

    PendingPayout const payout{
        .recipient = user, .asset = request.asset, .amount = paid};
    emit_claimed_event(user, request.asset, request.id, paid);

    BOOST_OUTCOME_TRY(execute(payout));
    return paid;
}

Result<uint256_t> WithdrawalQueue::fill_buffer(
    Address const &caller, Address const &asset, uint256_t const &amount)
{
    if (RESTAKE_UNLIKELY(!collab_.access.has_role(caller, Role::DepositFlow))) {
        return VaultError::NotAuthorized;
    }
    if (RESTAKE_UNLIKELY(amount == 0)) {
        return VaultError::ZeroAmount;
    }
    BOOST_OUTCOME_TRY(auto const lock, vars.guard.acquire());
    return absorb_fill(caller, asset, amount);
}

Result<uint256_t> WithdrawalQueue::receive_fill(
    Address const &from, Address const &asset, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(auto const lock, vars.guard.acquire());
    return absorb_fill(from, asset, amount);
}

Result<uint256_t> WithdrawalQueue::absorb_fill(
    Address const &from, Address const &asset, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(
        transfer_asset(state_, asset, from, WITHDRAW_QUEUE_CA, amount));

    auto buffer = vars.buffer(asset);
    auto const applied = std::min(amount, buffer.queue_deficit());
    if (applied != 0) {
        auto queue_filled = buffer.queue_filled();
        queue_filled.store(queue_filled.load().native() + applied);
        auto claim_reserve = buffer.claim_reserve();
        claim_reserve.store(claim_reserve.load().native() + applied);
    }

    emit_buffer_filled_event(asset, amount, applied);
    LOG_INFO(
        "buffer of asset {} filled with {} from {}, {} applied to the queue",
        asset,
        amount,
        from,
        applied);
    return applied;
}

Result<void> WithdrawalQueue::execute(PendingPayout const &payout)
{
    return transfer_asset(
        state_, payout.asset, WITHDRAW_QUEUE_CA, payout.recipient, payout.amount);
}

///////////
// Admin //
///////////

Result<void> WithdrawalQueue::set_buffer_target(
    Address const &caller, Address const &asset, uint256_t const &target)
{
    if (RESTAKE_UNLIKELY(
            !collab_.access.has_role(caller, Role::WithdrawQueueAdmin))) {
        return VaultError::NotAuthorized;
    }
    if (RESTAKE_UNLIKELY(asset == Address{})) {
        return VaultError::ZeroAddress;
    }
    AccountingCore const core{state_, collab_};
    if (RESTAKE_UNLIKELY(!is_native(asset) && !core.vars.assets.contains(asset))) {
        return VaultError::AssetNotFound;
    }
    vars.buffer(asset).target().store(target);
    LOG_INFO("buffer target of asset {} set to {}", asset, target);
    return outcome::success();
}

Result<void> WithdrawalQueue::set_cooldown_period(
    Address const &caller, uint64_t const seconds)
{
    if (RESTAKE_UNLIKELY(
            !collab_.access.has_role(caller, Role::WithdrawQueueAdmin))) {
        return VaultError::NotAuthorized;
    }
    vars.cooldown_period.store(seconds);
    LOG_INFO("claim cooldown set to {}s", seconds);
    return outcome::success();
}

Result<void> WithdrawalQueue::pause(Address const &caller)
{
    if (RESTAKE_UNLIKELY(!collab_.access.has_role(caller, Role::Pauser))) {
        return VaultError::NotAuthorized;
    }
    vars.paused.store(true);
    LOG_INFO("withdrawals paused by {}", caller);
    return outcome::success();
}

Result<void> WithdrawalQueue::unpause(Address const &caller)
{
    if (RESTAKE_UNLIKELY(!collab_.access.has_role(caller, Role::Pauser))) {
        return VaultError::NotAuthorized;
    }
    vars.paused.clear();
    LOG_INFO("withdrawals unpaused by {}", caller);
    return outcome::success();
}

/////////////
// Events //
/////////////

void WithdrawalQueue::emit_withdraw_requested_event(
    Address const &user, WithdrawRequest const &request)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "WithdrawRequested(address,address,uint64,uint256,uint256,bool)");

    auto const event = EventBuilder(WITHDRAW_QUEUE_CA, signature)
                           .add_topic(abi_encode_address(user))
                           .add_topic(abi_encode_address(request.asset))
                           .add_data(abi_encode_uint(request.id))
                           .add_data(abi_encode_uint(request.shares))
                           .add_data(abi_encode_uint(request.amount))
                           .add_data(abi_encode_bool(request.queued))
                           .build();
    state_.store_log(event);
}

void WithdrawalQueue::emit_claimed_event(
    Address const &user, Address const &asset, u64_be const id,
    uint256_t const &amount)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("Claimed(address,address,uint64,uint256)");

    auto const event = EventBuilder(WITHDRAW_QUEUE_CA, signature)
                           .add_topic(abi_encode_address(user))
                           .add_topic(abi_encode_address(asset))
                           .add_data(abi_encode_uint(id))
                           .add_data(abi_encode_uint(u256_be{amount}))
                           .build();
    state_.store_log(event);
}

void WithdrawalQueue::emit_buffer_filled_event(
    Address const &asset, uint256_t const &amount, uint256_t const &applied)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("BufferFilled(address,uint256,uint256)");

    auto const event = EventBuilder(WITHDRAW_QUEUE_CA, signature)
                           .add_topic(abi_encode_address(asset))
                           .add_data(abi_encode_uint(u256_be{amount}))
                           .add_data(abi_encode_uint(u256_be{applied}))
                           .build();
    state_.store_log(event);
}

RESTAKE_VAULT_NAMESPACE_END
