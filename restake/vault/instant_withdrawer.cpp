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
#include <restake/vault/instant_withdrawer.hpp>
#include <restake/vault/util/vault_error.hpp>
#include <restake/vault/withdrawal_queue.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>

RESTAKE_VAULT_NAMESPACE_BEGIN

InstantWithdrawer::InstantWithdrawer(
    State &state, Collaborators const &collab)
    : state_{state}
    , collab_{collab}
    , vars{state}
{
}

uint64_t InstantWithdrawer::fee_bps(
    uint256_t const &target, uint256_t const &floor, uint256_t const &after,
    uint64_t const min_fee_bps, uint64_t const max_fee_bps)
{
    if (target <= floor) {
        return max_fee_bps;
    }
    auto const span = target - floor;
    auto const remaining = std::min(after - floor, span);
    // (max - min) <= 10000 and remaining <= span, so no overflow and the
    // discount is at most max - min
    auto const discount =
        uint256_t{max_fee_bps - min_fee_bps} * remaining / span;
    return max_fee_bps - static_cast<uint64_t>(discount);
}

Result<void> InstantWithdrawer::validate(InstantWithdrawConfig const &config)
{
    auto const drawdown = config.drawdown_bps.native();
    auto const min_fee = config.min_fee_bps.native();
    auto const max_fee = config.max_fee_bps.native();
    if (RESTAKE_UNLIKELY(
            drawdown > BASIS_POINTS || max_fee > BASIS_POINTS ||
            min_fee > max_fee)) {
        return VaultError::InvalidBasisPoints;
    }
    if (RESTAKE_UNLIKELY(config.fee_destination == Address{})) {
        return VaultError::ZeroAddress;
    }
    return outcome::success();
}

bool InstantWithdrawer::is_paused() const
{
    return vars.paused.load() ||
           collab_.risk.is_paused(PauseFlag::InstantWithdraw);
}

Result<InstantWithdrawConfig> InstantWithdrawer::config() const
{
    auto const config = vars.config.load_checked();
    if (RESTAKE_UNLIKELY(!config.has_value())) {
        return VaultError::NotInitialized;
    }
    return config.value();
}

Result<InstantWithdrawer::Quote> InstantWithdrawer::quote_fee(
    uint256_t const &shares, Address const &asset)
{
    BOOST_OUTCOME_TRY(auto const cfg, config());

    WithdrawalQueue queue{state_, collab_};
    BOOST_OUTCOME_TRY(auto const amount, queue.quote_redeem(shares, asset));

    auto const available = queue.available_to_withdraw(asset);
    if (RESTAKE_UNLIKELY(amount > available)) {
        return VaultError::InsufficientBuffer;
    }
    auto const target = queue.vars.buffer(asset).target().load().native();
    BOOST_OUTCOME_TRY(
        auto const floor,
        checked_mul_div(target, cfg.drawdown_bps.native(), BASIS_POINTS));
    auto const after = available - amount;
    if (RESTAKE_UNLIKELY(after < floor)) {
        return VaultError::BelowDrawdownFloor;
    }

    Quote quote{.amount = amount, .fee_bps = 0, .fee = 0, .net = 0};
    quote.fee_bps = fee_bps(
        target,
        floor,
        after,
        cfg.min_fee_bps.native(),
        cfg.max_fee_bps.native());
    BOOST_OUTCOME_TRY(
        quote.fee, checked_mul_div(amount, quote.fee_bps, BASIS_POINTS));
    quote.net = amount - quote.fee;
    return quote;
}

Result<uint256_t> InstantWithdrawer::withdraw(
    Address const &caller, uint256_t const &shares, Address const &asset,
    uint256_t const &min_out)
{
    if (RESTAKE_UNLIKELY(is_paused())) {
        return VaultError::Paused;
    }
    if (RESTAKE_UNLIKELY(shares == 0)) {
        return VaultError::ZeroAmount;
    }
    BOOST_OUTCOME_TRY(auto const lock, vars.guard.acquire());

    BOOST_OUTCOME_TRY(auto const cfg, config());
    BOOST_OUTCOME_TRY(auto const quote, quote_fee(shares, asset));

    TokenLedger share_token{state_, SHARE_TOKEN_CA};
    BOOST_OUTCOME_TRY(
        share_token.transfer(caller, INSTANT_WITHDRAWER_CA, shares));

    // the request is fully reserved, so the claim pays out immediately; the
    // withdrawer's role lifts the cooldown
    WithdrawalQueue queue{state_, collab_};
    BOOST_OUTCOME_TRY(
        auto const index, queue.withdraw(INSTANT_WITHDRAWER_CA, shares, asset));
    BOOST_OUTCOME_TRY(
        auto const paid,
        queue.claim(INSTANT_WITHDRAWER_CA, index, INSTANT_WITHDRAWER_CA));

    BOOST_OUTCOME_TRY(
        auto const fee, checked_mul_div(paid, quote.fee_bps, BASIS_POINTS));
    auto const net = paid - fee;
    if (RESTAKE_UNLIKELY(net < min_out)) {
        LOG_DEBUG(
            "instant withdraw by {} rejected: net {} below minimum {}",
            caller,
            net,
            min_out);
        return VaultError::MinOutNotMet;
    }

    if (fee != 0) {
        BOOST_OUTCOME_TRY(transfer_asset(
            state_, asset, INSTANT_WITHDRAWER_CA, cfg.fee_destination, fee));
    }
    BOOST_OUTCOME_TRY(
        transfer_asset(state_, asset, INSTANT_WITHDRAWER_CA, caller, net));

    emit_instant_withdraw_event(caller, asset, shares, net, fee);
    return net;
}

Result<void> InstantWithdrawer::set_config(
    Address const &caller, InstantWithdrawConfig const &config)
{
    if (RESTAKE_UNLIKELY(!collab_.access.has_role(caller, Role::Admin))) {
        return VaultError::NotAuthorized;
    }
    BOOST_OUTCOME_TRY(validate(config));
    vars.config.store(config);
    LOG_INFO(
        "instant withdraw config set: drawdown {} bps, fee {}-{} bps, fees "
        "to {}",
        config.drawdown_bps.native(),
        config.min_fee_bps.native(),
        config.max_fee_bps.native(),
        config.fee_destination);
    return outcome::success();
}

Result<void> InstantWithdrawer::pause(Address const &caller)
{
    if (RESTAKE_UNLIKELY(!collab_.access.has_role(caller, Role::Pauser))) {
        return VaultError::NotAuthorized;
    }
    vars.paused.store(true);
    LOG_INFO("instant withdrawals paused by {}", caller);
    return outcome::success();
}

Result<void> InstantWithdrawer::unpause(Address const &caller)
{
    if (RESTAKE_UNLIKELY(!collab_.access.has_role(caller, Role::Pauser))) {
        return VaultError::NotAuthorized;
    }
    vars.paused.clear();
    LOG_INFO("instant withdrawals unpaused by {}", caller);
    return outcome::success();
}

void InstantWithdrawer::emit_instant_withdraw_event(
    Address const &user, Address const &asset, uint256_t const &shares,
    uint256_t const &amount, uint256_t const &fee)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "InstantWithdraw(address,address,uint256,uint256,uint256)");

    auto const event = EventBuilder(INSTANT_WITHDRAWER_CA, signature)
                           .add_topic(abi_encode_address(user))
                           .add_topic(abi_encode_address(asset))
                           .add_data(abi_encode_uint(u256_be{shares}))
                           .add_data(abi_encode_uint(u256_be{amount}))
                           .add_data(abi_encode_uint(u256_be{fee}))
                           .build();
    state_.store_log(event);
}

RESTAKE_VAULT_NAMESPACE_END
