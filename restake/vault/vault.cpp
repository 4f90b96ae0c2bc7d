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
#include <restake/ledger/state.hpp>
#include <restake/ledger/token_ledger.hpp>
#include <restake/ledger/transact.hpp>
#include <restake/vault/price_oracle.hpp>
#include <restake/vault/schema.hpp>
#include <restake/vault/vault.hpp>

RESTAKE_VAULT_NAMESPACE_BEGIN

Vault::Vault(State &state, Collaborators const &collab)
    : state_{state}
    , collab_{collab}
{
}

////////////////
// Lifecycle //
////////////////

Result<void>
Vault::initialize(Address const &caller, ProtocolConfig const &config)
{
    return transact(state_, [&] {
        return vault::initialize(state_, collab_, caller, config);
    });
}

Result<uint64_t>
Vault::migrate(Address const &caller, Address const &fee_destination)
{
    return transact(state_, [&] {
        return vault::migrate(state_, collab_, caller, fee_destination);
    });
}

//////////////////
// Entry points //
//////////////////

Result<uint256_t> Vault::deposit(
    Address const &caller, Address const &asset, uint256_t const &amount,
    Address const &referral)
{
    return run([&] { return core().deposit(caller, asset, amount, referral); });
}

Result<uint256_t> Vault::deposit_native(
    Address const &caller, uint256_t const &value, Address const &referral)
{
    return run(
        [&] { return core().deposit_native(caller, value, referral); });
}

Result<uint64_t> Vault::withdraw(
    Address const &caller, uint256_t const &shares, Address const &asset)
{
    return run([&] { return queue().withdraw(caller, shares, asset); });
}

Result<uint256_t> Vault::claim(
    Address const &caller, uint64_t const request_index, Address const &user)
{
    return run([&] { return queue().claim(caller, request_index, user); });
}

Result<uint256_t> Vault::instant_withdraw(
    Address const &caller, uint256_t const &shares, Address const &asset,
    uint256_t const &min_out)
{
    return run(
        [&] { return instant().withdraw(caller, shares, asset, min_out); });
}

Result<uint256_t> Vault::fill_buffer(
    Address const &caller, Address const &asset, uint256_t const &amount)
{
    return run([&] { return queue().fill_buffer(caller, asset, amount); });
}

///////////
// Views //
///////////

Result<TotalValues> Vault::calculate_total_values()
{
    return core().calculate_total_values();
}

uint256_t Vault::available_to_withdraw(Address const &asset)
{
    return queue().available_to_withdraw(asset);
}

uint256_t Vault::withdraw_deficit(Address const &asset)
{
    return queue().withdraw_deficit(asset);
}

uint256_t Vault::buffer_deficit(Address const &asset)
{
    return queue().buffer_deficit(asset);
}

uint256_t Vault::buffer_target(Address const &asset)
{
    return queue().vars.buffer(asset).target().load().native();
}

uint256_t Vault::claim_reserve(Address const &asset)
{
    return queue().vars.buffer(asset).claim_reserve().load().native();
}

Result<uint256_t>
Vault::quote_redeem(uint256_t const &shares, Address const &asset)
{
    return queue().quote_redeem(shares, asset);
}

Result<InstantWithdrawer::Quote>
Vault::quote_instant_withdraw(uint256_t const &shares, Address const &asset)
{
    return instant().quote_fee(shares, asset);
}

Result<WithdrawalQueue::WithdrawRequest>
Vault::withdraw_request(Address const &user, uint64_t const index)
{
    return queue().withdraw_request(user, index);
}

uint64_t Vault::withdraw_request_count(Address const &user)
{
    return queue().withdraw_request_count(user);
}

uint256_t Vault::share_balance(Address const &owner)
{
    return TokenLedger{state_, SHARE_TOKEN_CA}.balance_of(owner);
}

uint256_t Vault::total_shares()
{
    return TokenLedger{state_, SHARE_TOKEN_CA}.total_supply();
}

uint64_t Vault::schema_version()
{
    return vault::schema_version(state_, collab_);
}

///////////
// Admin //
///////////

Result<void> Vault::set_oracle_address(
    Address const &caller, Address const &asset, Address const &feed)
{
    return run([&] {
        PriceOracle oracle{state_, collab_};
        return oracle.set_oracle_address(caller, asset, feed);
    });
}

Result<void> Vault::add_collateral_asset(
    Address const &caller, Address const &asset, uint256_t const &value_cap)
{
    return run(
        [&] { return core().add_collateral_asset(caller, asset, value_cap); });
}

Result<void> Vault::remove_collateral_asset(
    Address const &caller, Address const &asset)
{
    return run([&] { return core().remove_collateral_asset(caller, asset); });
}

Result<void> Vault::set_token_value_cap(
    Address const &caller, Address const &asset, uint256_t const &cap)
{
    return run([&] { return core().set_token_value_cap(caller, asset, cap); });
}

Result<void>
Vault::set_max_total_value(Address const &caller, uint256_t const &cap)
{
    return run([&] { return core().set_max_total_value(caller, cap); });
}

Result<void> Vault::add_operator_delegate(
    Address const &caller, Address const &delegate,
    uint64_t const allocation_bps)
{
    return run([&] {
        return core().add_operator_delegate(caller, delegate, allocation_bps);
    });
}

Result<void> Vault::remove_operator_delegate(
    Address const &caller, Address const &delegate)
{
    return run(
        [&] { return core().remove_operator_delegate(caller, delegate); });
}

Result<void> Vault::set_delegate_allocation(
    Address const &caller, Address const &delegate,
    uint64_t const allocation_bps)
{
    return run([&] {
        return core().set_delegate_allocation(caller, delegate, allocation_bps);
    });
}

Result<void> Vault::set_buffer_target(
    Address const &caller, Address const &asset, uint256_t const &target)
{
    return run(
        [&] { return queue().set_buffer_target(caller, asset, target); });
}

Result<void>
Vault::set_cooldown_period(Address const &caller, uint64_t const seconds)
{
    return run([&] { return queue().set_cooldown_period(caller, seconds); });
}

Result<void> Vault::set_instant_withdraw_config(
    Address const &caller, InstantWithdrawConfig const &config)
{
    return run([&] { return instant().set_config(caller, config); });
}

Result<void> Vault::stake_native_from_staging(
    Address const &caller, Address const &delegate)
{
    return run(
        [&] { return core().stake_native_from_staging(caller, delegate); });
}

Result<uint64_t> Vault::queue_delegate_withdrawal(
    Address const &caller, Address const &asset, uint256_t const &amount)
{
    return run([&] {
        return core().queue_delegate_withdrawal(caller, asset, amount);
    });
}

Result<uint256_t>
Vault::complete_delegate_withdrawal(Address const &caller, uint64_t const id)
{
    return run(
        [&] { return core().complete_delegate_withdrawal(caller, id); });
}

Result<void> Vault::pause(Address const &caller, Component const component)
{
    return run([&]() -> Result<void> {
        switch (component) {
        case Component::Accounting:
            return core().pause(caller);
        case Component::WithdrawalQueue:
            return queue().pause(caller);
        case Component::InstantWithdrawer:
            return instant().pause(caller);
        }
        RESTAKE_ABORT("unknown component");
    });
}

Result<void> Vault::unpause(Address const &caller, Component const component)
{
    return run([&]() -> Result<void> {
        switch (component) {
        case Component::Accounting:
            return core().unpause(caller);
        case Component::WithdrawalQueue:
            return queue().unpause(caller);
        case Component::InstantWithdrawer:
            return instant().unpause(caller);
        }
        RESTAKE_ABORT("unknown component");
    });
}

RESTAKE_VAULT_NAMESPACE_END
