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

#pragma once

#include <restake/core/address.hpp>
#include <restake/core/int.hpp>
#include <restake/core/result.hpp>
#include <restake/ledger/transact.hpp>
#include <restake/vault/accounting_core.hpp>
#include <restake/vault/config.hpp>
#include <restake/vault/instant_withdrawer.hpp>
#include <restake/vault/schema.hpp>
#include <restake/vault/util/collaborators.hpp>
#include <restake/vault/withdrawal_queue.hpp>

#include <boost/outcome/try.hpp>

#include <cstdint>
#include <functional>
#include <type_traits>

RESTAKE_NAMESPACE_BEGIN

class State;

RESTAKE_NAMESPACE_END

RESTAKE_VAULT_NAMESPACE_BEGIN

enum class Component : uint8_t
{
    Accounting = 0,
    WithdrawalQueue,
    InstantWithdrawer,
};

/// Host-facing entry points. Every mutating call runs in its own checkpoint
/// of the host ledger and is rejected as a whole when it fails. Calls other
/// than initialize and migrate require the store at the current schema
/// version.
class Vault
{
    State &state_;
    Collaborators const &collab_;

    template <typename F>
    auto run(F &&f) -> std::invoke_result_t<F>
    {
        return transact(state_, [&]() -> std::invoke_result_t<F> {
            BOOST_OUTCOME_TRY(require_current_schema(state_, collab_));
            return std::invoke(std::forward<F>(f));
        });
    }

    AccountingCore core()
    {
        return AccountingCore{state_, collab_};
    }

    WithdrawalQueue queue()
    {
        return WithdrawalQueue{state_, collab_};
    }

    InstantWithdrawer instant()
    {
        return InstantWithdrawer{state_, collab_};
    }

public:
    Vault(State &, Collaborators const &);

    State &state()
    {
        return state_;
    }

    ////////////////
    // Lifecycle //
    ////////////////

    Result<void>
    initialize(Address const &caller, ProtocolConfig const &config);
    Result<uint64_t>
    migrate(Address const &caller, Address const &fee_destination);

    //////////////////
    // Entry points //
    //////////////////

    Result<uint256_t> deposit(
        Address const &caller, Address const &asset, uint256_t const &amount,
        Address const &referral = {});
    Result<uint256_t> deposit_native(
        Address const &caller, uint256_t const &value,
        Address const &referral = {});
    Result<uint64_t> withdraw(
        Address const &caller, uint256_t const &shares, Address const &asset);
    Result<uint256_t>
    claim(Address const &caller, uint64_t request_index, Address const &user);
    Result<uint256_t> instant_withdraw(
        Address const &caller, uint256_t const &shares, Address const &asset,
        uint256_t const &min_out);
    Result<uint256_t> fill_buffer(
        Address const &caller, Address const &asset, uint256_t const &amount);

    ///////////
    // Views //
    ///////////

    Result<TotalValues> calculate_total_values();
    uint256_t available_to_withdraw(Address const &asset);
    uint256_t withdraw_deficit(Address const &asset);
    uint256_t buffer_deficit(Address const &asset);
    uint256_t buffer_target(Address const &asset);
    uint256_t claim_reserve(Address const &asset);
    Result<uint256_t>
    quote_redeem(uint256_t const &shares, Address const &asset);
    Result<InstantWithdrawer::Quote>
    quote_instant_withdraw(uint256_t const &shares, Address const &asset);
    Result<WithdrawalQueue::WithdrawRequest>
    withdraw_request(Address const &user, uint64_t index);
    uint64_t withdraw_request_count(Address const &user);
    uint256_t share_balance(Address const &owner);
    uint256_t total_shares();
    uint64_t schema_version();

    ///////////
    // Admin //
    ///////////

    Result<void> set_oracle_address(
        Address const &caller, Address const &asset, Address const &feed);
    Result<void> add_collateral_asset(
        Address const &caller, Address const &asset,
        uint256_t const &value_cap);
    Result<void>
    remove_collateral_asset(Address const &caller, Address const &asset);
    Result<void> set_token_value_cap(
        Address const &caller, Address const &asset, uint256_t const &cap);
    Result<void>
    set_max_total_value(Address const &caller, uint256_t const &cap);
    Result<void> add_operator_delegate(
        Address const &caller, Address const &delegate,
        uint64_t allocation_bps);
    Result<void>
    remove_operator_delegate(Address const &caller, Address const &delegate);
    Result<void> set_delegate_allocation(
        Address const &caller, Address const &delegate,
        uint64_t allocation_bps);
    Result<void> set_buffer_target(
        Address const &caller, Address const &asset, uint256_t const &target);
    Result<void> set_cooldown_period(Address const &caller, uint64_t seconds);
    Result<void> set_instant_withdraw_config(
        Address const &caller, InstantWithdrawConfig const &);
    Result<void>
    stake_native_from_staging(Address const &caller, Address const &delegate);
    Result<uint64_t> queue_delegate_withdrawal(
        Address const &caller, Address const &asset, uint256_t const &amount);
    Result<uint256_t>
    complete_delegate_withdrawal(Address const &caller, uint64_t id);
    Result<void> pause(Address const &caller, Component);
    Result<void> unpause(Address const &caller, Component);
};

RESTAKE_VAULT_NAMESPACE_END
