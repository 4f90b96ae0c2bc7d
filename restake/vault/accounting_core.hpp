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
#include <restake/core/bytes.hpp>
#include <restake/core/int.hpp>
#include <restake/core/result.hpp>
#include <restake/ledger/big_endian.hpp>
#include <restake/ledger/storage_variable.hpp>
#include <restake/vault/config.hpp>
#include <restake/vault/util/collaborators.hpp>
#include <restake/vault/util/constants.hpp>
#include <restake/vault/util/reentrancy_guard.hpp>
#include <restake/vault/util/registry.hpp>

#include <bit>
#include <cstddef>
#include <cstdint>
#include <vector>

RESTAKE_NAMESPACE_BEGIN

class State;

RESTAKE_NAMESPACE_END

RESTAKE_VAULT_NAMESPACE_BEGIN

/// Values of every operator delegate, priced in the native currency.
/// `per_delegate_per_asset[d]` has one column per registered collateral
/// asset in registry order, followed by a last column for native stake.
struct TotalValues
{
    std::vector<std::vector<uint256_t>> per_delegate_per_asset;
    std::vector<uint256_t> per_delegate_total;
    uint256_t grand_total;
};

class AccountingCore
{
    State &state_;
    Collaborators const &collab_;

public:
    AccountingCore(State &, Collaborators const &);

    // A pool withdrawal started by the accounting core to refill the buffer
    struct PendingDelegateWithdrawal
    {
        Address delegate;
        Address asset;
        u64_be adapter_request_id;
        u256_be amount;
    };

    static_assert(sizeof(PendingDelegateWithdrawal) == 80);
    static_assert(alignof(PendingDelegateWithdrawal) == 1);

    /////////////////////////////
    // Accounting Storage Variables
    /////////////////////////////
    class Variables
    {
        State &state_;

        // Single slot constants all under namespace 0x0
        static constexpr auto AddressSchemaVersion{
            0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};
        static constexpr auto AddressPaused{
            0x0000000000000000000000000000000000000000000000000000000000000002_bytes32};
        static constexpr auto AddressMaxTotalValue{
            0x0000000000000000000000000000000000000000000000000000000000000003_bytes32};
        static constexpr auto AddressLock{
            0x0000000000000000000000000000000000000000000000000000000000000004_bytes32};
        static constexpr auto AddressLastDelegateWithdrawalId{
            0x0000000000000000000000000000000000000000000000000000000000000005_bytes32};

        // Registry lists get namespaces 0x1 and 0x3
        static constexpr auto AddressAssetList{
            0x0100000000000000000000000000000000000000000000000000000000000000_bytes32};
        static constexpr auto AddressDelegateList{
            0x0300000000000000000000000000000000000000000000000000000000000000_bytes32};

        enum Namespace : uint8_t
        {
            NSAssetIndex = 0x02,
            NSDelegateIndex = 0x04,
            NSTokenValueCap = 0x05,
            NSAllocation = 0x06,
            NSDelegateWithdrawal = 0x07,
        };

        template <typename T>
        StorageVariable<T> address_keyed(uint8_t const ns, Address const &a)
        {
            struct
            {
                uint8_t ns;
                Address address;
                uint8_t slots[11];
            } key{.ns = ns, .address = a, .slots = {}};

            return {state_, ACCOUNTING_CA, std::bit_cast<bytes32_t>(key)};
        }

    public:
        explicit Variables(State &state)
            : state_{state}
        {
        }

        // Layout version of every component's storage
        StorageVariable<u64_be> schema_version{
            state_, ACCOUNTING_CA, AddressSchemaVersion};

        StorageVariable<bool> paused{state_, ACCOUNTING_CA, AddressPaused};

        // Cap on the total value; zero disables it
        StorageVariable<u256_be> max_total_value{
            state_, ACCOUNTING_CA, AddressMaxTotalValue};

        ReentrancyGuard guard{state_, ACCOUNTING_CA, AddressLock};

        StorageVariable<u64_be> last_delegate_withdrawal_id{
            state_, ACCOUNTING_CA, AddressLastDelegateWithdrawalId};

        // Collateral assets, native excluded
        AddressRegistry assets{
            state_, ACCOUNTING_CA, AddressAssetList, NSAssetIndex};

        AddressRegistry delegates{
            state_, ACCOUNTING_CA, AddressDelegateList, NSDelegateIndex};

        // mapping (address => uint256) token_value_cap
        StorageVariable<u256_be> token_value_cap(Address const &asset)
        {
            return address_keyed<u256_be>(NSTokenValueCap, asset);
        }

        // mapping (address => uint64) allocation_bps
        StorageVariable<u64_be> allocation_bps(Address const &delegate)
        {
            return address_keyed<u64_be>(NSAllocation, delegate);
        }

        // mapping (uint64 => PendingDelegateWithdrawal)
        StorageVariable<PendingDelegateWithdrawal>
        delegate_withdrawal(u64_be const id)
        {
            struct
            {
                uint8_t ns;
                u64_be id;
                uint8_t slots[23];
            } key{.ns = NSDelegateWithdrawal, .id = id, .slots = {}};

            return {state_, ACCOUNTING_CA, std::bit_cast<bytes32_t>(key)};
        }
    } vars;

    ///////////
    // Views //
    ///////////

    bool is_paused() const;

    // Column of `asset` in TotalValues, native being the last one
    Result<size_t> asset_column(Address const &asset);

    Result<TotalValues> calculate_total_values();

    // Value held outside the operator pools: native staging and the
    // withdrawal queue's balances
    Result<uint256_t> undeployed_value();

    // Sum over all pools of their balance of `asset`, plus the staging area
    // for native
    uint256_t delegated_balance(Address const &asset);

    Result<PendingDelegateWithdrawal> pending_delegate_withdrawal(uint64_t id);

    ////////////////////////
    // Delegate selection //
    ////////////////////////

    Result<size_t> choose_delegate_for_deposit(
        std::vector<uint256_t> const &per_delegate_total,
        uint256_t const &grand_total);

    Result<size_t> choose_delegate_for_withdraw(
        size_t asset_column, uint256_t const &value,
        std::vector<std::vector<uint256_t>> const &per_delegate_per_asset,
        std::vector<uint256_t> const &per_delegate_total,
        uint256_t const &grand_total);

    //////////////
    // Deposits //
    //////////////

    // Returns the shares minted to `caller`
    Result<uint256_t> deposit(
        Address const &caller, Address const &asset, uint256_t const &amount,
        Address const &referral);

    Result<uint256_t> deposit_native(
        Address const &caller, uint256_t const &value,
        Address const &referral);

    ///////////
    // Admin //
    ///////////

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
    Result<void> pause(Address const &caller);
    Result<void> unpause(Address const &caller);

    // Moves one validator deposit from the staging area into `delegate`
    Result<void>
    stake_native_from_staging(Address const &caller, Address const &delegate);

    // Returns the id of the pending delegate withdrawal
    Result<uint64_t> queue_delegate_withdrawal(
        Address const &caller, Address const &asset, uint256_t const &amount);

    // Returns the amount received from the pool
    Result<uint256_t>
    complete_delegate_withdrawal(Address const &caller, uint64_t id);

private:
    Result<void> require_role(Address const &caller, Role) const;

    Result<OperatorPool *> pool_of(Address const &delegate);

    // Sends what the withdrawal buffer is missing to the withdrawal queue,
    // returns what was sent
    Result<uint256_t>
    route_to_buffer(Address const &asset, uint256_t const &amount);

    Result<void> deposit_into_delegate(
        Address const &delegate, Address const &asset,
        uint256_t const &amount);

    /////////////
    // Events //
    /////////////

    // event Deposit(
    //     address indexed depositor,
    //     address indexed asset,
    //     uint256         amount,
    //     uint256         shares,
    //     address         referral);
    void emit_deposit_event(
        Address const &depositor, Address const &asset,
        uint256_t const &amount, uint256_t const &shares,
        Address const &referral);
};

RESTAKE_VAULT_NAMESPACE_END
