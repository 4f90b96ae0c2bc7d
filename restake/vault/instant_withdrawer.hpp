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

#include <cstdint>

RESTAKE_NAMESPACE_BEGIN

class State;

RESTAKE_NAMESPACE_END

RESTAKE_VAULT_NAMESPACE_BEGIN

struct InstantWithdrawConfig
{
    // floor under the available balance, in bps of the buffer target
    u64_be drawdown_bps;
    u64_be min_fee_bps;
    u64_be max_fee_bps;
    Address fee_destination;
};

static_assert(sizeof(InstantWithdrawConfig) == 44);
static_assert(alignof(InstantWithdrawConfig) == 1);

/// Cooldown-free exit through the withdrawal queue. The fee rises linearly
/// from `min_fee_bps` at a full buffer to `max_fee_bps` at the drawdown
/// floor, and withdrawals that would dig below the floor are refused.
class InstantWithdrawer
{
    State &state_;
    Collaborators const &collab_;

public:
    InstantWithdrawer(State &, Collaborators const &);

    struct Quote
    {
        uint256_t amount;
        uint64_t fee_bps;
        uint256_t fee;
        uint256_t net;
    };

    /////////////////////////////
    // Instant Withdrawer Storage Variables
    /////////////////////////////
    class Variables
    {
        State &state_;

        // Single slot constants all under namespace 0x0
        static constexpr auto AddressPaused{
            0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};
        static constexpr auto AddressLock{
            0x0000000000000000000000000000000000000000000000000000000000000002_bytes32};
        static constexpr auto AddressConfig{
            0x0000000000000000000000000000000000000000000000000000000000000003_bytes32};

    public:
        explicit Variables(State &state)
            : state_{state}
        {
        }

        StorageVariable<bool> paused{
            state_, INSTANT_WITHDRAWER_CA, AddressPaused};

        ReentrancyGuard guard{state_, INSTANT_WITHDRAWER_CA, AddressLock};

        // Written by initialize, or by the v1 -> v2 migration
        StorageVariable<InstantWithdrawConfig> config{
            state_, INSTANT_WITHDRAWER_CA, AddressConfig};
    } vars;

    // Fee for leaving `after` available, with the buffer's target and floor
    static uint64_t fee_bps(
        uint256_t const &target, uint256_t const &floor,
        uint256_t const &after, uint64_t min_fee_bps, uint64_t max_fee_bps);

    static Result<void> validate(InstantWithdrawConfig const &);

    bool is_paused() const;

    Result<InstantWithdrawConfig> config() const;

    // Prices an instant exit of `shares` into `asset` without executing it
    Result<Quote> quote_fee(uint256_t const &shares, Address const &asset);

    // Returns the net amount paid to `caller`
    Result<uint256_t> withdraw(
        Address const &caller, uint256_t const &shares, Address const &asset,
        uint256_t const &min_out);

    Result<void>
    set_config(Address const &caller, InstantWithdrawConfig const &);
    Result<void> pause(Address const &caller);
    Result<void> unpause(Address const &caller);

private:
    // event InstantWithdraw(
    //     address indexed user,
    //     address indexed asset,
    //     uint256         shares,
    //     uint256         amount,
    //     uint256         fee);
    void emit_instant_withdraw_event(
        Address const &user, Address const &asset, uint256_t const &shares,
        uint256_t const &amount, uint256_t const &fee);
};

RESTAKE_VAULT_NAMESPACE_END
