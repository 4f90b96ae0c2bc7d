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
#include <restake/ledger/storage_array.hpp>
#include <restake/ledger/storage_variable.hpp>
#include <restake/vault/config.hpp>
#include <restake/vault/util/buffer.hpp>
#include <restake/vault/util/collaborators.hpp>
#include <restake/vault/util/constants.hpp>
#include <restake/vault/util/reentrancy_guard.hpp>

#include <bit>
#include <cstdint>

RESTAKE_NAMESPACE_BEGIN

class State;

RESTAKE_NAMESPACE_END

RESTAKE_VAULT_NAMESPACE_BEGIN

/// Share redemptions against the per-asset withdrawal buffer. A request
/// locks the caller's shares, reserves what the buffer can pay now and
/// queues the rest. Queued shortfalls are funded in aggregate by refills;
/// a request is payable once `queue_filled` has reached its `fill_at`.
class WithdrawalQueue
{
    State &state_;
    Collaborators const &collab_;

public:
    WithdrawalQueue(State &, Collaborators const &);

    struct WithdrawRequest
    {
        u64_be id;
        Address asset;
        bool queued;
        u64_be created_at;
        // locked in the queue's custody until claim
        u256_be shares;
        // redeem amount at request time
        u256_be amount;
        // part of `amount` taken from the available buffer at request time
        u256_be reserved;
        // queue_to_fill watermark; zero when not queued
        u256_be fill_at;
    };

    static_assert(sizeof(WithdrawRequest) == 165);
    static_assert(alignof(WithdrawRequest) == 1);

    // Frozen result of a claim. All bookkeeping is done by the time one
    // exists; executing it is the only external interaction left.
    struct PendingPayout
    {
        Address const recipient;
        Address const asset;
        uint256_t const amount;
    };

    /////////////////////////////
    // Withdrawal Queue Storage Variables
    /////////////////////////////
    class Variables
    {
        State &state_;

        // Single slot constants all under namespace 0x0
        static constexpr auto AddressPaused{
            0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};
        static constexpr auto AddressLock{
            0x0000000000000000000000000000000000000000000000000000000000000002_bytes32};
        static constexpr auto AddressCooldownPeriod{
            0x0000000000000000000000000000000000000000000000000000000000000003_bytes32};
        static constexpr auto AddressLastRequestId{
            0x0000000000000000000000000000000000000000000000000000000000000004_bytes32};

        enum Namespace : uint8_t
        {
            NSBuffer = 0x01,
            NSRequests = 0x02,
        };

    public:
        explicit Variables(State &state)
            : state_{state}
        {
        }

        StorageVariable<bool> paused{state_, WITHDRAW_QUEUE_CA, AddressPaused};

        ReentrancyGuard guard{state_, WITHDRAW_QUEUE_CA, AddressLock};

        // Local claim cooldown in seconds
        StorageVariable<u64_be> cooldown_period{
            state_, WITHDRAW_QUEUE_CA, AddressCooldownPeriod};

        // Request ids are a global nonce, first id is 1
        StorageVariable<u64_be> last_request_id{
            state_, WITHDRAW_QUEUE_CA, AddressLastRequestId};

        // mapping (address => Buffer) buffer
        Buffer buffer(Address const &asset)
        {
            struct
            {
                uint8_t ns;
                Address address;
                uint8_t slots[11];
            } key{.ns = NSBuffer, .address = asset, .slots = {}};

            return {state_, WITHDRAW_QUEUE_CA, std::bit_cast<bytes32_t>(key)};
        }

        // mapping (address => WithdrawRequest[]) requests
        StorageArray<WithdrawRequest> requests(Address const &user)
        {
            struct
            {
                uint8_t ns;
                Address address;
                uint8_t slots[11];
            } key{.ns = NSRequests, .address = user, .slots = {}};

            return {state_, WITHDRAW_QUEUE_CA, std::bit_cast<bytes32_t>(key)};
        }
    } vars;

    ///////////
    // Views //
    ///////////

    bool is_paused(PauseFlag) const;

    // Queue's ledger balance of `asset`
    uint256_t held(Address const &asset) const;

    uint256_t available_to_withdraw(Address const &asset);

    uint256_t withdraw_deficit(Address const &asset);

    // What a refill of `asset` can absorb: the queue deficit plus the gap
    // between the available balance and the target
    uint256_t buffer_deficit(Address const &asset);

    // Amount of `asset` that burning `shares` is worth right now
    Result<uint256_t> quote_redeem(uint256_t const &shares, Address const &asset);

    Result<WithdrawRequest>
    withdraw_request(Address const &user, uint64_t index);

    uint64_t withdraw_request_count(Address const &user);

    // max(local cooldown, risk feed override)
    uint64_t effective_cooldown();

    //////////////////
    // Entry points //
    //////////////////

    // Returns the index of the new request in `caller`'s list
    Result<uint64_t> withdraw(
        Address const &caller, uint256_t const &shares, Address const &asset);

    // Returns the amount paid to `user`
    Result<uint256_t>
    claim(Address const &caller, uint64_t request_index, Address const &user);

    // Returns the part applied to the queue deficit
    Result<uint256_t> fill_buffer(
        Address const &caller, Address const &asset, uint256_t const &amount);

    // Refill path of the accounting core, which is trusted and needs no role
    Result<uint256_t> receive_fill(
        Address const &from, Address const &asset, uint256_t const &amount);

    ///////////
    // Admin //
    ///////////

    Result<void> set_buffer_target(
        Address const &caller, Address const &asset, uint256_t const &target);
    Result<void> set_cooldown_period(Address const &caller, uint64_t seconds);
    Result<void> pause(Address const &caller);
    Result<void> unpause(Address const &caller);

private:
    Result<uint256_t> absorb_fill(
        Address const &from, Address const &asset, uint256_t const &amount);

    Result<void> execute(PendingPayout const &);

    /////////////
    // Events //
    /////////////

    // event WithdrawRequested(
    //     address indexed user,
    //     address indexed asset,
    //     uint64          id,
    //     uint256         shares,
    //     uint256         amount,
    //     bool            queued);
    void emit_withdraw_requested_event(
        Address const &user, WithdrawRequest const &);

    // event Claimed(
    //     address indexed user,
    //     address indexed asset,
    //     uint64          id,
    //     uint256         amount);
    void emit_claimed_event(
        Address const &user, Address const &asset, u64_be id,
        uint256_t const &amount);

    // event BufferFilled(
    //     address indexed asset,
    //     uint256         amount,
    //     uint256         applied);
    void emit_buffer_filled_event(
        Address const &asset, uint256_t const &amount,
        uint256_t const &applied);
};

RESTAKE_VAULT_NAMESPACE_END
