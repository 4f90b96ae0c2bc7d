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
#include <restake/ledger/big_endian.hpp>
#include <restake/ledger/storage_variable.hpp>
#include <restake/vault/config.hpp>

#include <intx/intx.hpp>

#include <cstddef>

RESTAKE_NAMESPACE_BEGIN

class State;

RESTAKE_NAMESPACE_END

RESTAKE_VAULT_NAMESPACE_BEGIN

/// Per-asset withdrawal buffer. The held balance is not stored: it is the
/// withdrawal queue's ledger balance of the asset.
class Buffer
{
    State &state_;
    Address address_;
    uint256_t const key_;

public:
    ////////////
    // Layout //
    ////////////
    using Target_t = u256_be;
    using ClaimReserve_t = u256_be;
    using QueueToFill_t = u256_be;
    using QueueFilled_t = u256_be;

    // v2 fields are appended after the v1 fields, so a v1 buffer reads as a
    // v2 buffer with empty queue counters.
    struct Offsets
    {
        // v1
        static constexpr size_t target = 0;
        static constexpr size_t claim_reserve =
            target + StorageVariable<Target_t>::N;
        // v2
        static constexpr size_t queue_to_fill =
            claim_reserve + StorageVariable<ClaimReserve_t>::N;
        static constexpr size_t queue_filled =
            queue_to_fill + StorageVariable<QueueToFill_t>::N;
        static constexpr size_t end =
            queue_filled + StorageVariable<QueueFilled_t>::N;
    };

    Buffer(State &state, Address const &address, bytes32_t const &key)
        : state_{state}
        , address_{address}
        , key_{intx::be::load<uint256_t>(key)}
    {
    }

    /////////////
    // Getters //
    /////////////

    // liquidity the buffer aims to hold for immediate withdrawals; zero
    // means the asset cannot be withdrawn
    StorageVariable<Target_t> target() const
    {
        return {state_, address_, key_ + Offsets::target};
    }

    // part of the held balance promised to open requests
    StorageVariable<ClaimReserve_t> claim_reserve() const
    {
        return {state_, address_, key_ + Offsets::claim_reserve};
    }

    // running total of queued shortfalls
    StorageVariable<QueueToFill_t> queue_to_fill() const
    {
        return {state_, address_, key_ + Offsets::queue_to_fill};
    }

    // running total of refills applied to queued shortfalls
    StorageVariable<QueueFilled_t> queue_filled() const
    {
        return {state_, address_, key_ + Offsets::queue_filled};
    }

    // outstanding unfunded liability
    uint256_t queue_deficit() const
    {
        return queue_to_fill().load().native() -
               queue_filled().load().native();
    }
};

RESTAKE_VAULT_NAMESPACE_END
