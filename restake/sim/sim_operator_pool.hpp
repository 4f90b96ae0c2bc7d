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
#include <restake/vault/util/collaborators.hpp>

#include <cstdint>

RESTAKE_NAMESPACE_BEGIN

class State;

namespace sim
{
    /// Operator pool kept in the host ledger under its own address. Token
    /// balances are the pool's ledger balances; native stake is a counter
    /// backed by the pool's native balance. Withdrawals complete on demand
    /// and pay the accounting core.
    class SimOperatorPool final : public vault::OperatorPool
    {
        State &state_;
        Address address_;

        static constexpr auto AddressNativeStaked{
            0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};
        static constexpr auto AddressLastRequestId{
            0x0000000000000000000000000000000000000000000000000000000000000002_bytes32};

        enum Namespace : uint8_t
        {
            NSRequest = 0x01,
        };

        struct PendingRequest
        {
            Address asset;
            u256_be amount;
        };

        StorageVariable<u256_be> native_staked() const;
        StorageVariable<u64_be> last_request_id() const;
        StorageVariable<PendingRequest> request(uint64_t id) const;

    public:
        SimOperatorPool(State &, Address const &);

        Address const &address() const override
        {
            return address_;
        }

        uint256_t balance_of(Address const &asset) const override;

        uint256_t native_staked_balance() const override;

        Result<uint256_t>
        deposit(Address const &asset, uint256_t const &amount) override;

        Result<uint64_t> initiate_withdraw(
            Address const &asset, uint256_t const &amount) override;

        Result<uint256_t> complete_withdraw(uint64_t request_id) override;

        // Validator rewards: mints tokens or credits native stake
        void reward(Address const &asset, uint256_t const &amount);

        // Removes up to `amount` of the pool's holding of `asset`
        void slash(Address const &asset, uint256_t const &amount);
    };
}

RESTAKE_NAMESPACE_END
