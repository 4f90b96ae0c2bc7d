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
#include <restake/core/config.hpp>
#include <restake/core/int.hpp>
#include <restake/core/result.hpp>
#include <restake/ledger/big_endian.hpp>
#include <restake/ledger/ledger_error.hpp>
#include <restake/ledger/storage_variable.hpp>

#include <cstdint>

RESTAKE_NAMESPACE_BEGIN

class State;

/// Fungible token whose balances and supply live in the storage of the
/// token's own address, so they roll back together with everything else
/// written inside a checkpoint.
class TokenLedger
{
    State &state_;
    Address token_;

    static constexpr auto AddressTotalSupply{
        0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};

    enum Namespace : uint8_t
    {
        NSBalance = 0x01,
    };

    StorageVariable<u256_be> total_supply_var() const;

    // mapping (address => uint256) balance
    StorageVariable<u256_be> balance_var(Address const &) const;

    void emit_transfer_event(
        Address const &from, Address const &to, uint256_t const &amount);

public:
    TokenLedger(State &, Address const &token);

    Address const &token() const
    {
        return token_;
    }

    uint256_t total_supply() const;

    uint256_t balance_of(Address const &) const;

    Result<void> mint(Address const &to, uint256_t const &amount);

    Result<void> burn(Address const &from, uint256_t const &amount);

    Result<void> transfer(
        Address const &from, Address const &to, uint256_t const &amount);
};

RESTAKE_NAMESPACE_END
